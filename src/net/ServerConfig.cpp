//
// ServerConfig.cpp
//

#include "net/ServerConfig.hpp"

#include <charconv>
#include <cstdio>
#include <cstring>
#include <limits>
#include <print>
#include <string>

namespace bingo::net
{
    auto ParseArgs(int argc, char const* const* argv) -> ServerConfig
    {
        ServerConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{} && res.ptr == s + std::strlen(s);
            };
            auto next_int = [&](std::int64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{} && res.ptr == s + std::strlen(s);
            };

            if (arg == "--port")
            {
                std::uint64_t v{};
                if (next_uint(v) && v > 0 && v <= std::numeric_limits<std::uint16_t>::max())
                {
                    cfg.port = static_cast<std::uint16_t>(v);
                }
                else { std::print(stderr, "[bingod] ignoring out of range --port value, using {}\n", cfg.port); }
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.game.seed = v; }
                else { std::print(stderr, "[bingod] ignoring malformed --seed value\n"); }
            }
            else if (arg == "--admin")
            {
                std::int64_t v{};
                if (next_int(v)) { cfg.game.admins.push_back(core::UserId{v}); }
                else { std::print(stderr, "[bingod] ignoring malformed --admin value\n"); }
            }
            else if (arg == "--state")
            {
                if (i + 1 < argc) { cfg.state_path = argv[++i]; }
            }
            else
            {
                std::print(stderr, "[bingod] unknown option {}\n", arg);
            }
        }
        return cfg;
    }
}
