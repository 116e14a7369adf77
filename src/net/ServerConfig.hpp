//
// ServerConfig.hpp
//

#ifndef BINGO_SERVERCONFIG_HPP
#define BINGO_SERVERCONFIG_HPP

#include <cstdint>
#include <filesystem>

#include "core/Types.hpp"

namespace bingo::net
{
    struct ServerConfig
    {
        std::uint16_t port{9002};
        std::filesystem::path state_path{"bingo_state.bin"};
        core::Config game{};
    };

    // --port, --seed, --admin (repeatable), --state. Malformed values are
    // reported on stderr and leave the default in place.
    auto ParseArgs(int argc, char const* const* argv) -> ServerConfig;
}

#endif //BINGO_SERVERCONFIG_HPP
