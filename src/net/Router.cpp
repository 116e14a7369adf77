//
// Router.cpp
//

#include "net/Router.hpp"

#include <charconv>
#include <cstdio>
#include <exception>
#include <print>

#include "core/Exception.hpp"

namespace bingo::net
{
    namespace
    {
        auto ReadIndex(std::string_view s) -> std::optional<std::size_t>
        {
            std::size_t v{};
            auto const res = std::from_chars(s.data(), s.data() + s.size(), v);
            if (s.empty() || res.ec != std::errc{} || res.ptr != s.data() + s.size()) return std::nullopt;
            return v;
        }

        auto Unknown() -> core::Reply
        {
            return core::RejectionReply(core::error::Rejection{.code = core::error::RejectionCode::UnknownAction});
        }
    }

    auto RunGuarded(std::function<core::Reply()> const& action) -> core::Reply
    {
        try
        {
            return action();
        }
        catch (core::OmegaException<core::error::Code> const& e)
        {
            // engine misuse: log it, keep serving
            std::print(stderr, "[Router] {}", e);
        }
        catch (std::exception const& e)
        {
            std::print(stderr, "[Router] Request failed: {}\n", e.what());
        }
        return core::RejectionReply(core::error::Rejection{.code = core::error::RejectionCode::Internal_Unreachable});
    }

    auto ParseMarkData(std::string_view data) -> std::optional<std::pair<std::size_t, std::size_t>>
    {
        constexpr std::string_view prefix = "mark_";
        if (!data.starts_with(prefix)) return std::nullopt;
        data.remove_prefix(prefix.size());

        std::size_t const sep = data.find('_');
        if (sep == std::string_view::npos) return std::nullopt;

        auto const row = ReadIndex(data.substr(0, sep));
        auto const col = ReadIndex(data.substr(sep + 1));
        if (!row || !col) return std::nullopt;
        return std::pair{*row, *col};
    }

    Router::Router(core::GameHost& host) :
        host_(host)
    {
    }

    auto Router::Handle(Request const& req) -> core::Reply
    {
        return RunGuarded([&]
        {
            return req.kind == RequestKind::Command ? HandleCommand(req) : HandleCallback(req);
        });
    }

    auto Router::HandleCommand(Request const& req) -> core::Reply
    {
        std::string_view cmd = req.data;
        if (cmd.starts_with('/')) cmd.remove_prefix(1);

        if (cmd == "start") return host_.Menu(req.user);
        if (cmd == "startgame") return host_.StartNewGame(req.user);
        if (cmd == "call") return host_.CallNext(req.user);
        if (cmd == "reset") return host_.Reset(req.user);
        return Unknown();
    }

    auto Router::HandleCallback(Request const& req) -> core::Reply
    {
        std::string_view const data = req.data;

        if (data.starts_with("mark_"))
        {
            auto const cell = ParseMarkData(data);
            if (!cell)
            {
                return core::RejectionReply(
                    core::error::Rejection{.code = core::error::RejectionCode::Mark_InvalidPosition}.with_user(req.user));
            }
            return host_.Mark(req.user, cell->first, cell->second);
        }
        if (data == "join") return host_.Join(req.user, req.chat, req.display_name);
        if (data == "called_numbers") return host_.ViewCalled(req.user);
        if (data == "last_five") return host_.ViewLastCalled(req.user);
        if (data == "show_card") return host_.ShowCard(req.user, req.chat);
        if (data == "call") return host_.CallNext(req.user);
        if (data == "admin_reset") return host_.Reset(req.user);
        return Unknown();
    }
}
