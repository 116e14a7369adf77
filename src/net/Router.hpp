//
// Router.hpp: maps transport requests onto GameHost actions
//

#ifndef BINGO_ROUTER_HPP
#define BINGO_ROUTER_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>
#include <utility>

#include "core/GameHost.hpp"
#include "net/codec.hpp"

namespace bingo::net
{
    // Runs one routed action. Any exception it throws is logged and answered
    // with the generic failure notice, so the network loop keeps serving.
    auto RunGuarded(std::function<core::Reply()> const& action) -> core::Reply;

    // "mark_<row>_<col>" -> (row, col)
    auto ParseMarkData(std::string_view data) -> std::optional<std::pair<std::size_t, std::size_t>>;

    class Router
    {
    public:
        explicit Router(core::GameHost& host);

        auto Handle(Request const& req) -> core::Reply;

    private:
        auto HandleCommand(Request const& req) -> core::Reply;
        auto HandleCallback(Request const& req) -> core::Reply;

        core::GameHost& host_;
    };
}

#endif //BINGO_ROUTER_HPP
