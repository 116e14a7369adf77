//
// MarkHandler.hpp
//

#ifndef BINGO_MARKHANDLER_HPP
#define BINGO_MARKHANDLER_HPP

#include <optional>
#include <vector>
#include "Exception.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace bingo::core
{
    struct MarkResult
    {
        PlayerId player{};
        bool won{false};
        // complete lines on the marking player's card
        size_t lines{};
        // filled only when won: every current winner
        std::vector<Winner> winners;
        // the call the announcement is tagged to
        std::optional<Number> tag;
    };

    // Marks one cell for a joined player. Only FREE or already-called cells are
    // eligible. A winning mark ends the round. Caller holds the store lock.
    auto ApplyMark(GameState& state, PlayerId player, size_t row, size_t col) -> error::Outcome<MarkResult>;
}

#endif //BINGO_MARKHANDLER_HPP
