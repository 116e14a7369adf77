//
// WinDetector.hpp
//

#ifndef BINGO_WINDETECTOR_HPP
#define BINGO_WINDETECTOR_HPP

#include <vector>
#include "Types.hpp"
#include "State.hpp"

namespace bingo::core
{
    // Complete lines among the 5 rows, 5 columns and 2 diagonals.
    auto CountCompleteLines(Card const& card) -> size_t;

    // Double-line rule: at least constants::WinLineThreshold complete lines.
    auto HasBingo(Card const& card) -> bool;

    // Every player currently satisfying HasBingo, ordered by id.
    auto CollectWinners(GameState const& state) -> std::vector<Winner>;
}

#endif //BINGO_WINDETECTOR_HPP
