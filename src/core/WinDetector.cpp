//
// WinDetector.cpp
//
#include "WinDetector.hpp"

#include <algorithm>

namespace bingo::core
{
    auto CountCompleteLines(Card const& card) -> size_t
    {
        constexpr size_t N = constants::GridSize;
        size_t lines{};

        for (size_t i{}; i < N; ++i)
        {
            lines += std::ranges::all_of(card[i], [](Cell const& c) { return c.Covered(); });

            bool col_done = true;
            for (size_t r{}; r < N; ++r) col_done &= card[r][i].Covered();
            lines += col_done;
        }

        bool diag = true;
        bool anti = true;
        for (size_t i{}; i < N; ++i)
        {
            diag &= card[i][i].Covered();
            anti &= card[i][N - 1 - i].Covered();
        }
        lines += diag;
        lines += anti;
        return lines;
    }

    auto HasBingo(Card const& card) -> bool
    {
        return CountCompleteLines(card) >= constants::WinLineThreshold;
    }

    auto CollectWinners(GameState const& state) -> std::vector<Winner>
    {
        std::vector<Winner> winners;
        for (auto const& [id, player] : state.players)
        {
            if (HasBingo(player.card))
            {
                winners.push_back(Winner{id, player.name});
            }
        }
        return winners;
    }
}
