//
// MarkHandler.cpp
//
#include "MarkHandler.hpp"

#include <algorithm>

#include "WinDetector.hpp"

namespace bingo::core
{
    auto ApplyMark(GameState& state, PlayerId const player, size_t const row, size_t const col)
        -> error::Outcome<MarkResult>
    {
        using error::Rejection;
        using error::RejectionCode;

        Player* p = state.Find(player);
        if (!p)
            return error::reject(Rejection{.code = RejectionCode::NotJoined}.with_user(player));
        if (row >= constants::GridSize || col >= constants::GridSize)
            return error::reject(Rejection{.code = RejectionCode::Mark_InvalidPosition}.with_user(player));
        // the round is over once someone has won; late marks must not announce again
        if (!state.active)
            return error::reject(Rejection{.code = RejectionCode::GameInactive}.with_user(player));

        auto const r = static_cast<uint8_t>(row);
        auto const c = static_cast<uint8_t>(col);
        Cell& cell = p->card[row][col];

        switch (cell.kind)
        {
        case CellKind::Marked:
            return error::reject(Rejection{.code = RejectionCode::Mark_AlreadyMarked}.with_user(player).with_cell(r, c));
        case CellKind::Number:
            if (std::ranges::find(state.called, cell.number) == state.called.end())
            {
                return error::reject(Rejection{.code = RejectionCode::Mark_NotCalled}
                    .with_user(player).with_cell(r, c).with_number(cell.number));
            }
            break;
        case CellKind::Free:
            break;
        }

        cell.kind = CellKind::Marked;

        MarkResult result{};
        result.player = player;
        result.lines = CountCompleteLines(p->card);
        result.won = result.lines >= constants::WinLineThreshold;
        if (!result.won) return result;

        result.winners = CollectWinners(state);
        result.tag = state.last_called;
        state.active = false;
        return result;
    }
}
