//
// CallEngine.cpp
//
#include "CallEngine.hpp"

#include <utility>

#include "Util.hpp"
#include "WinDetector.hpp"

namespace bingo::core
{
    CallEngine::CallEngine(std::vector<UserId> admins, uint64_t const seed) :
        admins_(std::move(admins)),
        rng_{seed}
    {
    }

    auto CallEngine::CallNext(GameState& state, UserId const caller) -> error::Outcome<CallResult>
    {
        using error::RejectionCode;

        if (!IsAdmin(caller))
            return error::reject(error::Rejection{.code = RejectionCode::NotAdmin}.with_user(caller));
        if (!state.active)
            return error::reject(RejectionCode::GameInactive);

        std::vector<Number> const remaining = util::NumberSet{state.called}.Remaining();
        if (remaining.empty())
            return error::reject(RejectionCode::Call_NoNumbersRemain);

        std::uniform_int_distribution<size_t> pick(0, remaining.size() - 1);
        Number const number = remaining[pick(rng_)];
        state.called.push_back(number);
        state.last_called = number;

        CallResult result{};
        result.number = number;

        for (auto& [id, player] : state.players)
        {
            bool hit = false;
            for (Row& row : player.card)
            {
                for (Cell& cell : row)
                {
                    if (cell.kind == CellKind::Number && cell.number == number)
                    {
                        cell.kind = CellKind::Marked;
                        hit = true;
                    }
                }
            }
            if (hit) result.auto_marked.push_back(id);
        }

        result.winners = CollectWinners(state);
        if (result.RoundEnded())
        {
            state.active = false;
        }
        return result;
    }
}
