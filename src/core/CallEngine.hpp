//
// CallEngine.hpp
//

#ifndef BINGO_CALLENGINE_HPP
#define BINGO_CALLENGINE_HPP

#include <random>
#include <vector>
#include "Exception.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace bingo::core
{
    struct CallResult
    {
        Number number{};
        // players that had a cell auto-marked by this call
        std::vector<PlayerId> auto_marked;
        // every player winning after the call, not only the new ones
        std::vector<Winner> winners;

        [[nodiscard]]
        auto RoundEnded() const noexcept -> bool { return !winners.empty(); }
    };

    class CallEngine
    {
    public:
        CallEngine(std::vector<UserId> admins, uint64_t seed);

        // Draws one uncalled number, auto-marks it on every card and ends the
        // round when anyone wins. Rejections leave the state untouched.
        // Caller holds the store lock.
        auto CallNext(GameState& state, UserId caller) -> error::Outcome<CallResult>;

        auto IsAdmin(UserId user) const -> bool { return core::IsAdmin(admins_, user); }

    private:
        std::vector<UserId> admins_;
        std::mt19937_64 rng_;
    };
}

#endif //BINGO_CALLENGINE_HPP
