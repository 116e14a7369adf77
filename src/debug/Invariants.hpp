//
// Invariants.hpp
//

#ifndef BINGO_INVARIANTS_HPP
#define BINGO_INVARIANTS_HPP

#include <string>
#include <vector>
#include "../core/CardGenerator.hpp"
#include "../core/State.hpp"
#include "../core/Util.hpp"

namespace bingo::core::debug
{
    // A second layer of checks over a whole GameState. Returns one line per
    // broken invariant; empty when the state is sound.
    inline auto CheckInvariants(GameState const& s) -> std::vector<std::string>
    {
        std::vector<std::string> broken;
#if BINGO_ENABLE_TEST_HOOKS == false
        (void)s;
#else
        // 1) Call history: in range, no duplicates, last call is the tail
        util::NumberSet calls{s.called};
        if (calls.ContainsDup()) broken.emplace_back("duplicate call in history");
        for (Number const n : s.called)
        {
            if (!util::InRange(n)) broken.emplace_back("call out of range");
        }
        if (s.called.empty() != !s.last_called.has_value())
            broken.emplace_back("last call and history disagree");
        if (!s.called.empty() && s.last_called && s.called.back() != *s.last_called)
            broken.emplace_back("last call is not the newest call");

        for (auto const& [id, p] : s.players)
        {
            // 2) Map key and record agree
            if (id != p.id) broken.emplace_back("player keyed under another id");

            // 3) Card shape: bands, distinct columns, covered centre
            if (!IsWellFormed(p.card)) broken.emplace_back("malformed card");

            // 4) Every marked number was called
            for (Row const& row : p.card)
            {
                for (Cell const& c : row)
                {
                    if (c.kind == CellKind::Marked && c.number != 0 && !calls.Contains(c.number))
                        broken.emplace_back("marked cell holds an uncalled number");
                }
            }
        }
#endif // BINGO_ENABLE_TEST_HOOKS == true
        return broken;
    }
}
#endif //BINGO_INVARIANTS_HPP
