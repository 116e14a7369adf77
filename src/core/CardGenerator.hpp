//
// CardGenerator.hpp
//

#ifndef BINGO_CARDGENERATOR_HPP
#define BINGO_CARDGENERATOR_HPP

#include <array>
#include <random>
#include "Types.hpp"

namespace bingo::core
{
    // One band's five draws, top to bottom.
    using Column = std::array<Number, constants::GridSize>;
    using Columns = std::array<Column, constants::GridSize>;

    // Draws 5 distinct values per band, forces the centre FREE, returns rows.
    auto GenerateCard(std::mt19937_64& rng) -> Card;

    // Assembles already-drawn columns: centre forced FREE, transposed to row-major.
    auto CardFromColumns(Columns const& columns) -> Card;

    // true when every column holds 5 distinct numbers of its band and the centre is FREE
    auto IsWellFormed(Card const& card) -> bool;
}

#endif //BINGO_CARDGENERATOR_HPP
