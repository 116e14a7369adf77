//
// CardGenerator.cpp
//
#include "CardGenerator.hpp"

#include <algorithm>
#include <numeric>
#include <vector>

#include "Util.hpp"

namespace bingo::core
{
    auto GenerateCard(std::mt19937_64& rng) -> Card
    {
        Columns columns{};
        std::vector<Number> band(constants::BandWidth);
        for (size_t col{}; col < constants::GridSize; ++col)
        {
            std::iota(band.begin(), band.end(), util::BandLow(col));
            std::ranges::shuffle(band, rng);
            std::copy_n(band.begin(), constants::GridSize, columns[col].begin());
        }
        return CardFromColumns(columns);
    }

    auto CardFromColumns(Columns const& columns) -> Card
    {
        Card card{};
        for (size_t col{}; col < constants::GridSize; ++col)
        {
            for (size_t row{}; row < constants::GridSize; ++row)
            {
                card[row][col] = Cell{CellKind::Number, columns[col][row]};
            }
        }
        card[constants::Center][constants::Center] = Cell{CellKind::Free, 0};
        return card;
    }

    auto IsWellFormed(Card const& card) -> bool
    {
        if (card[constants::Center][constants::Center].kind == CellKind::Number) return false;

        for (size_t col{}; col < constants::GridSize; ++col)
        {
            util::NumberSet seen;
            for (size_t row{}; row < constants::GridSize; ++row)
            {
                Cell const& cell = card[row][col];
                if (row == constants::Center && col == constants::Center) continue;
                if (cell.kind == CellKind::Free) return false;
                if (!util::InRange(cell.number) || util::BandOf(cell.number) != col) return false;
                seen.Add(cell.number);
            }
            if (seen.ContainsDup()) return false;
        }
        return true;
    }
}
