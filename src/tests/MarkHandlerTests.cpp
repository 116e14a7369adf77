#include <gtest/gtest.h>
#include <utility>
#include <vector>

#include "../core/MarkHandler.hpp"
#include "../core/WinDetector.hpp"
#include "../debug/Invariants.hpp"
#include "TestHelpers.hpp"

using namespace bingo::core;
using namespace bingo::test;

namespace
{
    auto ActiveWith(std::vector<Number> calls) -> GameState
    {
        GameState s{};
        s.active = true;
        s.called = std::move(calls);
        if (!s.called.empty()) s.last_called = s.called.back();
        return s;
    }
}

TEST(MarkHandler, CalledNumberGetsMarked)
{
    GameState s = ActiveWith({16});
    AddPlayer(s, 10, OrderedCard());

    auto r = ApplyMark(s, PlayerId{10}, 0, 1);
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(r->won);
    EXPECT_EQ(r->lines, 0u);
    EXPECT_TRUE(r->winners.empty());
    EXPECT_EQ(s.players.at(PlayerId{10}).card[0][1].kind, CellKind::Marked);
    EXPECT_TRUE(s.active);
    EXPECT_TRUE(debug::CheckInvariants(s).empty());
}

TEST(MarkHandler, UncalledNumberRejectedAndCellUnchanged)
{
    GameState s = ActiveWith({2, 3});
    AddPlayer(s, 10, OrderedCard());
    GameState const before = s;

    auto r = ApplyMark(s, PlayerId{10}, 0, 0);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error::RejectionCode::Mark_NotCalled);
    EXPECT_EQ(r.error().number, Number{1});
    EXPECT_EQ(r.error().row, std::uint8_t{0});
    EXPECT_EQ(s, before);
}

TEST(MarkHandler, FreeCentreMarksWithoutCall)
{
    GameState s = ActiveWith({});
    AddPlayer(s, 10, OrderedCard());

    auto r = ApplyMark(s, PlayerId{10}, 2, 2);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(s.players.at(PlayerId{10}).card[2][2].kind, CellKind::Marked);

    auto again = ApplyMark(s, PlayerId{10}, 2, 2);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error::RejectionCode::Mark_AlreadyMarked);
}

TEST(MarkHandler, AlreadyMarkedRejected)
{
    GameState s = ActiveWith({1});
    AddPlayer(s, 10, OrderedCard());
    ASSERT_TRUE(ApplyMark(s, PlayerId{10}, 0, 0).has_value());
    GameState const before = s;

    auto r = ApplyMark(s, PlayerId{10}, 0, 0);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error::RejectionCode::Mark_AlreadyMarked);
    EXPECT_EQ(s, before);
}

TEST(MarkHandler, UnknownPlayerRejected)
{
    GameState s = ActiveWith({1});
    auto r = ApplyMark(s, PlayerId{42}, 0, 0);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error::RejectionCode::NotJoined);
    EXPECT_EQ(r.error().user, PlayerId{42});
}

TEST(MarkHandler, PositionOutsideCardRejected)
{
    GameState s = ActiveWith({1});
    AddPlayer(s, 10, OrderedCard());
    GameState const before = s;

    std::vector<std::pair<size_t, size_t>> const outside{{5, 0}, {0, 5}, {99, 99}};
    for (auto const& [row, col] : outside)
    {
        auto r = ApplyMark(s, PlayerId{10}, row, col);
        ASSERT_FALSE(r.has_value());
        EXPECT_EQ(r.error().code, error::RejectionCode::Mark_InvalidPosition);
    }
    EXPECT_EQ(s, before);
}

TEST(MarkHandler, InactiveGameRejected)
{
    GameState s = ActiveWith({1});
    s.active = false;
    AddPlayer(s, 10, OrderedCard());

    auto r = ApplyMark(s, PlayerId{10}, 0, 0);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error::RejectionCode::GameInactive);
}

TEST(MarkHandler, SecondLineWinsAndCollectsEveryWinner)
{
    // column 0 numbers 1..5, row 0 numbers 1,16,31,46,61
    GameState s = ActiveWith({2, 3, 4, 5, 16, 31, 46, 61, 1});

    Card mine = OrderedCard();
    MarkCol(mine, 0);
    mine[0][0].kind = CellKind::Number;
    for (size_t c = 1; c < constants::GridSize; ++c) mine[0][c].kind = CellKind::Marked;
    AddPlayer(s, 10, mine, "Me");

    // someone else already sitting on two lines
    Card theirs = OrderedCard();
    MarkCol(theirs, 0);
    MarkRow(theirs, 0);
    AddPlayer(s, 5, theirs, "Early");

    auto r = ApplyMark(s, PlayerId{10}, 0, 0);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->won);
    EXPECT_EQ(r->lines, 2u);
    ASSERT_EQ(r->winners.size(), 2u);
    EXPECT_EQ(r->winners[0].name, "Early");
    EXPECT_EQ(r->winners[1].name, "Me");
    EXPECT_EQ(r->tag, Number{1});
    EXPECT_FALSE(s.active);
    EXPECT_TRUE(debug::CheckInvariants(s).empty());
}

TEST(MarkHandler, WinWithNothingCalledHasNoTag)
{
    // only the FREE cell can be marked, so build the win out of pre-covered cells
    GameState s = ActiveWith({});
    Card card = OrderedCard();
    for (size_t c{}; c < constants::GridSize; ++c)
    {
        if (c != constants::Center) card[2][c].kind = CellKind::Marked;
        card[c][c].kind = card[c][c].kind == CellKind::Free ? CellKind::Free : CellKind::Marked;
    }
    AddPlayer(s, 10, card);

    auto r = ApplyMark(s, PlayerId{10}, 2, 2);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->won);
    EXPECT_FALSE(r->tag.has_value());
}
