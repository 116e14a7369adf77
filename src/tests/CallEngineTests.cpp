#include <gtest/gtest.h>
#include <algorithm>
#include <initializer_list>
#include <set>

#include "../core/CallEngine.hpp"
#include "../core/WinDetector.hpp"
#include "../debug/Invariants.hpp"
#include "TestHelpers.hpp"

using namespace bingo::core;
using namespace bingo::test;

namespace
{
    UserId const Admin{1};
    UserId const Stranger{2};

    // Every number except the ones listed, in ascending order.
    auto AllBut(std::initializer_list<Number> keep) -> std::vector<Number>
    {
        std::vector<Number> out;
        for (Number n{1}; n <= constants::MaxNumber; ++n)
        {
            if (std::ranges::find(keep, n) == keep.end()) out.push_back(n);
        }
        return out;
    }
}

TEST(CallEngine, SeventyFiveCallsNeverRepeat)
{
    CallEngine engine({Admin}, 1234);
    GameState s{};
    s.active = true;

    std::set<Number> seen;
    for (int i = 0; i < constants::MaxNumber; ++i)
    {
        auto r = engine.CallNext(s, Admin);
        ASSERT_TRUE(r.has_value()) << "call " << i;
        ASSERT_TRUE(seen.insert(r->number).second) << "repeat of " << int(r->number);
        ASSERT_EQ(s.last_called, r->number);
        ASSERT_TRUE(debug::CheckInvariants(s).empty());
    }
    EXPECT_EQ(seen.size(), 75u);
    EXPECT_EQ(*seen.begin(), 1);
    EXPECT_EQ(*seen.rbegin(), 75);

    GameState const before = s;
    auto r = engine.CallNext(s, Admin);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error::RejectionCode::Call_NoNumbersRemain);
    EXPECT_EQ(s, before);
}

TEST(CallEngine, NonAdminRejectedWithoutMutation)
{
    CallEngine engine({Admin}, 1);
    GameState s{};
    s.active = true;
    AddPlayer(s, 10, OrderedCard());
    GameState const before = s;

    auto r = engine.CallNext(s, Stranger);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error::RejectionCode::NotAdmin);
    EXPECT_EQ(r.error().user, Stranger);
    EXPECT_EQ(s, before);
}

TEST(CallEngine, InactiveGameRejected)
{
    CallEngine engine({Admin}, 1);
    GameState s{};
    GameState const before = s;

    auto r = engine.CallNext(s, Admin);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error::RejectionCode::GameInactive);
    EXPECT_EQ(s, before);
}

TEST(CallEngine, AutoMarksMatchingCells)
{
    CallEngine engine({Admin}, 99);
    GameState s{};
    s.active = true;
    // only 16 is left to draw; it sits at (0,1) on the ordered card
    s.called = AllBut({16});
    s.last_called = s.called.back();
    AddPlayer(s, 10, OrderedCard());
    AddPlayer(s, 11, ShiftedCard(5));

    auto r = engine.CallNext(s, Admin);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->number, 16);
    EXPECT_EQ(s.called.back(), 16);
    EXPECT_EQ(s.last_called, Number{16});

    Cell const& hit = s.players.at(PlayerId{10}).card[0][1];
    EXPECT_EQ(hit.kind, CellKind::Marked);
    EXPECT_EQ(hit.number, 16);

    ASSERT_EQ(r->auto_marked.size(), 1u);
    EXPECT_EQ(r->auto_marked.front(), PlayerId{10});
    EXPECT_EQ(s.players.at(PlayerId{11}).card, ShiftedCard(5));
    EXPECT_FALSE(r->RoundEnded());
    EXPECT_TRUE(s.active);
}

TEST(CallEngine, OneLineIsNotAWin)
{
    CallEngine engine({Admin}, 5);
    GameState s{};
    s.active = true;
    s.called = AllBut({1});
    s.last_called = s.called.back();

    Card card = OrderedCard();
    MarkRow(card, 0);
    card[0][0].kind = CellKind::Number;
    AddPlayer(s, 10, card);

    auto r = engine.CallNext(s, Admin);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(CountCompleteLines(s.players.at(PlayerId{10}).card), 1u);
    EXPECT_FALSE(r->RoundEnded());
    EXPECT_TRUE(s.active);
}

TEST(CallEngine, SimultaneousWinnersAllReportedAndRoundEnds)
{
    CallEngine engine({Admin}, 5);
    GameState s{};
    s.active = true;
    s.called = AllBut({1});
    s.last_called = s.called.back();

    // rows 0 and 1 covered except (0,0) = 1
    Card near = OrderedCard();
    MarkRow(near, 0);
    MarkRow(near, 1);
    near[0][0].kind = CellKind::Number;

    AddPlayer(s, 20, near, "Bea");
    AddPlayer(s, 10, near, "Al");
    AddPlayer(s, 30, ShiftedCard(3), "Cy");

    auto r = engine.CallNext(s, Admin);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->number, 1);
    ASSERT_TRUE(r->RoundEnded());
    ASSERT_EQ(r->winners.size(), 2u);
    EXPECT_EQ(r->winners[0].name, "Al");
    EXPECT_EQ(r->winners[1].name, "Bea");
    EXPECT_FALSE(s.active);

    auto again = engine.CallNext(s, Admin);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error::RejectionCode::GameInactive);
}

TEST(CallEngine, SameSeedSameSequence)
{
    CallEngine a({Admin}, 777);
    CallEngine b({Admin}, 777);
    GameState sa{};
    GameState sb{};
    sa.active = sb.active = true;
    for (int i = 0; i < 20; ++i)
    {
        ASSERT_EQ(a.CallNext(sa, Admin)->number, b.CallNext(sb, Admin)->number);
    }
}
