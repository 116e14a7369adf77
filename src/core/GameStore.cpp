//
// GameStore.cpp
//
#include "GameStore.hpp"

#include <charconv>
#include <cstdio>
#include <format>
#include <optional>
#include <print>
#include <string>
#include <utility>

#include "CardGenerator.hpp"
#include "Exception.hpp"
#include "Util.hpp"

namespace bingo::core
{
    namespace
    {
        auto ParsePlayerId(std::string const& text) -> PlayerId
        {
            int64_t v{};
            auto const* first = text.data();
            auto const* last = text.data() + text.size();
            auto const res = std::from_chars(first, last, v);
            if (text.empty() || res.ec != std::errc{} || res.ptr != last)
            {
                BINGO_THROW(error::Code::Serialization, std::format("Bad player id '{}' in snapshot", text));
            }
            return PlayerId{v};
        }

        // the centre keeps number 0 whether FREE or marked
        auto MarksWereCalled(Card const& card, util::NumberSet const& calls) -> bool
        {
            for (size_t r{}; r < constants::GridSize; ++r)
            {
                for (size_t c{}; c < constants::GridSize; ++c)
                {
                    if (r == constants::Center && c == constants::Center) continue;
                    Cell const& cell = card[r][c];
                    if (cell.kind == CellKind::Marked && !calls.Contains(cell.number)) return false;
                }
            }
            return true;
        }
    }

    GameStore::GameStore(std::shared_ptr<Storage> storage) :
        storage_(std::move(storage))
    {
    }

    auto GameStore::Lock() -> std::unique_lock<std::mutex>
    {
        return std::unique_lock<std::mutex>(mtx_);
    }

    auto GameStore::Snapshot() const -> StateRecord
    {
        StateRecord rec{};
        rec.players.reserve(state_.players.size());
        for (auto const& [id, p] : state_.players)
        {
            rec.players.push_back(PlayerRecord{
                .id = std::to_string(id.value),
                .card = p.card,
                .chat = p.dest.chat,
                .message = p.dest.message,
                .name = p.name
            });
        }
        rec.called = state_.called;
        rec.active = state_.active;
        rec.last_called = state_.last_called;
        return rec;
    }

    auto GameStore::Restore(StateRecord const& record) -> void
    {
        // build aside, swap in only when the whole record is valid
        GameState next{};

        for (Number const n : record.called)
        {
            if (!util::InRange(n))
                BINGO_THROW(error::Code::Serialization, std::format("Called number {} out of range", n));
        }
        util::NumberSet const calls{record.called};
        if (calls.ContainsDup())
        {
            BINGO_THROW(error::Code::Serialization, "Duplicate call in snapshot");
        }
        std::optional<Number> const newest =
            record.called.empty() ? std::nullopt : std::optional<Number>{record.called.back()};
        if (record.last_called != newest)
        {
            BINGO_THROW(error::Code::Serialization, "Last called number is not the newest call");
        }

        for (PlayerRecord const& pr : record.players)
        {
            PlayerId const id = ParsePlayerId(pr.id);
            if (!IsWellFormed(pr.card))
            {
                BINGO_THROW(error::Code::Serialization, std::format("Malformed card for player {}", pr.id));
            }
            if (!MarksWereCalled(pr.card, calls))
            {
                BINGO_THROW(error::Code::Serialization, std::format("Player {} has an uncalled number marked", pr.id));
            }
            auto const [it, inserted] = next.players.emplace(
                id, Player{id, pr.card, Destination{pr.chat, pr.message}, pr.name});
            if (!inserted)
            {
                BINGO_THROW(error::Code::Serialization, std::format("Duplicate player {} in snapshot", pr.id));
            }
        }

        next.called = record.called;
        next.active = record.active;
        next.last_called = record.last_called;
        state_ = std::move(next);
    }

    auto GameStore::Load() -> bool
    {
        if (!storage_) return false;
        try
        {
            std::optional<StateRecord> rec = storage_->Load();
            if (!rec)
            {
                std::print("[Store] No saved state, starting fresh.\n");
                return false;
            }
            Restore(*rec);
            std::print("[Store] Loaded state: {} player(s), {} call(s), active={}\n",
                       state_.players.size(), state_.called.size(), state_.active);
            return true;
        }
        catch (std::exception const& e)
        {
            std::print(stderr, "[Store] Failed to load state, starting fresh: {}\n", e.what());
        }
        state_.Clear();
        return false;
    }

    auto GameStore::Persist() -> bool
    {
        if (!storage_) return true;
        try
        {
            storage_->Save(Snapshot());
            ++writes_;
            return true;
        }
        catch (std::exception const& e)
        {
            std::print(stderr, "[Store] Failed to save state: {}\n", e.what());
        }
        return false;
    }
}
