//
// GameStore.hpp
//

#ifndef BINGO_GAMESTORE_HPP
#define BINGO_GAMESTORE_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include "State.hpp"
#include "Storage.hpp"

namespace bingo::core
{
    // Sole owner of the GameState. Every read-evaluate-write sequence runs
    // while holding the lock returned by Lock().
    class GameStore
    {
    public:
        // storage may be null: state is then kept in memory only
        explicit GameStore(std::shared_ptr<Storage> storage);

        GameStore(GameStore const&) = delete;
        auto operator=(GameStore const&) -> GameStore& = delete;

        [[nodiscard]]
        auto Lock() -> std::unique_lock<std::mutex>;

        auto State() noexcept -> GameState& { return state_; }
        auto State() const noexcept -> GameState const& { return state_; }

        auto Snapshot() const -> StateRecord;

        // Replaces the whole state. Throws error::SerializationError when the record
        // breaks the data model; the current state is left untouched in that case.
        auto Restore(StateRecord const& record) -> void;

        // Startup load. Missing snapshot -> empty state; unreadable one -> empty
        // state plus a warning. Returns true when a snapshot was restored.
        auto Load() -> bool;

        // Writes the snapshot at a mutation boundary. A failed write is logged and
        // in-memory state stays authoritative. Returns false on failure.
        auto Persist() -> bool;

        auto WriteCount() const noexcept -> uint64_t { return writes_; }

    private:
        std::shared_ptr<Storage> storage_;
        std::mutex mtx_;
        GameState state_;
        uint64_t writes_{0};
    };
}

#endif //BINGO_GAMESTORE_HPP
