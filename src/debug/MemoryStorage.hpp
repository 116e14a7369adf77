//
// MemoryStorage.hpp
//

#ifndef BINGO_MEMORYSTORAGE_HPP
#define BINGO_MEMORYSTORAGE_HPP

#include <cstddef>
#include <optional>

#include "../core/Exception.hpp"
#include "../core/Storage.hpp"

namespace bingo::core::debug
{
    // Storage kept in memory; counts writes and can be told to fail either way.
    class MemoryStorage final : public Storage
    {
    public:
        auto Save(StateRecord const& record) -> void override
        {
            ++save_calls_;
            if (fail_saves_) BINGO_THROW(error::Code::Persistence, "disk full");
            record_ = record;
        }

        auto Load() -> std::optional<StateRecord> override
        {
            if (corrupt_) BINGO_THROW(error::Code::Serialization, "snapshot failed verification");
            return record_;
        }

        auto SaveCalls() const noexcept -> size_t { return save_calls_; }
        auto Stored() const -> std::optional<StateRecord> const& { return record_; }

        auto Put(StateRecord record) -> void { record_ = std::move(record); }
        auto FailSaves(bool v) noexcept -> void { fail_saves_ = v; }
        auto Corrupt(bool v) noexcept -> void { corrupt_ = v; }

    private:
        std::optional<StateRecord> record_;
        size_t save_calls_{0};
        bool fail_saves_{false};
        bool corrupt_{false};
    };
}

#endif //BINGO_MEMORYSTORAGE_HPP
