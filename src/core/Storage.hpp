//
// Storage.hpp
//

#ifndef BINGO_STORAGE_HPP
#define BINGO_STORAGE_HPP

#include <optional>
#include "State.hpp"

namespace bingo::core
{
    class Storage
    {
    public:
        virtual ~Storage() = default;

        // Whole-record write. Throws error::PersistenceError when the record cannot be written.
        virtual auto Save(StateRecord const& record) -> void = 0;

        // nullopt when no snapshot exists (not an error).
        // Throws error::PersistenceError / error::SerializationError for unreadable or corrupt snapshots.
        virtual auto Load() -> std::optional<StateRecord> = 0;
    };
}

#endif //BINGO_STORAGE_HPP
