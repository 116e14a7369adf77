//
// FileStorage.hpp: snapshot file backed by a FlatBuffers GameRecord
//

#ifndef BINGO_FILESTORAGE_HPP
#define BINGO_FILESTORAGE_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>

#include <flatbuffers/flatbuffers.h>

#include "core/State.hpp"
#include "core/Storage.hpp"

namespace bingo::store
{
    // --- Record <-> bytes ---

    auto EncodeRecord(core::StateRecord const& record) -> flatbuffers::DetachedBuffer;

    // Throws error::SerializationError when the bytes are not a valid GameRecord.
    auto DecodeRecord(std::span<std::byte const> bytes) -> core::StateRecord;

    class FileStorage final : public core::Storage
    {
    public:
        explicit FileStorage(std::filesystem::path path);

        // Writes to "<path>.tmp" then renames over the snapshot.
        auto Save(core::StateRecord const& record) -> void override;
        auto Load() -> std::optional<core::StateRecord> override;

        auto Path() const noexcept -> std::filesystem::path const& { return path_; }

    private:
        std::filesystem::path path_;
    };
}

#endif //BINGO_FILESTORAGE_HPP
