//
// FileStorage.cpp
//
#include "store/FileStorage.hpp"

#include <format>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "core/Exception.hpp"
#include "generated/flatbuffers/bingo_state_generated.h"

namespace fbs = bingo::gen::store;

namespace
{
    static_assert((int)bingo::core::CellKind::Number == (int)fbs::CellKind::Number);
    static_assert((int)bingo::core::CellKind::Free == (int)fbs::CellKind::Free);
    static_assert((int)bingo::core::CellKind::Marked == (int)fbs::CellKind::Marked);

    constexpr size_t CellCount = bingo::core::constants::GridSize * bingo::core::constants::GridSize;

    auto ToFbKind(bingo::core::CellKind k) noexcept -> fbs::CellKind
    {
        switch (k)
        {
        case bingo::core::CellKind::Number: return fbs::CellKind::Number;
        case bingo::core::CellKind::Free: return fbs::CellKind::Free;
        case bingo::core::CellKind::Marked: return fbs::CellKind::Marked;
        }
        return fbs::CellKind::Number;
    }

    auto FromFbKind(fbs::CellKind k) -> bingo::core::CellKind
    {
        switch (k)
        {
        case fbs::CellKind::Number: return bingo::core::CellKind::Number;
        case fbs::CellKind::Free: return bingo::core::CellKind::Free;
        case fbs::CellKind::Marked: return bingo::core::CellKind::Marked;
        }
        BINGO_THROW(bingo::core::error::Code::Serialization,
                    std::format("Unknown cell kind {}", static_cast<int>(k)));
    }

    auto FbString(flatbuffers::String const* s) -> std::string
    {
        return s ? s->str() : std::string{};
    }
}

namespace bingo::store
{
    using namespace bingo::core;

    auto EncodeRecord(StateRecord const& record) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<fbs::PlayerEntry>> players;
        players.reserve(record.players.size());
        for (PlayerRecord const& pr : record.players)
        {
            std::vector<fbs::Cell> cells;
            cells.reserve(CellCount);
            for (Row const& row : pr.card)
            {
                for (Cell const& c : row)
                {
                    cells.emplace_back(ToFbKind(c.kind), c.number);
                }
            }

            auto const id = fbb.CreateString(pr.id);
            auto const cell_vec = fbb.CreateVectorOfStructs(cells);
            auto const name = fbb.CreateString(pr.name);
            players.push_back(fbs::CreatePlayerEntry(fbb, id, cell_vec, pr.chat, pr.message, name));
        }
        auto const player_vec = fbb.CreateVector(players);
        auto const called_vec = fbb.CreateVector(record.called);

        auto const root = fbs::CreateGameRecord(
            fbb,
            /*schema_version*/ 1,
            player_vec,
            called_vec,
            record.active,
            record.last_called ? static_cast<int16_t>(*record.last_called) : int16_t{-1});

        fbs::FinishGameRecordBuffer(fbb, root);
        return fbb.Release();
    }

    auto DecodeRecord(std::span<std::byte const> bytes) -> StateRecord
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t) + flatbuffers::kFileIdentifierLength)
        {
            BINGO_THROW(error::Code::Serialization, "Snapshot too small");
        }
        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());

        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fbs::VerifyGameRecordBuffer(verifier))
        {
            BINGO_THROW(error::Code::Serialization, "Snapshot failed verification");
        }

        fbs::GameRecord const* root = fbs::GetGameRecord(data);
        StateRecord rec{};
        rec.active = root->active();
        if (root->last_called() >= 0)
        {
            if (root->last_called() > constants::MaxNumber)
                BINGO_THROW(error::Code::Serialization, "Last called number out of range");
            rec.last_called = static_cast<Number>(root->last_called());
        }
        if (auto const* called = root->called())
        {
            rec.called.assign(called->begin(), called->end());
        }

        if (auto const* players = root->players())
        {
            rec.players.reserve(players->size());
            for (fbs::PlayerEntry const* pe : *players)
            {
                if (pe->cells()->size() != CellCount)
                {
                    BINGO_THROW(error::Code::Serialization,
                                std::format("Player {} has {} cells", pe->id()->str(), pe->cells()->size()));
                }

                PlayerRecord pr{};
                pr.id = pe->id()->str();
                for (flatbuffers::uoffset_t i{}; i < CellCount; ++i)
                {
                    fbs::Cell const* c = pe->cells()->Get(i);
                    pr.card[i / constants::GridSize][i % constants::GridSize] = Cell{FromFbKind(c->kind()), c->number()};
                }
                pr.chat = pe->chat_id();
                pr.message = pe->message_id();
                pr.name = FbString(pe->name());
                rec.players.push_back(std::move(pr));
            }
        }
        return rec;
    }

    FileStorage::FileStorage(std::filesystem::path path) :
        path_(std::move(path))
    {
    }

    auto FileStorage::Save(StateRecord const& record) -> void
    {
        flatbuffers::DetachedBuffer const buf = EncodeRecord(record);

        std::filesystem::path tmp = path_;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out)
            {
                BINGO_THROW(error::Code::Persistence, std::format("Cannot open {} for writing", tmp.string()));
            }
            out.write(reinterpret_cast<char const*>(buf.data()), static_cast<std::streamsize>(buf.size()));
            if (!out.flush())
            {
                BINGO_THROW(error::Code::Persistence, std::format("Short write to {}", tmp.string()));
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmp, path_, ec);
        if (ec)
        {
            BINGO_THROW(error::Code::Persistence,
                        std::format("Cannot replace {}: {}", path_.string(), ec.message()));
        }
    }

    auto FileStorage::Load() -> std::optional<StateRecord>
    {
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec))
        {
            return std::nullopt;
        }

        std::ifstream in(path_, std::ios::binary);
        if (!in)
        {
            BINGO_THROW(error::Code::Persistence, std::format("Cannot open {}", path_.string()));
        }
        std::vector<char> raw{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};

        std::span<std::byte const> bytes{reinterpret_cast<std::byte const*>(raw.data()), raw.size()};
        return DecodeRecord(bytes);
    }
}
