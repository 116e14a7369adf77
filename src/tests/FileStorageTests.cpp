#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "../core/Exception.hpp"
#include "../core/GameStore.hpp"
#include "../store/FileStorage.hpp"
#include "TestHelpers.hpp"

using namespace bingo::core;
using namespace bingo::test;
using bingo::store::FileStorage;

namespace
{
    class FileStorageTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            auto const* info = ::testing::UnitTest::GetInstance()->current_test_info();
            dir_ = std::filesystem::temp_directory_path() / (std::string{"bingo_"} + info->name());
            std::filesystem::remove_all(dir_);
            std::filesystem::create_directories(dir_);
        }

        void TearDown() override
        {
            std::error_code ec;
            std::filesystem::remove_all(dir_, ec);
        }

        auto SnapshotPath() const -> std::filesystem::path { return dir_ / "bingo_state.bin"; }

        std::filesystem::path dir_;
    };

    auto SampleRecord() -> StateRecord
    {
        GameStore s(nullptr);
        GameState& st = s.State();
        st.active = true;
        st.called = {1, 16, 31};
        st.last_called = 31;
        Card card = OrderedCard();
        card[0][0].kind = CellKind::Marked;
        card[2][2].kind = CellKind::Marked;
        AddPlayer(st, 123456789012, card, "Zoë");
        AddPlayer(st, 42, ShiftedCard(9));
        return s.Snapshot();
    }
}

TEST_F(FileStorageTest, SaveThenLoad)
{
    FileStorage fs(SnapshotPath());
    StateRecord const rec = SampleRecord();
    fs.Save(rec);

    EXPECT_TRUE(std::filesystem::exists(SnapshotPath()));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "bingo_state.bin.tmp"));

    auto loaded = fs.Load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, rec);
}

TEST_F(FileStorageTest, EmptyGameSurvives)
{
    FileStorage fs(SnapshotPath());
    fs.Save(StateRecord{});
    auto loaded = fs.Load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, StateRecord{});
    EXPECT_FALSE(loaded->last_called.has_value());
}

TEST_F(FileStorageTest, SaveOverwritesPreviousSnapshot)
{
    FileStorage fs(SnapshotPath());
    fs.Save(SampleRecord());
    StateRecord later = SampleRecord();
    later.active = false;
    later.players.clear();
    fs.Save(later);
    EXPECT_EQ(fs.Load(), later);
}

TEST_F(FileStorageTest, MissingFileLoadsNothing)
{
    FileStorage fs(SnapshotPath());
    EXPECT_FALSE(fs.Load().has_value());
}

TEST_F(FileStorageTest, GarbageThrows)
{
    {
        std::ofstream out(SnapshotPath(), std::ios::binary);
        out << "definitely not a flatbuffer, just some bytes on disk";
    }
    FileStorage fs(SnapshotPath());
    EXPECT_THROW(fs.Load(), error::SerializationError);
}

TEST_F(FileStorageTest, TruncatedFileThrows)
{
    {
        std::ofstream out(SnapshotPath(), std::ios::binary);
        out << "ab";
    }
    FileStorage fs(SnapshotPath());
    EXPECT_THROW(fs.Load(), error::SerializationError);
}

TEST_F(FileStorageTest, UnwritableLocationThrows)
{
    FileStorage fs(dir_ / "no_such_dir" / "state.bin");
    EXPECT_THROW(fs.Save(SampleRecord()), error::PersistenceError);
}

TEST_F(FileStorageTest, StoreFallsBackToEmptyOnCorruptFile)
{
    {
        std::ofstream out(SnapshotPath(), std::ios::binary);
        out << std::string(64, '\x7f');
    }
    GameStore store(std::make_shared<FileStorage>(SnapshotPath()));
    EXPECT_FALSE(store.Load());
    EXPECT_EQ(store.State(), GameState{});

    // and the next boundary write replaces the bad file
    store.State().active = true;
    ASSERT_TRUE(store.Persist());
    GameStore reread(std::make_shared<FileStorage>(SnapshotPath()));
    EXPECT_TRUE(reread.Load());
    EXPECT_TRUE(reread.State().active);
}

TEST(RecordCodec, DecodeRejectsZeroedBuffer)
{
    std::vector<std::byte> zeros(128, std::byte{0});
    EXPECT_THROW(bingo::store::DecodeRecord(zeros), error::SerializationError);
}
