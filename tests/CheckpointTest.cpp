#include <gtest/gtest.h>

#include "Checkpoint.hpp"
#include "file.hpp"

#include "TemporaryFile.hpp"

#include <filesystem>

TEST(CheckpointStore, LoadWithoutFileIsEmpty)
{
    const auto file  = TemporaryFile{};
    const auto store = CheckpointStore{file.path()};

    EXPECT_FALSE(store.exists());

    const auto checkpoint = store.load();
    EXPECT_TRUE(checkpoint.lastIdentity.empty());
    EXPECT_TRUE(checkpoint.lastSecret.empty());
}

TEST(CheckpointStore, SaveThenLoad)
{
    const auto file  = TemporaryFile{};
    auto       store = CheckpointStore{file.path()};

    store.save({"alice", "hunter2"});

    EXPECT_TRUE(store.exists());
    const auto checkpoint = store.load();
    EXPECT_EQ(checkpoint.lastIdentity, "alice");
    EXPECT_EQ(checkpoint.lastSecret, "hunter2");
}

TEST(CheckpointStore, SaveOverwrites)
{
    const auto file  = TemporaryFile{};
    auto       store = CheckpointStore{file.path()};

    store.save({"alice", "first"});
    store.save({"bob", ""});

    const auto checkpoint = store.load();
    EXPECT_EQ(checkpoint.lastIdentity, "bob");
    EXPECT_EQ(checkpoint.lastSecret, "");
    EXPECT_FALSE(std::filesystem::exists(file.path() + ".tmp"));
}

TEST(CheckpointStore, ArbitraryBytesSurvive)
{
    const auto file  = TemporaryFile{};
    auto       store = CheckpointStore{file.path()};

    const auto identity = std::string{"name with spaces\tand\ttabs"};
    const auto secret   = std::string{"p\xe4ss\nword\0x", 11};
    store.save({identity, secret});

    const auto checkpoint = CheckpointStore{file.path()}.load();
    EXPECT_EQ(checkpoint.lastIdentity, identity);
    EXPECT_EQ(checkpoint.lastSecret, secret);
}

TEST(CheckpointStore, MalformedFile)
{
    const auto file = TemporaryFile{"last_user alice\n"};
    EXPECT_THROW(CheckpointStore{file.path()}.load(), CheckpointStore::Error);
}

TEST(CheckpointStore, InvalidHexadecimal)
{
    const auto file = TemporaryFile{"identity 616\nsecret 62\n"};
    EXPECT_THROW(CheckpointStore{file.path()}.load(), CheckpointStore::Error);
}

TEST(CheckpointStore, UnwritableLocation)
{
    const auto directory = TemporaryFile{};
    auto       store     = CheckpointStore{directory.path() + "/missing/state"};

    EXPECT_THROW(store.save({"alice", "secret"}), FileError);
}

TEST(CheckpointStore, InaccessibleLocation)
{
    // a file name longer than any file system allows
    const auto tooLong = std::filesystem::temp_directory_path() / std::string(300, 'x');
    const auto store   = CheckpointStore{tooLong.string()};

    EXPECT_THROW(store.exists(), FileError);
    EXPECT_THROW(store.load(), FileError);
}
