#include <gtest/gtest.h>

#include "Source.hpp"
#include "file.hpp"

#include "TemporaryFile.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace
{

auto collect(const Source& source) -> std::vector<std::string>
{
    auto candidates = std::vector<std::string>{};
    const auto stream = source.open();
    while (auto candidate = stream->next())
        candidates.push_back(*candidate);
    return candidates;
}

const auto users = std::vector<std::string>{"u1", "u2", "u3"};

} // namespace

TEST(LiteralSource, YieldsValueOnce)
{
    const auto source = LiteralSource{"admin"};
    EXPECT_EQ(collect(source), std::vector<std::string>{"admin"});
    EXPECT_EQ(source.count(), 1u);
}

TEST(LiteralSource, KeepsEmptyValue)
{
    const auto source = LiteralSource{""};
    EXPECT_EQ(collect(source), std::vector<std::string>{""});
}

TEST(LiteralSource, RestartsWhenOpenedAgain)
{
    const auto source = LiteralSource{"admin"};
    EXPECT_EQ(collect(source), collect(source));
}

TEST(FileSource, TrimsAndSkipsBlankLines)
{
    const auto file   = TemporaryFile{"  alice \n\n\t\nbob\r\n   \ncarol"};
    const auto source = FileSource{file.path()};

    EXPECT_EQ(collect(source), (std::vector<std::string>{"alice", "bob", "carol"}));
    EXPECT_EQ(source.count(), 3u);
}

TEST(FileSource, EmptyFile)
{
    const auto file   = TemporaryFile{""};
    const auto source = FileSource{file.path()};

    EXPECT_TRUE(collect(source).empty());
    EXPECT_EQ(source.count(), 0u);
}

TEST(FileSource, MissingFileFailsToOpen)
{
    const auto file   = TemporaryFile{};
    const auto source = FileSource{file.path()};

    EXPECT_THROW(source.open(), FileError);
    EXPECT_EQ(source.count(), 0u);
}

TEST(FileSource, ResumeAfterSentinel)
{
    const auto file = TemporaryFile{"u1\nu2\nu3\n"};
    EXPECT_EQ(collect(FileSource{file.path(), "u2"}), std::vector<std::string>{"u3"});
}

TEST(FileSource, ResumeFromStartWithEmptySentinel)
{
    const auto file = TemporaryFile{"u1\nu2\nu3\n"};
    EXPECT_EQ(collect(FileSource{file.path(), ""}), users);
}

TEST(FileSource, ResumeWithAbsentSentinelYieldsNothing)
{
    const auto file = TemporaryFile{"u1\nu2\nu3\n"};
    EXPECT_TRUE(collect(FileSource{file.path(), "u9"}).empty());
}

TEST(FileSource, ResumeWithSentinelOnLastLineYieldsNothing)
{
    const auto file = TemporaryFile{"u1\nu2\nu3\n"};
    EXPECT_TRUE(collect(FileSource{file.path(), "u3"}).empty());
}

TEST(FileSource, ResumeStopsAtFirstMatch)
{
    const auto file = TemporaryFile{"u1\nu2\n  \nu1\nu3\n"};
    EXPECT_EQ(collect(FileSource{file.path(), "u1"}), (std::vector<std::string>{"u2", "u1", "u3"}));
}

TEST(FileSource, CountIgnoresResumePoint)
{
    const auto file = TemporaryFile{"u1\nu2\nu3\n"};
    EXPECT_EQ((FileSource{file.path(), "u2"}.count()), 3u);
}

TEST(FileSource, ReadErrorIsReported)
{
    // a directory can be opened but not read
    const auto directory = TemporaryFile{};
    std::filesystem::create_directory(directory.path());

    const auto stream = FileSource{directory.path()}.open();
    EXPECT_THROW(stream->next(), FileError);
}
