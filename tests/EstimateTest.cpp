#include <gtest/gtest.h>

#include "estimate.hpp"

#include "TemporaryFile.hpp"

TEST(Estimate, LiteralAgainstLiteral)
{
    EXPECT_EQ(estimateTrials(LiteralSource{"root"}, LiteralSource{"toor"}), 1u);
}

TEST(Estimate, LiteralAgainstFile)
{
    const auto secrets = TemporaryFile{"s1\n\ns2\n  \ns3\n"};
    EXPECT_EQ(estimateTrials(LiteralSource{"root"}, FileSource{secrets.path()}), 3u);
}

TEST(Estimate, FileAgainstFile)
{
    const auto identities = TemporaryFile{"i1\ni2\n\n"};
    const auto secrets    = TemporaryFile{"s1\ns2\ns3\n"};
    EXPECT_EQ(estimateTrials(FileSource{identities.path()}, FileSource{secrets.path()}), 6u);
}

TEST(Estimate, MissingFileCountsAsEmpty)
{
    const auto missing = TemporaryFile{};
    EXPECT_EQ(estimateTrials(FileSource{missing.path()}, LiteralSource{""}), 0u);
}
