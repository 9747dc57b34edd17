#include <gtest/gtest.h>

#include "ResultAggregator.hpp"

#include <sstream>

TEST(ResultAggregator, RecordsAndReportsSuccesses)
{
    auto console  = std::ostringstream{};
    auto output   = std::ostringstream{};
    auto progress = Progress{console};

    auto results = ResultAggregator{progress, &output};
    results.add({{"alice", "wonderland"}, "alice:wonderland"});
    results.add({{"root", ""}, ""});

    ASSERT_EQ(results.successes().size(), 2u);
    EXPECT_EQ(results.successes()[0].pair, (TrialPair{"alice", "wonderland"}));
    EXPECT_EQ(results.successes()[1].pair, (TrialPair{"root", ""}));

    EXPECT_EQ(output.str(), "alice:wonderland\nroot:\n");

    const auto text = console.str();
    EXPECT_NE(text.find("Success: alice / wonderland (alice:wonderland)"), std::string::npos);
    EXPECT_NE(text.find("Success: root / (no secret)"), std::string::npos);
}

TEST(ResultAggregator, WithoutOutputFile)
{
    auto console  = std::ostringstream{};
    auto progress = Progress{console};

    auto results = ResultAggregator{progress};
    results.add({{"alice", "wonderland"}, {}});

    EXPECT_EQ(results.successes().size(), 1u);
}
