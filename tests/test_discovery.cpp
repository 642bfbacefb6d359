#include <gtest/gtest.h>
#include "discolib/core/discovery.hpp"

using namespace discolib::core;

static TQLConfig Epsilon(double epsilon) {
    TQLConfig c;
    c.epsilon = epsilon;
    return c;
}

class RecordingSink : public IResultSink {
public:
    void OnDiscovery(const TDiscoveryRecord& record) override { records.push_back(record); }
    void OnOptimization(const TOptimizationResult&) override {}

    std::vector<TDiscoveryRecord> records;
};

class FailingSink : public IResultSink {
public:
    void OnDiscovery(const TDiscoveryRecord&) override { throw std::runtime_error("disk full"); }
    void OnOptimization(const TOptimizationResult&) override {}
};

TEST(DiscoveryTest, SortingOnFreshAgent) {
    DiscoveryAgent agent(DefaultCatalog(), TQLConfig{}, 31);
    TDiscoveryOutcome outcome = agent.Discover("sorting", 100);

    ASSERT_TRUE(outcome.ok());
    const TDiscoveryRecord& rec = outcome.record;

    std::vector<std::string> sorting = agent.Catalog().AlgorithmsFor("sorting");
    ASSERT_EQ(sorting.size(), 5u);
    EXPECT_NE(std::ranges::find(sorting, rec.selectedAlgorithm), sorting.end());

    TComplexity c = agent.Catalog().ComplexityOf("sorting", rec.selectedAlgorithm);
    EXPECT_EQ(rec.timeComplexity, c.time);
    EXPECT_EQ(rec.spaceComplexity, c.space);
    EXPECT_EQ(rec.category, "sorting");
    EXPECT_EQ(rec.inputSize, 100);
    EXPECT_FALSE(rec.fitnessScore.has_value());
    EXPECT_GT(rec.timestamp, 0.0);
    EXPECT_EQ(agent.HistorySize(), 1u);
}

TEST(DiscoveryTest, UnknownCategoryAppendsNothing) {
    DiscoveryAgent agent(DefaultCatalog(), TQLConfig{}, 31);
    TDiscoveryOutcome outcome = agent.Discover("unknown_domain", 10);

    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.status, DiscoveryStatus::UnknownCategory);
    EXPECT_EQ(agent.HistorySize(), 0u);
}

TEST(DiscoveryTest, CategoryWithoutAlgorithms) {
    AlgorithmCatalog catalog;
    catalog.AddCategory("strings");
    DiscoveryAgent agent(catalog, TQLConfig{}, 31);

    EXPECT_EQ(agent.Discover("strings", 10).status, DiscoveryStatus::NoAlgorithms);
    EXPECT_EQ(agent.Discover("geometry", 10).status, DiscoveryStatus::UnknownCategory);
    EXPECT_EQ(agent.HistorySize(), 0u);
}

TEST(DiscoveryTest, SizeBuckets) {
    EXPECT_EQ(DiscoveryAgent::SizeBucket(-5), 0);
    EXPECT_EQ(DiscoveryAgent::SizeBucket(0), 0);
    EXPECT_EQ(DiscoveryAgent::SizeBucket(9), 0);
    EXPECT_EQ(DiscoveryAgent::SizeBucket(10), 1);
    EXPECT_EQ(DiscoveryAgent::SizeBucket(100), 2);
    EXPECT_EQ(DiscoveryAgent::SizeBucket(999), 2);
    EXPECT_EQ(DiscoveryAgent::StateKey("graph", 5000), "graph_b3");
}

TEST(DiscoveryTest, EvaluatorScoresAndTeaches) {
    DiscoveryAgent agent(DefaultCatalog(), Epsilon(0.2), 5);
    auto evaluator = [](const std::string& algorithm) { return algorithm == "heapsort" ? 1.0 : 0.0; };

    for (int i = 0; i < 200; i++) {
        TDiscoveryOutcome outcome = agent.Discover("sorting", 1000, evaluator);
        ASSERT_TRUE(outcome.ok());
        ASSERT_TRUE(outcome.record.fitnessScore.has_value());
        EXPECT_DOUBLE_EQ(*outcome.record.fitnessScore, outcome.record.selectedAlgorithm == "heapsort" ? 1.0 : 0.0);
    }

    ASSERT_TRUE(agent.Recommend("sorting", 1000).has_value());
    EXPECT_EQ(*agent.Recommend("sorting", 1000), "heapsort");
    EXPECT_EQ(agent.Policy().Visits(DiscoveryAgent::StateKey("sorting", 1000)), 200);

    // greedy selection now exploits the learned value
    agent.Policy().SetEpsilon(0.0);
    EXPECT_EQ(agent.Discover("sorting", 1000).record.selectedAlgorithm, "heapsort");
}

TEST(DiscoveryTest, FeedbackUpdatesOnlyLegalActions) {
    DiscoveryAgent agent(DefaultCatalog(), TQLConfig{}, 5);

    EXPECT_FALSE(agent.Feedback("sorting", 100, "dijkstra", 1.0));
    EXPECT_FALSE(agent.Feedback("unknown_domain", 100, "dfs", 1.0));
    EXPECT_FALSE(agent.Recommend("sorting", 100).has_value());

    EXPECT_TRUE(agent.Feedback("sorting", 100, "mergesort", 1.0));
    EXPECT_NEAR(agent.Policy().Value("sorting_b2", "mergesort"), 0.1, 1e-12);
    EXPECT_EQ(*agent.Recommend("sorting", 100), "mergesort");
}

TEST(DiscoveryTest, HistoryKeepsMostRecent) {
    DiscoveryAgent agent(DefaultCatalog(), TQLConfig{}, 5);
    for (int i = 1; i <= 15; i++) ASSERT_TRUE(agent.Discover("graph", i).ok());

    std::vector<TDiscoveryRecord> recent = agent.History();
    ASSERT_EQ(recent.size(), 10u);
    EXPECT_EQ(recent.front().inputSize, 6);
    EXPECT_EQ(recent.back().inputSize, 15);

    EXPECT_EQ(agent.History(100).size(), 15u);
}

TEST(DiscoveryTest, ResetReturnsToUnlearnedState) {
    DiscoveryAgent agent(DefaultCatalog(), TQLConfig{}, 5);
    agent.Discover("dp", 50, [](const std::string&) { return 1.0; });
    ASSERT_EQ(agent.HistorySize(), 1u);
    ASSERT_TRUE(agent.Recommend("dp", 50).has_value());

    agent.Reset();
    EXPECT_EQ(agent.HistorySize(), 0u);
    EXPECT_FALSE(agent.Recommend("dp", 50).has_value());
    EXPECT_EQ(agent.Policy().Visits("dp_b1"), 0);
}

TEST(DiscoveryTest, EvaluatorFailurePropagates) {
    DiscoveryAgent agent(DefaultCatalog(), TQLConfig{}, 5);
    auto broken = [](const std::string&) -> double { throw std::runtime_error("benchmark failed"); };

    EXPECT_THROW(agent.Discover("sorting", 10, broken), std::runtime_error);
    EXPECT_EQ(agent.HistorySize(), 0u);
}

TEST(DiscoveryTest, SinkReceivesRecords) {
    DiscoveryAgent agent(DefaultCatalog(), TQLConfig{}, 5);
    auto sink = std::make_shared<RecordingSink>();
    agent.SetSink(sink);

    agent.Discover("searching", 10);
    agent.Discover("unknown_domain", 10);

    ASSERT_EQ(sink->records.size(), 1u);
    EXPECT_EQ(sink->records[0].category, "searching");
}

TEST(DiscoveryTest, SinkFailureDoesNotChangeResult) {
    DiscoveryAgent agent(DefaultCatalog(), TQLConfig{}, 5);
    agent.SetSink(std::make_shared<FailingSink>());

    TDiscoveryOutcome outcome = agent.Discover("searching", 10);
    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(agent.HistorySize(), 1u);
}

TEST(DiscoveryTest, NonFiniteRewardsDoNotReachThePolicy) {
    DiscoveryAgent agent(DefaultCatalog(), Epsilon(0.0), 19);
    const std::vector<std::string> searching = agent.Catalog().AlgorithmsFor("searching");

    for (const auto& algorithm : searching) {
        EXPECT_THROW(agent.Feedback("searching", 10, algorithm, std::nan("")), std::invalid_argument);
    }
    EXPECT_THROW(agent.Discover("searching", 10, [](const std::string&) { return std::nan(""); }),
                 std::invalid_argument);
    EXPECT_EQ(agent.HistorySize(), 0u);

    for (int i = 0; i < 10; i++) {
        TDiscoveryOutcome outcome = agent.Discover("searching", 10);
        ASSERT_TRUE(outcome.ok());
        EXPECT_NE(std::ranges::find(searching, outcome.record.selectedAlgorithm), searching.end());
    }
}

TEST(DiscoveryTest, ZeroLimitReturnsWholeHistory) {
    DiscoveryAgent agent(DefaultCatalog(), TQLConfig{}, 23);
    for (int i = 0; i < 12; i++) ASSERT_TRUE(agent.Discover("sorting", 1000).ok());

    EXPECT_EQ(agent.History(0).size(), 12u);
    EXPECT_EQ(agent.History(3).size(), 3u);
}
