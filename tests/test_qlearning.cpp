#include <gtest/gtest.h>
#include "discolib/core/qlearning.hpp"
#include "discolib/core/errors.hpp"

using namespace discolib::core;

static TQLConfig MakeConfig(double alpha, double gamma, double epsilon) {
    TQLConfig c;
    c.learningRate = alpha;
    c.discountFactor = gamma;
    c.epsilon = epsilon;
    return c;
}

TEST(QLearningTest, SelectWithoutActionsThrows) {
    QLearningPolicy policy(MakeConfig(0.1, 0.95, 0.1), 7);
    EXPECT_THROW(policy.SelectAction("s", {}), NoLegalActionsError);
}

TEST(QLearningTest, SelectionCountsVisits) {
    QLearningPolicy policy(MakeConfig(0.1, 0.95, 1.0), 7);
    std::vector<std::string> actions = {"a", "b"};

    EXPECT_EQ(policy.Visits("s"), 0);
    for (int i = 0; i < 5; i++) policy.SelectAction("s", actions);
    EXPECT_EQ(policy.Visits("s"), 5);
    EXPECT_EQ(policy.Visits("other"), 0);
}

TEST(QLearningTest, GreedyPicksReinforcedAction) {
    QLearningPolicy policy(MakeConfig(0.5, 0.9, 0.0), 11);
    std::vector<std::string> actions = {"a", "b", "c"};

    for (int i = 0; i < 20; i++) policy.Update("s", "b", 1.0, "s", {});

    for (int i = 0; i < 200; i++) {
        EXPECT_EQ(policy.SelectAction("s", actions), "b");
    }
}

TEST(QLearningTest, FullExplorationIsUniform) {
    QLearningPolicy policy(MakeConfig(0.1, 0.95, 1.0), 12345);
    std::vector<std::string> actions = {"a", "b", "c"};

    // bias the values so a greedy choice would be visible
    policy.Update("s", "a", 10.0, "s", {});

    std::map<std::string, int> counts;
    const int trials = 30000;
    for (int i = 0; i < trials; i++) counts[policy.SelectAction("s", actions)]++;

    for (const auto& a : actions) {
        EXPECT_NEAR(counts[a], trials / 3, 600) << a;
    }
}

TEST(QLearningTest, TiesAreBrokenRandomly) {
    QLearningPolicy policy(MakeConfig(0.1, 0.95, 0.0), 99);
    std::vector<std::string> actions = {"first", "second", "third"};

    std::map<std::string, int> counts;
    for (int i = 0; i < 3000; i++) counts[policy.SelectAction("s", actions)]++;

    for (const auto& a : actions) {
        EXPECT_GT(counts[a], 800) << a;
    }
}

TEST(QLearningTest, UpdateRule) {
    QLearningPolicy policy(MakeConfig(0.1, 0.95, 0.0), 1);

    policy.Update("s2", "x", 1.0, "end", {});
    EXPECT_NEAR(policy.Value("s2", "x"), 0.1, 1e-12);

    // max over {x, y} uses the lazily created Q(s2, y) = 0
    policy.Update("s", "a", 0.0, "s2", {"x", "y"});
    EXPECT_NEAR(policy.Value("s", "a"), 0.1 * 0.95 * 0.1, 1e-12);

    EXPECT_DOUBLE_EQ(policy.Value("never", "seen"), 0.0);
}

TEST(QLearningTest, RepeatedUpdatesConvergeMonotonically) {
    QLearningPolicy policy(MakeConfig(0.5, 0.5, 0.0), 1);
    const double target = 1.0 / (1.0 - 0.5);

    double previous = policy.Value("s", "a");
    for (int i = 0; i < 200; i++) {
        policy.Update("s", "a", 1.0, "s", {"a"});
        double current = policy.Value("s", "a");
        EXPECT_GE(current, previous);
        EXPECT_LE(current, target + 1e-12);
        previous = current;
    }
    EXPECT_NEAR(previous, target, 1e-6);
}

TEST(QLearningTest, BestActionWithoutDataIsEmpty) {
    QLearningPolicy policy(MakeConfig(0.1, 0.95, 0.1), 3);
    EXPECT_FALSE(policy.BestAction("s").has_value());

    policy.Update("s", "slow", 0.2, "s", {});
    policy.Update("s", "fast", 0.9, "s", {});
    ASSERT_TRUE(policy.BestAction("s").has_value());
    EXPECT_EQ(*policy.BestAction("s"), "fast");

    EXPECT_FALSE(policy.BestAction("s_other").has_value());
}

TEST(QLearningTest, ResetForgetsEverything) {
    QLearningPolicy policy(MakeConfig(0.1, 0.95, 0.0), 3);
    policy.SelectAction("s", {"a", "b"});
    policy.Update("s", "a", 1.0, "s", {});
    ASSERT_GT(policy.Size(), 0u);

    policy.Reset();
    EXPECT_EQ(policy.Size(), 0u);
    EXPECT_EQ(policy.Visits("s"), 0);
    EXPECT_FALSE(policy.BestAction("s").has_value());
}

TEST(QLearningTest, InvalidRatesAreRejected) {
    EXPECT_THROW(QLearningPolicy(MakeConfig(1.5, 0.9, 0.1), 1), std::invalid_argument);
    EXPECT_THROW(QLearningPolicy(MakeConfig(0.1, -0.1, 0.1), 1), std::invalid_argument);
    EXPECT_THROW(QLearningPolicy(MakeConfig(0.1, 0.9, 2.0), 1), std::invalid_argument);

    QLearningPolicy policy(MakeConfig(0.1, 0.9, 0.1), 1);
    EXPECT_THROW(policy.SetEpsilon(-0.5), std::invalid_argument);
    EXPECT_DOUBLE_EQ(policy.Config().epsilon, 0.1);

    policy.SetEpsilon(0.0);
    EXPECT_DOUBLE_EQ(policy.Config().epsilon, 0.0);
}

TEST(QLearningTest, SameSeedSameChoices) {
    QLearningPolicy p1(MakeConfig(0.1, 0.95, 0.5), 2024);
    QLearningPolicy p2(MakeConfig(0.1, 0.95, 0.5), 2024);
    std::vector<std::string> actions = {"a", "b", "c", "d"};

    for (int i = 0; i < 100; i++) {
        EXPECT_EQ(p1.SelectAction("s", actions), p2.SelectAction("s", actions));
    }
}

TEST(QLearningTest, PrintPolicyListsStates) {
    QLearningPolicy policy(MakeConfig(0.1, 0.95, 0.0), 3);
    policy.Update("sorting_b2", "heapsort", 1.0, "sorting_b2", {});

    std::ostringstream out;
    policy.PrintPolicy(out);
    EXPECT_NE(out.str().find("sorting_b2"), std::string::npos);
    EXPECT_NE(out.str().find("heapsort"), std::string::npos);
}

TEST(QLearningTest, NonFiniteRewardIsRejected) {
    QLearningPolicy policy(MakeConfig(0.5, 0.9, 0.0), 13);
    std::vector<std::string> actions = {"a", "b"};

    policy.Update("s", "a", 1.0, "s", {});
    const double before = policy.Value("s", "a");

    EXPECT_THROW(policy.Update("s", "a", std::nan(""), "s", {}), std::invalid_argument);
    EXPECT_THROW(policy.Update("s", "b", std::numeric_limits<double>::infinity(), "s", {}), std::invalid_argument);
    EXPECT_THROW(policy.Update("s", "b", -std::numeric_limits<double>::infinity(), "s", {}), std::invalid_argument);

    EXPECT_DOUBLE_EQ(policy.Value("s", "a"), before);
    EXPECT_EQ(policy.Size(), 1u);

    for (int i = 0; i < 20; i++) {
        std::string chosen = policy.SelectAction("s", actions);
        EXPECT_TRUE(chosen == "a" || chosen == "b");
    }
}

TEST(QLearningTest, PrintPolicyKeepsStreamFormat) {
    QLearningPolicy policy(MakeConfig(0.1, 0.95, 0.0), 3);
    policy.Update("dp_b1", "lcs", 1.0, "dp_b1", {});

    std::ostringstream out;
    const auto flags = out.flags();
    const auto precision = out.precision();
    policy.PrintPolicy(out);

    EXPECT_NE(out.str().find("0.1000"), std::string::npos);
    EXPECT_EQ(out.flags(), flags);
    EXPECT_EQ(out.precision(), precision);
}
