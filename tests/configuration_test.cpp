///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "configuration.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(ConfigurationTest, RuleNamesRoundTrip) {
    for (SoftRuleKind kind : allSoftRules()) {
        std::optional<SoftRuleKind> parsed = parseRuleName(ruleName(kind));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, kind);
    }
    EXPECT_FALSE(parseRuleName("lunch_break").has_value());
}

TEST(ConfigurationTest, DefaultPresetEnablesEveryRule) {
    std::vector<ActiveRule> rules = validateConfig(defaultConfig());
    ASSERT_EQ(rules.size(), allSoftRules().size());
    for (size_t i = 1; i < rules.size(); ++i) {
        EXPECT_GE(rules[i - 1].priority, rules[i].priority);
    }
}

TEST(ConfigurationTest, ActiveRulesAreSortedByPriorityThenKind) {
    OptimizerConfig config;
    config.rules["max_spacing"] = RuleSetting{true, 1, 1};
    config.rules["non_morning_class"] = RuleSetting{true, 1, 1};
    config.rules["friday_afternoon"] = RuleSetting{true, 4, 7};
    config.rules["teacher_preference"] = RuleSetting{false, 9, 9};

    std::vector<ActiveRule> rules = validateConfig(config);
    ASSERT_EQ(rules.size(), 3u);
    EXPECT_EQ(rules[0].kind, SoftRuleKind::FRIDAY_AFTERNOON);
    EXPECT_EQ(rules[0].weight, 4);
    EXPECT_EQ(rules[1].kind, SoftRuleKind::NON_MORNING_CLASS);
    EXPECT_EQ(rules[2].kind, SoftRuleKind::MAX_SPACING);
}

TEST(ConfigurationTest, ZeroWeightIsAccepted) {
    OptimizerConfig config;
    config.rules["curriculum_conflict"] = RuleSetting{true, 0, 0};
    EXPECT_EQ(validateConfig(config).size(), 1u);
}

TEST(ConfigurationTest, RejectsUnknownRule) {
    OptimizerConfig config;
    config.rules["lunch_break"] = RuleSetting{};
    EXPECT_THROW(validateConfig(config), ConfigurationError);

    // Disabled rules are still checked.
    config.rules["lunch_break"].enabled = false;
    EXPECT_THROW(validateConfig(config), ConfigurationError);
}

TEST(ConfigurationTest, RejectsNegativeWeightAndPriority) {
    OptimizerConfig weight;
    weight.rules["max_spacing"] = RuleSetting{true, -1, 1};
    EXPECT_THROW(validateConfig(weight), ConfigurationError);

    OptimizerConfig priority;
    priority.rules["max_spacing"] = RuleSetting{true, 1, -2};
    EXPECT_THROW(validateConfig(priority), ConfigurationError);
}

TEST(ConfigurationTest, RejectsInvalidBudgetAndTuning) {
    OptimizerConfig time;
    time.budget.maxTimeSeconds = -1;
    EXPECT_THROW(validateConfig(time), ConfigurationError);

    OptimizerConfig candidates;
    candidates.budget.maxCandidates = -5;
    EXPECT_THROW(validateConfig(candidates), ConfigurationError);

    OptimizerConfig threads;
    threads.threads = 0;
    EXPECT_THROW(validateConfig(threads), ConfigurationError);

    OptimizerConfig schedules;
    schedules.numSchedules = 0;
    EXPECT_THROW(validateConfig(schedules), ConfigurationError);

    OptimizerConfig spacing;
    spacing.maxSpacingDays = 5;
    EXPECT_THROW(validateConfig(spacing), ConfigurationError);
}
