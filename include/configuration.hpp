#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "logging.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>


///////////////////////////
///     SOFT RULES      ///
///////////////////////////
/**
 * @brief Every bundled soft constraint.
 */
enum class SoftRuleKind {
    NON_MORNING_CLASS,
    CURRICULUM_CONFLICT,
    DIFFERENT_PARTS_OF_DAY,
    FRIDAY_AFTERNOON,
    TEACHER_PREFERENCE,
    MAX_SPACING,
    SCIENCE_STATISTICS_CONFLICT
};

/// All rule kinds in declaration order.
const std::vector<SoftRuleKind>& allSoftRules();

/// Configuration name of a rule (e.g. "non_morning_class").
const char* ruleName(SoftRuleKind kind);

/// Inverse of ruleName(); std::nullopt for unknown names.
std::optional<SoftRuleKind> parseRuleName(const std::string& name);


///////////////////////////
///    CONFIGURATION    ///
///////////////////////////
/**
 * @brief User setting of one soft rule.
 */
struct RuleSetting {
    bool enabled = true;
    long long weight = 1; ///< Cost per violation witness; must be >= 0.
    int priority = 1; ///< Optimization layer; higher layers are minimized first.
};

/**
 * @brief Resource budget of a solve; 0 disables a limit.
 */
struct SearchBudget {
    double maxTimeSeconds = 30.0; ///< Wall-clock limit.
    long long maxCandidates = 0; ///< Complete timetables to examine.
    long long maxNodes = 0; ///< Search-tree nodes to expand.
};

/**
 * @brief Weighting, budget and tuning options of the optimizer.
 */
struct OptimizerConfig {
    /// Rule name -> setting. Rules absent from the map are disabled.
    std::map<std::string, RuleSetting> rules;

    SearchBudget budget;

    int threads = 1; ///< Worker threads for the parallel front ends.

    int numSchedules = 1; ///< Best distinct timetables to report, in cost order.

    /// max_spacing: meetings of a unit may be at most this many weekdays apart.
    int maxSpacingDays = 3;

    /// Curricula whose courses must not collide with required later-semester courses.
    std::vector<std::string> scienceCurricula{"sciences", "statistics"};

    /// Required courses from this ideal semester on are protected by the rule above.
    int scienceMinSemester = 2;

    LogLevel logLevel = LogLevel::INFO;
};

/**
 * @brief An enabled rule with its validated weight and priority.
 */
struct ActiveRule {
    SoftRuleKind kind;
    long long weight;
    int priority;
};

/**
 * @brief Check a configuration and list its enabled rules.
 *
 * Throws ConfigurationError on unknown rule names, negative weights or
 * priorities, or an invalid budget / tuning value. The result is sorted by
 * descending priority, then by rule kind.
 */
std::vector<ActiveRule> validateConfig(const OptimizerConfig& config);

/**
 * @brief The bundled preset: every rule enabled with department defaults.
 */
OptimizerConfig defaultConfig();
