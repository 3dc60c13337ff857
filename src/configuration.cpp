///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "configuration.hpp"
#include "errors.hpp"
#include <algorithm>


///////////////////////////
///     SOFT RULES      ///
///////////////////////////
const std::vector<SoftRuleKind>& allSoftRules() {
    static const std::vector<SoftRuleKind> kAll = {
            SoftRuleKind::NON_MORNING_CLASS,
            SoftRuleKind::CURRICULUM_CONFLICT,
            SoftRuleKind::DIFFERENT_PARTS_OF_DAY,
            SoftRuleKind::FRIDAY_AFTERNOON,
            SoftRuleKind::TEACHER_PREFERENCE,
            SoftRuleKind::MAX_SPACING,
            SoftRuleKind::SCIENCE_STATISTICS_CONFLICT
    };
    return kAll;
}

const char* ruleName(SoftRuleKind kind) {
    switch (kind) {
        case SoftRuleKind::NON_MORNING_CLASS:           return "non_morning_class";
        case SoftRuleKind::CURRICULUM_CONFLICT:         return "curriculum_conflict";
        case SoftRuleKind::DIFFERENT_PARTS_OF_DAY:      return "different_parts_of_day";
        case SoftRuleKind::FRIDAY_AFTERNOON:            return "friday_afternoon";
        case SoftRuleKind::TEACHER_PREFERENCE:          return "teacher_preference";
        case SoftRuleKind::MAX_SPACING:                 return "max_spacing";
        case SoftRuleKind::SCIENCE_STATISTICS_CONFLICT: return "science_statistics_conflict";
    }
    return "unknown";
}

std::optional<SoftRuleKind> parseRuleName(const std::string& name) {
    for (SoftRuleKind kind : allSoftRules()) {
        if (name == ruleName(kind)) return kind;
    }
    return std::nullopt;
}


///////////////////////////
///    CONFIGURATION    ///
///////////////////////////
std::vector<ActiveRule> validateConfig(const OptimizerConfig& config) {
    std::vector<ActiveRule> active;
    for (const auto& entry : config.rules) {
        const std::string& name = entry.first;
        const RuleSetting& setting = entry.second;

        std::optional<SoftRuleKind> kind = parseRuleName(name);
        if (!kind)
            throw ConfigurationError("unknown soft rule '" + name + "'");
        if (setting.weight < 0)
            throw ConfigurationError("rule '" + name + "' has a negative weight");
        if (setting.priority < 0)
            throw ConfigurationError("rule '" + name + "' has a negative priority");

        if (setting.enabled) {
            active.push_back(ActiveRule{*kind, setting.weight, setting.priority});
        }
    }

    const SearchBudget& b = config.budget;
    if (b.maxTimeSeconds < 0)
        throw ConfigurationError("max_time must not be negative");
    if (b.maxCandidates < 0)
        throw ConfigurationError("max_candidates must not be negative");
    if (b.maxNodes < 0)
        throw ConfigurationError("max_nodes must not be negative");
    if (config.threads < 1)
        throw ConfigurationError("threads must be at least 1");
    if (config.numSchedules < 1)
        throw ConfigurationError("num_schedules must be at least 1");
    if (config.maxSpacingDays < 0 || config.maxSpacingDays >= 5)
        throw ConfigurationError("max_spacing days must be between 0 and 4");
    if (config.scienceMinSemester < 0)
        throw ConfigurationError("science minimum semester must not be negative");

    std::sort(active.begin(), active.end(), [](const ActiveRule& a, const ActiveRule& b) {
        if (a.priority != b.priority) return a.priority > b.priority;
        return static_cast<int>(a.kind) < static_cast<int>(b.kind);
    });
    return active;
}

/**
 * @brief Department preset: conflicts first, then comfort rules.
 */
OptimizerConfig defaultConfig() {
    OptimizerConfig config;
    config.rules["curriculum_conflict"]         = RuleSetting{true, 10, 3};
    config.rules["science_statistics_conflict"] = RuleSetting{true, 5, 3};
    config.rules["teacher_preference"]          = RuleSetting{true, 2, 2};
    config.rules["friday_afternoon"]            = RuleSetting{true, 2, 2};
    config.rules["different_parts_of_day"]      = RuleSetting{true, 1, 1};
    config.rules["max_spacing"]                 = RuleSetting{true, 1, 1};
    config.rules["non_morning_class"]           = RuleSetting{true, 1, 0};
    return config;
}
