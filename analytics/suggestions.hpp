#pragma once

#include "analytics/aggregation.hpp"
#include "common/types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace analytics {

enum class TipKind {
    Overspending, BudgetOverrun, LowSavings, HighSavings, CategoryShare
};

enum class TipSeverity {
    Critical, Warning, Advice, Positive, Info
};

struct Tip {
    TipKind kind;
    TipSeverity severity;
    std::string text;

    bool operator==(const Tip& other) const {
        return kind == other.kind && severity == other.severity && text == other.text;
    }
};

struct SuggestionThresholds {
    int lowSavingsPercent = 10;
    int highSavingsPercent = 30;
    std::size_t categoryTips = 3;
};

struct SuggestionReport {
    MonthlyAggregate aggregate;
    std::vector<Tip> tips;
    std::optional<double> savingsRate;
};

struct OverspendingRule {};
struct BudgetOverrunRule {};
struct LowSavingsRule { int thresholdPercent = 10; };
struct HighSavingsRule { int thresholdPercent = 30; };
struct CategoryShareRule { std::size_t count = 3; };

using Rule = std::variant<OverspendingRule, BudgetOverrunRule, LowSavingsRule,
                          HighSavingsRule, CategoryShareRule>;

// The standard rule set, in evaluation order.
std::vector<Rule> defaultRules(const SuggestionThresholds& thresholds = {});

// Every rule that applies contributes its tips, in rule order.
SuggestionReport suggest(const MonthlyAggregate& aggregate,
                         const common::Preferences& preferences,
                         const std::vector<Rule>& rules);

SuggestionReport suggest(const MonthlyAggregate& aggregate,
                         const common::Preferences& preferences,
                         const SuggestionThresholds& thresholds = {});

const char* toString(TipSeverity severity);

// Monthly summary as shown in the Suggestions window.
std::string formatSummary(const SuggestionReport& report, const common::Preferences& preferences);

}
