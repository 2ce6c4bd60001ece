#include "analytics/suggestions.hpp"
#include <sstream>

namespace analytics {

namespace {

constexpr std::size_t kSummaryCategories = 6;

class RuleEvaluator {
private:
    const MonthlyAggregate& aggregate_;
    const common::Preferences& preferences_;
    std::vector<Tip>& tips_;

    std::string money(const common::Money& amount) const {
        return amount.format(preferences_.currencySymbol);
    }

    bool hasIncome() const { return aggregate_.totalIncome.getCents() > 0; }

    // balance / income compared with percent / 100, in exact cents.
    int compareSavings(int percent) const {
        const std::int64_t lhs = aggregate_.balance.getCents() * 100;
        const std::int64_t rhs = aggregate_.totalIncome.getCents() * percent;
        return lhs < rhs ? -1 : (lhs > rhs ? 1 : 0);
    }

    int savingsPercent() const {
        return sharePercent(aggregate_.balance, aggregate_.totalIncome);
    }

public:
    RuleEvaluator(const MonthlyAggregate& aggregate, const common::Preferences& preferences,
                  std::vector<Tip>& tips)
        : aggregate_(aggregate), preferences_(preferences), tips_(tips) {}

    void operator()(const OverspendingRule&) const {
        if (aggregate_.totalExpense <= aggregate_.totalIncome) {
            return;
        }
        const common::Money excess = aggregate_.totalExpense - aggregate_.totalIncome;
        tips_.push_back({TipKind::Overspending, TipSeverity::Critical,
                         "You are overspending this month: expenditure exceeds income by " +
                             money(excess) + ". Review your top categories and cut back where possible."});
    }

    void operator()(const BudgetOverrunRule&) const {
        const common::Money& budget = preferences_.defaultMonthlyBudget;
        if (budget.getCents() <= 0 || aggregate_.totalExpense <= budget) {
            return;
        }
        const common::Money overrun = aggregate_.totalExpense - budget;
        tips_.push_back({TipKind::BudgetOverrun, TipSeverity::Warning,
                         "Monthly budget of " + money(budget) + " exceeded by " + money(overrun) + "."});
    }

    void operator()(const LowSavingsRule& rule) const {
        if (!hasIncome() || compareSavings(rule.thresholdPercent) >= 0) {
            return;
        }
        tips_.push_back({TipKind::LowSavings, TipSeverity::Advice,
                         "You are saving " + std::to_string(savingsPercent()) +
                             "% of your income this month. Aim for at least " +
                             std::to_string(rule.thresholdPercent) + "% by trimming discretionary spending."});
    }

    void operator()(const HighSavingsRule& rule) const {
        if (!hasIncome() || compareSavings(rule.thresholdPercent) < 0) {
            return;
        }
        tips_.push_back({TipKind::HighSavings, TipSeverity::Positive,
                         "Great! You are saving " + std::to_string(savingsPercent()) + "% of your income (" +
                             money(aggregate_.balance) + " available). Consider an automated SIP."});
    }

    void operator()(const CategoryShareRule& rule) const {
        if (rule.count == 0 || aggregate_.totalExpense.getCents() <= 0) {
            return;
        }
        const auto ranked = rankCategories(aggregate_.categoryTotals, rule.count);
        for (const auto& entry : ranked) {
            tips_.push_back({TipKind::CategoryShare, TipSeverity::Info,
                             entry.category + " accounts for " +
                                 std::to_string(sharePercent(entry.amount, aggregate_.totalExpense)) +
                                 "% of this month's spending (" + money(entry.amount) + ")."});
        }
    }
};

}

std::vector<Rule> defaultRules(const SuggestionThresholds& thresholds) {
    return {
        OverspendingRule{},
        BudgetOverrunRule{},
        LowSavingsRule{thresholds.lowSavingsPercent},
        HighSavingsRule{thresholds.highSavingsPercent},
        CategoryShareRule{thresholds.categoryTips},
    };
}

SuggestionReport suggest(const MonthlyAggregate& aggregate,
                         const common::Preferences& preferences,
                         const std::vector<Rule>& rules) {
    SuggestionReport report;
    report.aggregate = aggregate;
    report.savingsRate = savingsRate(aggregate);

    const RuleEvaluator evaluator(aggregate, preferences, report.tips);
    for (const auto& rule : rules) {
        std::visit(evaluator, rule);
    }
    return report;
}

SuggestionReport suggest(const MonthlyAggregate& aggregate,
                         const common::Preferences& preferences,
                         const SuggestionThresholds& thresholds) {
    return suggest(aggregate, preferences, defaultRules(thresholds));
}

const char* toString(TipSeverity severity) {
    switch (severity) {
        case TipSeverity::Critical: return "Alert";
        case TipSeverity::Warning: return "Warning";
        case TipSeverity::Advice: return "Advice";
        case TipSeverity::Positive: return "Good";
        case TipSeverity::Info: return "Info";
    }
    return "Info";
}

std::string formatSummary(const SuggestionReport& report, const common::Preferences& preferences) {
    const auto& aggregate = report.aggregate;
    const std::string& symbol = preferences.currencySymbol;

    std::ostringstream os;
    os << "Month: " << aggregate.month.toString() << "\n";
    os << "Income: " << aggregate.totalIncome.format(symbol) << "\n";
    os << "Expenditure: " << aggregate.totalExpense.format(symbol) << "\n";
    os << "Balance: " << aggregate.balance.format(symbol) << "\n";
    if (report.savingsRate) {
        os << "Savings rate: " << sharePercent(aggregate.balance, aggregate.totalIncome) << "%\n";
    }
    os << "\n";

    if (aggregate.totalIncome.isZero()) {
        os << "No income set for this month.\n"
           << "Set monthly income to enable better insights.\n\n";
    }

    if (!aggregate.categoryTotals.empty()) {
        os << "This month's top categories:\n";
        for (const auto& entry : rankCategories(aggregate.categoryTotals, kSummaryCategories)) {
            os << "  • " << entry.category << ": " << entry.amount.format(symbol) << "\n";
        }
        os << "\n";
    }

    if (!report.tips.empty()) {
        os << "Suggestions:\n";
        for (const auto& tip : report.tips) {
            os << "  [" << toString(tip.severity) << "] " << tip.text << "\n";
        }
    }

    return os.str();
}

}
