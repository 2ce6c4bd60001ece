#include "analytics/aggregation.hpp"
#include <algorithm>
#include <set>

namespace analytics {

namespace {

const std::string& categoryOf(const common::ExpenseRecord& record) {
    return record.category.empty() ? common::kUncategorized : record.category;
}

}

MonthlyAggregate aggregate(const std::vector<common::ExpenseRecord>& records,
                           const common::Money& income,
                           const common::MonthKey& month,
                           std::size_t topN) {
    MonthlyAggregate result;
    result.month = month;
    result.totalIncome = income;

    for (const auto& record : records) {
        if (record.month() != month) {
            continue;
        }
        result.totalExpense += record.amount;
        result.categoryTotals[categoryOf(record)] += record.amount;
        ++result.expenseCount;
    }

    result.balance = result.totalIncome - result.totalExpense;
    result.topCategories = rankCategories(result.categoryTotals, topN);
    return result;
}

std::vector<MonthlyAggregate> aggregateAll(const std::vector<common::ExpenseRecord>& records,
                                           const std::map<common::MonthKey, common::Money>& incomeByMonth,
                                           std::size_t topN) {
    std::set<common::MonthKey> months;
    for (const auto& record : records) {
        months.insert(record.month());
    }
    for (const auto& [month, amount] : incomeByMonth) {
        months.insert(month);
    }

    std::map<common::MonthKey, std::vector<common::ExpenseRecord>> byMonth;
    for (const auto& record : records) {
        byMonth[record.month()].push_back(record);
    }

    std::vector<MonthlyAggregate> aggregates;
    aggregates.reserve(months.size());
    for (const auto& month : months) {
        auto incomeIt = incomeByMonth.find(month);
        const common::Money income = incomeIt != incomeByMonth.end() ? incomeIt->second : common::Money();
        aggregates.push_back(aggregate(byMonth[month], income, month, topN));
    }
    return aggregates;
}

std::map<std::string, common::Money> categoryTotals(const std::vector<common::ExpenseRecord>& records) {
    std::map<std::string, common::Money> totals;
    for (const auto& record : records) {
        totals[categoryOf(record)] += record.amount;
    }
    return totals;
}

std::vector<CategoryAmount> rankCategories(const std::map<std::string, common::Money>& totals,
                                           std::size_t limit) {
    std::vector<CategoryAmount> ranked;
    ranked.reserve(totals.size());
    for (const auto& [category, amount] : totals) {
        ranked.push_back({category, amount});
    }

    std::sort(ranked.begin(), ranked.end(), [](const CategoryAmount& a, const CategoryAmount& b) {
        if (a.amount != b.amount) {
            return a.amount > b.amount;
        }
        return a.category < b.category;
    });

    if (limit > 0 && ranked.size() > limit) {
        ranked.resize(limit);
    }
    return ranked;
}

std::vector<CategoryAmount> shareSlices(const std::map<std::string, common::Money>& totals,
                                        std::size_t maxSlices) {
    auto ranked = rankCategories(totals);
    if (maxSlices == 0 || ranked.size() <= maxSlices) {
        return ranked;
    }

    common::Money others;
    for (std::size_t i = maxSlices; i < ranked.size(); ++i) {
        others += ranked[i].amount;
    }
    ranked.resize(maxSlices);
    ranked.push_back({kOthersLabel, others});
    return ranked;
}

std::optional<double> savingsRate(const MonthlyAggregate& aggregate) {
    if (aggregate.totalIncome.getCents() <= 0) {
        return std::nullopt;
    }
    return aggregate.balance.toDouble() / aggregate.totalIncome.toDouble();
}

int sharePercent(const common::Money& part, const common::Money& whole) {
    const std::int64_t denominator = whole.getCents();
    if (denominator == 0) {
        return 0;
    }

    const std::int64_t numerator = part.getCents() * 100;
    const bool negative = (numerator < 0) != (denominator < 0);
    const std::int64_t n = numerator < 0 ? -numerator : numerator;
    const std::int64_t d = denominator < 0 ? -denominator : denominator;
    const std::int64_t rounded = (2 * n + d) / (2 * d);
    return static_cast<int>(negative ? -rounded : rounded);
}

}
