#pragma once

#include "common/types.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace analytics {

inline constexpr std::size_t kDefaultTopCategories = 5;
inline constexpr std::size_t kDefaultShareSlices = 6;
inline const std::string kOthersLabel = "Others";

struct CategoryAmount {
    std::string category;
    common::Money amount;

    bool operator==(const CategoryAmount& other) const {
        return category == other.category && amount == other.amount;
    }
};

struct MonthlyAggregate {
    common::MonthKey month;
    common::Money totalIncome;
    common::Money totalExpense;
    common::Money balance;
    std::map<std::string, common::Money> categoryTotals;
    std::vector<CategoryAmount> topCategories;
    std::size_t expenseCount = 0;
};

// Sums the records dated in `month`; records from other months are ignored.
MonthlyAggregate aggregate(const std::vector<common::ExpenseRecord>& records,
                           const common::Money& income,
                           const common::MonthKey& month,
                           std::size_t topN = kDefaultTopCategories);

// One aggregate per month present in either input, oldest first.
std::vector<MonthlyAggregate> aggregateAll(const std::vector<common::ExpenseRecord>& records,
                                           const std::map<common::MonthKey, common::Money>& incomeByMonth,
                                           std::size_t topN = kDefaultTopCategories);

std::map<std::string, common::Money> categoryTotals(const std::vector<common::ExpenseRecord>& records);

// Descending by amount, ties by category name. A limit of 0 keeps everything.
std::vector<CategoryAmount> rankCategories(const std::map<std::string, common::Money>& totals,
                                           std::size_t limit = 0);

// The largest `maxSlices` categories plus an "Others" slice for the rest.
std::vector<CategoryAmount> shareSlices(const std::map<std::string, common::Money>& totals,
                                        std::size_t maxSlices = kDefaultShareSlices);

std::optional<double> savingsRate(const MonthlyAggregate& aggregate);

// part / whole as a whole percentage, rounded half away from zero.
int sharePercent(const common::Money& part, const common::Money& whole);

}
