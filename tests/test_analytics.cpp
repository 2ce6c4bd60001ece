/*
 * Filename: test_analytics.cpp
 * Developer: Benjamin Cance
 * Date: 10/19/2026
 * 
 * Copyright 2026 Open Quant Desk, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "analytics/aggregation.hpp"
#include "analytics/suggestions.hpp"
#include "test_harness.hpp"

using analytics::TipKind;
using common::Money;
using common::MonthKey;

namespace {

common::ExpenseRecord expense(int y, int m, int d, const std::string& category, std::int64_t units) {
    common::ExpenseRecord record;
    record.date = common::CalendarDate(y, m, d);
    record.category = category;
    record.amount = Money::fromUnits(units);
    return record;
}

std::vector<common::ExpenseRecord> marchRecords() {
    return {
        expense(2025, 3, 2, "Food", 250),
        expense(2025, 3, 10, "Transport", 120),
        expense(2025, 3, 15, "Food", 150),
        expense(2025, 4, 1, "Food", 999),
    };
}

std::size_t countTips(const analytics::SuggestionReport& report, TipKind kind) {
    std::size_t count = 0;
    for (const auto& tip : report.tips) {
        if (tip.kind == kind) {
            ++count;
        }
    }
    return count;
}

}

TEST(test_month_totals_by_category) {
    const auto result = analytics::aggregate(marchRecords(), Money::fromUnits(1000), MonthKey(2025, 3));
    ASSERT_EQ(result.expenseCount, std::size_t(3));
    ASSERT_EQ(result.totalExpense.getCents(), std::int64_t(52000));
    ASSERT_EQ(result.balance.getCents(), std::int64_t(48000));
    ASSERT_EQ(result.categoryTotals.size(), std::size_t(2));
    ASSERT_EQ(result.topCategories.size(), std::size_t(2));
    ASSERT_EQ(result.topCategories[0].category, std::string("Food"));
    ASSERT_EQ(result.topCategories[0].amount.getCents(), std::int64_t(40000));
    ASSERT_EQ(result.topCategories[1].category, std::string("Transport"));
}

TEST(test_empty_month) {
    const auto result = analytics::aggregate(marchRecords(), Money(), MonthKey(2025, 5));
    ASSERT_EQ(result.expenseCount, std::size_t(0));
    ASSERT_TRUE(result.totalExpense.isZero());
    ASSERT_TRUE(result.topCategories.empty());
    ASSERT_FALSE(analytics::savingsRate(result).has_value());
}

TEST(test_ranking_ties_break_by_name) {
    std::map<std::string, Money> totals = {
        {"Rent", Money::fromUnits(100)}, {"Food", Money::fromUnits(100)}, {"Gym", Money::fromUnits(300)}};
    const auto ranked = analytics::rankCategories(totals, 2);
    ASSERT_EQ(ranked.size(), std::size_t(2));
    ASSERT_EQ(ranked[0].category, std::string("Gym"));
    ASSERT_EQ(ranked[1].category, std::string("Food"));
}

TEST(test_share_slices_fold_into_others) {
    std::map<std::string, Money> totals;
    for (int i = 0; i < 8; ++i) {
        totals["C" + std::to_string(i)] = Money::fromUnits(10 * (i + 1));
    }
    const auto slices = analytics::shareSlices(totals, 6);
    ASSERT_EQ(slices.size(), std::size_t(7));
    ASSERT_EQ(slices.back().category, std::string("Others"));
    ASSERT_EQ(slices.back().amount.getCents(), std::int64_t(3000));
}

TEST(test_aggregate_all_months_in_order) {
    std::map<MonthKey, Money> income = {{MonthKey(2025, 2), Money::fromUnits(10)}};
    const auto all = analytics::aggregateAll(marchRecords(), income);
    ASSERT_EQ(all.size(), std::size_t(3));
    ASSERT_EQ(all[0].month.toString(), std::string("2025-02"));
    ASSERT_EQ(all[2].month.toString(), std::string("2025-04"));
    ASSERT_EQ(all[2].totalExpense.getCents(), std::int64_t(99900));
}

TEST(test_share_percent_rounding) {
    ASSERT_EQ(analytics::sharePercent(Money::fromUnits(400), Money::fromUnits(520)), 77);
    ASSERT_EQ(analytics::sharePercent(Money::fromUnits(1), Money::fromUnits(8)), 13);
    ASSERT_EQ(analytics::sharePercent(Money::fromUnits(5), Money()), 0);
}

TEST(test_high_savings_and_category_tips) {
    const auto aggregate = analytics::aggregate(marchRecords(), Money::fromUnits(1000), MonthKey(2025, 3));
    const auto report = analytics::suggest(aggregate, common::Preferences());
    ASSERT_EQ(countTips(report, TipKind::HighSavings), std::size_t(1));
    ASSERT_EQ(countTips(report, TipKind::Overspending), std::size_t(0));
    ASSERT_EQ(countTips(report, TipKind::CategoryShare), std::size_t(2));
    ASSERT_EQ(report.tips.back().text,
              std::string("Transport accounts for 23% of this month's spending (₹120.00)."));
}

TEST(test_overspending_without_income) {
    const auto aggregate = analytics::aggregate(marchRecords(), Money(), MonthKey(2025, 3));
    const auto report = analytics::suggest(aggregate, common::Preferences());
    ASSERT_TRUE(!report.tips.empty());
    ASSERT_TRUE(report.tips.front().kind == TipKind::Overspending);
    ASSERT_EQ(countTips(report, TipKind::LowSavings), std::size_t(0));
    ASSERT_EQ(countTips(report, TipKind::HighSavings), std::size_t(0));
}

TEST(test_low_savings_and_budget_overrun) {
    common::Preferences preferences;
    preferences.defaultMonthlyBudget = Money::fromUnits(400);
    const auto aggregate = analytics::aggregate(marchRecords(), Money::fromUnits(540), MonthKey(2025, 3));
    const auto report = analytics::suggest(aggregate, preferences);
    ASSERT_EQ(countTips(report, TipKind::BudgetOverrun), std::size_t(1));
    ASSERT_EQ(countTips(report, TipKind::LowSavings), std::size_t(1));
    ASSERT_EQ(report.tips[0].text, std::string("Monthly budget of ₹400.00 exceeded by ₹120.00."));
}

TEST(test_suggestions_are_deterministic) {
    const auto aggregate = analytics::aggregate(marchRecords(), Money::fromUnits(600), MonthKey(2025, 3));
    const auto first = analytics::suggest(aggregate, common::Preferences());
    const auto second = analytics::suggest(aggregate, common::Preferences());
    ASSERT_TRUE(first.tips == second.tips);
    ASSERT_EQ(analytics::formatSummary(first, common::Preferences()),
              analytics::formatSummary(second, common::Preferences()));
}

TEST(test_custom_rule_set) {
    const auto aggregate = analytics::aggregate(marchRecords(), Money(), MonthKey(2025, 3));
    const auto report = analytics::suggest(aggregate, common::Preferences(), {analytics::CategoryShareRule{1}});
    ASSERT_EQ(report.tips.size(), std::size_t(1));
    ASSERT_TRUE(report.tips[0].kind == TipKind::CategoryShare);
}

TEST(test_summary_mentions_missing_income) {
    const auto aggregate = analytics::aggregate(marchRecords(), Money(), MonthKey(2025, 3));
    const auto text = analytics::formatSummary(analytics::suggest(aggregate, common::Preferences()),
                                               common::Preferences());
    ASSERT_TRUE(text.find("No income set for this month.") != std::string::npos);
    ASSERT_TRUE(text.find("Expenditure: ₹520.00") != std::string::npos);
    ASSERT_TRUE(text.find("Savings rate") == std::string::npos);
}

TEST(test_no_tips_without_income_or_expenses) {
    const auto aggregate = analytics::aggregate({}, Money(), MonthKey(2025, 6));
    const auto report = analytics::suggest(aggregate, common::Preferences());
    ASSERT_TRUE(report.tips.empty());
    ASSERT_FALSE(report.savingsRate.has_value());
}

TEST(test_category_tips_capped_at_three) {
    const std::vector<common::ExpenseRecord> records = {
        expense(2025, 6, 1, "Rent", 400),
        expense(2025, 6, 2, "Food", 300),
        expense(2025, 6, 3, "Transport", 200),
        expense(2025, 6, 4, "Gym", 100),
    };
    const auto aggregate = analytics::aggregate(records, Money::fromUnits(2000), MonthKey(2025, 6));
    const auto report = analytics::suggest(aggregate, common::Preferences());
    ASSERT_EQ(countTips(report, TipKind::CategoryShare), std::size_t(3));
    ASSERT_EQ(report.tips.back().text,
              std::string("Transport accounts for 20% of this month's spending (₹200.00)."));
    for (const auto& tip : report.tips) {
        ASSERT_TRUE(tip.text.find("Gym") == std::string::npos);
    }
}

TEST(test_january_half_saved) {
    const std::vector<common::ExpenseRecord> records = {
        expense(2024, 1, 5, "Food", 500),
        expense(2024, 1, 12, "Food", 300),
        expense(2024, 1, 20, "Transport", 200),
    };
    const auto aggregate = analytics::aggregate(records, Money::fromUnits(2000), MonthKey(2024, 1));
    ASSERT_EQ(aggregate.totalExpense.getCents(), std::int64_t(100000));
    ASSERT_EQ(aggregate.balance.getCents(), std::int64_t(100000));

    const auto report = analytics::suggest(aggregate, common::Preferences());
    ASSERT_TRUE(report.savingsRate.has_value());
    ASSERT_NEAR(*report.savingsRate, 0.5, 1e-9);
    ASSERT_EQ(countTips(report, TipKind::HighSavings), std::size_t(1));
    ASSERT_EQ(countTips(report, TipKind::Overspending), std::size_t(0));
    ASSERT_EQ(countTips(report, TipKind::LowSavings), std::size_t(0));
    ASSERT_EQ(countTips(report, TipKind::CategoryShare), std::size_t(2));
}

int main() {
    std::cout << "Aggregation and suggestion tests:\n";
    RUN_TEST(test_month_totals_by_category);
    RUN_TEST(test_empty_month);
    RUN_TEST(test_ranking_ties_break_by_name);
    RUN_TEST(test_share_slices_fold_into_others);
    RUN_TEST(test_aggregate_all_months_in_order);
    RUN_TEST(test_share_percent_rounding);
    RUN_TEST(test_high_savings_and_category_tips);
    RUN_TEST(test_overspending_without_income);
    RUN_TEST(test_low_savings_and_budget_overrun);
    RUN_TEST(test_suggestions_are_deterministic);
    RUN_TEST(test_custom_rule_set);
    RUN_TEST(test_summary_mentions_missing_income);
    RUN_TEST(test_no_tips_without_income_or_expenses);
    RUN_TEST(test_category_tips_capped_at_three);
    RUN_TEST(test_january_half_saved);
    return TEST_RESULT();
}
