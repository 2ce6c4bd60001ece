/*
 * Filename: test_storage.cpp
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

#include "storage/atomic_file.hpp"
#include "storage/csv.hpp"
#include "storage/preferences_store.hpp"
#include "storage/record_store.hpp"
#include "test_harness.hpp"

using testing::TempDir;
using testing::readText;
using testing::writeText;

namespace {

common::ExpenseRecord expense(int y, int m, int d, const std::string& category, std::int64_t cents,
                              const std::string& note = "") {
    common::ExpenseRecord record;
    record.date = common::CalendarDate(y, m, d);
    record.category = category;
    record.amount = common::Money::fromCents(cents);
    record.note = note;
    return record;
}

}

TEST(test_csv_quoted_fields) {
    auto parsed = storage::csv::parse("\xEF\xBB\xBF" "a,b\r\n\"x, y\",\"say \"\"hi\"\"\nagain\"\n\n1,2");
    ASSERT_OK(parsed);
    const auto& lines = common::getValue(parsed);
    ASSERT_EQ(lines.size(), std::size_t(3));
    ASSERT_EQ(lines[1].fields[0], std::string("x, y"));
    ASSERT_EQ(lines[1].fields[1], std::string("say \"hi\"\nagain"));
    ASSERT_EQ(lines[1].number, std::size_t(2));
    ASSERT_EQ(lines[2].number, std::size_t(5));
}

TEST(test_csv_rejects_unterminated_quote) {
    ASSERT_ERROR(storage::csv::parse("a,\"open\n"), common::ErrorKind::Storage);
}

TEST(test_csv_format_quotes_when_needed) {
    const auto text = storage::csv::format({{"date", "note"}, {"2025-01-02", "tea, biscuits"}});
    ASSERT_EQ(text, std::string("date,note\n2025-01-02,\"tea, biscuits\"\n"));
}

TEST(test_atomic_write_leaves_no_partial) {
    TempDir dir;
    const auto target = dir / "out.txt";
    ASSERT_OK(storage::writeFileAtomically(target, "first"));
    ASSERT_OK(storage::writeFileAtomically(target, "second"));
    ASSERT_EQ(readText(target), std::string("second"));
    ASSERT_FALSE(std::filesystem::exists(storage::partialPathFor(target)));
    ASSERT_ERROR(storage::readFile(dir / "missing.txt"), common::ErrorKind::NotFound);
}

TEST(test_first_run_creates_files) {
    TempDir dir;
    storage::RecordStore store(dir / "expenses.csv", dir / "income.csv");
    ASSERT_OK(store.load());
    ASSERT_EQ(store.expenseCount(), std::size_t(0));
    ASSERT_EQ(readText(dir / "expenses.csv"), std::string("date,category,amount,currency_symbol,note\n"));
    ASSERT_EQ(readText(dir / "income.csv"), std::string("month,amount\n"));
}

TEST(test_records_survive_reload) {
    TempDir dir;
    {
        storage::RecordStore store(dir / "expenses.csv", dir / "income.csv");
        ASSERT_OK(store.load());
        ASSERT_OK(store.addExpense(expense(2025, 3, 2, "Food", 25050, "lunch, with team")));
        ASSERT_OK(store.addExpense(expense(2025, 3, 5, "Transport", 12000)));
        ASSERT_OK(store.setIncome(common::MonthKey(2025, 3), common::Money::fromUnits(50000)));
    }

    storage::RecordStore reopened(dir / "expenses.csv", dir / "income.csv");
    ASSERT_OK(reopened.load());
    ASSERT_EQ(reopened.expenseCount(), std::size_t(2));
    auto first = reopened.getExpense(0);
    ASSERT_OK(first);
    ASSERT_TRUE(common::getValue(first) == expense(2025, 3, 2, "Food", 25050, "lunch, with team"));
    ASSERT_EQ(reopened.incomeFor(common::MonthKey(2025, 3)).getCents(), 5000000);
    ASSERT_TRUE(reopened.incomeFor(common::MonthKey(2025, 4)).isZero());
}

TEST(test_update_and_delete_by_position) {
    TempDir dir;
    storage::RecordStore store(dir / "expenses.csv", dir / "income.csv");
    ASSERT_OK(store.load());
    ASSERT_OK(store.addExpense(expense(2025, 1, 1, "Food", 100)));
    ASSERT_OK(store.addExpense(expense(2025, 1, 2, "Rent", 200)));

    ASSERT_OK(store.updateExpense(1, expense(2025, 1, 3, "Rent", 300)));
    ASSERT_EQ(common::getValue(store.getExpense(1)).amount.getCents(), std::int64_t(300));

    ASSERT_OK(store.deleteExpense(0));
    ASSERT_EQ(store.expenseCount(), std::size_t(1));
    ASSERT_EQ(common::getValue(store.getExpense(0)).category, std::string("Rent"));

    ASSERT_ERROR(store.deleteExpense(5), common::ErrorKind::NotFound);
    ASSERT_ERROR(store.updateExpense(5, expense(2025, 1, 3, "Rent", 300)), common::ErrorKind::NotFound);
}

TEST(test_rejects_invalid_expense) {
    TempDir dir;
    storage::RecordStore store(dir / "expenses.csv", dir / "income.csv");
    ASSERT_OK(store.load());
    ASSERT_ERROR(store.addExpense(expense(2025, 1, 1, "Food", -100)), common::ErrorKind::Validation);
    ASSERT_ERROR(store.addExpense(expense(2025, 2, 30, "Food", 100)), common::ErrorKind::Validation);
    ASSERT_EQ(store.expenseCount(), std::size_t(0));
}

TEST(test_loads_legacy_layout) {
    TempDir dir;
    writeText(dir / "expenses.csv",
              "Date,Category,Amount,Note\n"
              "2024-11-03,Groceries,₹500.00,weekly\n"
              "2024-11-04, ,AED 12,\n");
    writeText(dir / "income.csv", "Month,Income\n2024-11,\"30,000\"\n");

    storage::RecordStore store(dir / "expenses.csv", dir / "income.csv");
    ASSERT_OK(store.load());
    ASSERT_EQ(store.expenseCount(), std::size_t(2));

    const auto first = common::getValue(store.getExpense(0));
    ASSERT_EQ(first.amount.getCents(), std::int64_t(50000));
    ASSERT_EQ(first.currencySymbol, std::string("₹"));
    const auto second = common::getValue(store.getExpense(1));
    ASSERT_EQ(second.category, std::string("Uncategorized"));
    ASSERT_EQ(second.currencySymbol, std::string("AED"));
    ASSERT_EQ(store.incomeFor(common::MonthKey(2024, 11)).getCents(), std::int64_t(3000000));
}

TEST(test_bad_row_is_storage_error) {
    TempDir dir;
    writeText(dir / "expenses.csv", "date,category,amount\n2024-13-01,Food,10\n");
    storage::RecordStore store(dir / "expenses.csv", dir / "income.csv");
    ASSERT_ERROR(store.load(), common::ErrorKind::Storage);
}

TEST(test_preferences_defaults_and_update) {
    TempDir dir;
    storage::PreferencesStore store(dir / "preferences.json");
    auto defaults = store.get();
    ASSERT_OK(defaults);
    ASSERT_EQ(common::getValue(defaults).currencySymbol, std::string("₹"));
    ASSERT_TRUE(std::filesystem::exists(dir / "preferences.json"));

    common::Preferences updated;
    updated.currencySymbol = " $ ";
    updated.defaultMonthlyBudget = common::Money::fromUnits(2000);
    ASSERT_OK(store.set(updated));

    storage::PreferencesStore reopened(dir / "preferences.json");
    auto loaded = reopened.get();
    ASSERT_OK(loaded);
    ASSERT_EQ(common::getValue(loaded).currencySymbol, std::string("$"));
    ASSERT_EQ(common::getValue(loaded).defaultMonthlyBudget.getCents(), std::int64_t(200000));
}

TEST(test_preferences_validation) {
    TempDir dir;
    storage::PreferencesStore store(dir / "preferences.json");
    common::Preferences blank;
    blank.currencySymbol = "  ";
    ASSERT_ERROR(store.set(blank), common::ErrorKind::Validation);

    common::Preferences negative;
    negative.defaultMonthlyBudget = common::Money::fromCents(-1);
    ASSERT_ERROR(store.set(negative), common::ErrorKind::Validation);

    writeText(dir / "huge.json", "{\"currency_symbol\": \"$\", \"default_monthly_budget\": 1e30}");
    storage::PreferencesStore huge(dir / "huge.json");
    ASSERT_ERROR(huge.get(), common::ErrorKind::Storage);

    writeText(dir / "broken.json", "{ not json");
    storage::PreferencesStore broken(dir / "broken.json");
    ASSERT_ERROR(broken.get(), common::ErrorKind::Storage);
}

int main() {
    std::cout << "Storage tests:\n";
    RUN_TEST(test_csv_quoted_fields);
    RUN_TEST(test_csv_rejects_unterminated_quote);
    RUN_TEST(test_csv_format_quotes_when_needed);
    RUN_TEST(test_atomic_write_leaves_no_partial);
    RUN_TEST(test_first_run_creates_files);
    RUN_TEST(test_records_survive_reload);
    RUN_TEST(test_update_and_delete_by_position);
    RUN_TEST(test_rejects_invalid_expense);
    RUN_TEST(test_loads_legacy_layout);
    RUN_TEST(test_bad_row_is_storage_error);
    RUN_TEST(test_preferences_defaults_and_update);
    RUN_TEST(test_preferences_validation);
    return TEST_RESULT();
}
