/*
 * Filename: record_store.cpp
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

#include "storage/record_store.hpp"
#include "common/strings.hpp"
#include "storage/atomic_file.hpp"
#include "storage/csv.hpp"
#include <algorithm>
#include <iterator>
#include <set>
#include <spdlog/spdlog.h>

namespace storage {

namespace {

const csv::Row kExpenseHeader = {"date", "category", "amount", "currency_symbol", "note"};
const csv::Row kIncomeHeader = {"month", "amount"};

struct ColumnMap {
    std::map<std::string, std::size_t> indices;

    explicit ColumnMap(const csv::Row& header) {
        for (std::size_t i = 0; i < header.size(); ++i) {
            indices.emplace(common::normalizeKey(header[i]), i);
        }
    }

    std::optional<std::size_t> find(std::initializer_list<const char*> names) const {
        for (const char* name : names) {
            auto it = indices.find(name);
            if (it != indices.end()) {
                return it->second;
            }
        }
        return std::nullopt;
    }
};

common::Error storageError(const std::filesystem::path& path, std::size_t line, const std::string& what) {
    return common::Error{common::ErrorKind::Storage,
                         path.string() + ": line " + std::to_string(line) + ": " + what};
}

common::Result<std::vector<csv::Line>> readTable(const std::filesystem::path& path) {
    auto content = readFile(path);
    if (!common::isSuccess(content)) {
        return common::makeError<std::vector<csv::Line>>(common::getError(content));
    }

    auto lines = csv::parse(common::getValue(content));
    if (!common::isSuccess(lines)) {
        return common::makeError<std::vector<csv::Line>>(
            common::ErrorKind::Storage, path.string() + ": " + common::getError(lines).message);
    }
    return lines;
}

}

RecordStore::RecordStore(std::filesystem::path expenseFile, std::filesystem::path incomeFile)
    : expensePath_(std::move(expenseFile)), incomePath_(std::move(incomeFile)) {}

common::Status RecordStore::load() {
    auto status = loadExpenses();
    if (!common::isSuccess(status)) {
        return status;
    }

    status = loadIncome();
    if (!common::isSuccess(status)) {
        return status;
    }

    spdlog::info("Loaded {} expenses and {} income months", expenses_.size(), income_.size());
    return common::ok();
}

common::Status RecordStore::loadExpenses() {
    auto table = readTable(expensePath_);
    if (!common::isSuccess(table)) {
        const auto& error = common::getError(table);
        if (error.kind != common::ErrorKind::NotFound) {
            return common::fail(error);
        }
        spdlog::info("No expense file at {}, starting empty", expensePath_.string());
        expenses_.clear();
        return persistExpenses(expenses_);
    }

    const auto& lines = common::getValue(table);
    std::vector<common::ExpenseRecord> loaded;
    if (lines.empty()) {
        expenses_ = std::move(loaded);
        return common::ok();
    }

    const ColumnMap columns(lines.front().fields);
    const auto dateColumn = columns.find({"date"});
    const auto categoryColumn = columns.find({"category"});
    const auto amountColumn = columns.find({"amount"});
    const auto currencyColumn = columns.find({"currency_symbol", "currency"});
    const auto noteColumn = columns.find({"note", "notes"});
    if (!dateColumn || !categoryColumn || !amountColumn) {
        return common::fail(storageError(expensePath_, lines.front().number,
                                         "unrecognised header, expected date, category and amount columns"));
    }

    const std::size_t width = lines.front().fields.size();
    for (std::size_t i = 1; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (line.fields.size() != width) {
            return common::fail(storageError(expensePath_, line.number,
                                             "expected " + std::to_string(width) + " fields, found " +
                                             std::to_string(line.fields.size())));
        }

        common::ExpenseRecord record;

        auto date = common::CalendarDate::parse(line.fields[*dateColumn]);
        if (!date) {
            return common::fail(storageError(expensePath_, line.number,
                                             "invalid date '" + line.fields[*dateColumn] + "'"));
        }
        record.date = *date;

        record.category = common::trim(line.fields[*categoryColumn]);
        if (record.category.empty()) {
            record.category = common::kUncategorized;
        }

        auto amount = common::parseLabelledAmount(line.fields[*amountColumn]);
        if (!amount || amount->amount.isNegative()) {
            return common::fail(storageError(expensePath_, line.number,
                                             "invalid amount '" + line.fields[*amountColumn] + "'"));
        }
        record.amount = amount->amount;

        if (currencyColumn && !common::trim(line.fields[*currencyColumn]).empty()) {
            record.currencySymbol = common::trim(line.fields[*currencyColumn]);
        } else {
            record.currencySymbol = amount->symbol;
        }

        if (noteColumn) {
            record.note = line.fields[*noteColumn];
        }

        loaded.push_back(std::move(record));
    }

    expenses_ = std::move(loaded);
    return common::ok();
}

common::Status RecordStore::loadIncome() {
    auto table = readTable(incomePath_);
    if (!common::isSuccess(table)) {
        const auto& error = common::getError(table);
        if (error.kind != common::ErrorKind::NotFound) {
            return common::fail(error);
        }
        spdlog::info("No income file at {}, starting empty", incomePath_.string());
        income_.clear();
        return persistIncome(income_);
    }

    const auto& lines = common::getValue(table);
    std::map<common::MonthKey, common::Money> loaded;
    if (lines.empty()) {
        income_ = std::move(loaded);
        return common::ok();
    }

    const ColumnMap columns(lines.front().fields);
    const auto monthColumn = columns.find({"month"});
    const auto amountColumn = columns.find({"amount", "income"});
    if (!monthColumn || !amountColumn) {
        return common::fail(storageError(incomePath_, lines.front().number,
                                         "unrecognised header, expected month and amount columns"));
    }

    const std::size_t width = lines.front().fields.size();
    for (std::size_t i = 1; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (line.fields.size() != width) {
            return common::fail(storageError(incomePath_, line.number,
                                             "expected " + std::to_string(width) + " fields, found " +
                                             std::to_string(line.fields.size())));
        }

        auto month = common::MonthKey::parse(line.fields[*monthColumn]);
        if (!month) {
            return common::fail(storageError(incomePath_, line.number,
                                             "invalid month '" + line.fields[*monthColumn] + "'"));
        }

        auto amount = common::parseLabelledAmount(line.fields[*amountColumn]);
        if (!amount || amount->amount.isNegative()) {
            return common::fail(storageError(incomePath_, line.number,
                                             "invalid amount '" + line.fields[*amountColumn] + "'"));
        }

        loaded[*month] = amount->amount;
    }

    income_ = std::move(loaded);
    return common::ok();
}

common::Status RecordStore::validate(const common::ExpenseRecord& record) {
    if (!record.date.isValid()) {
        return common::fail(common::ErrorKind::Validation,
                            "invalid date " + record.date.toString());
    }
    if (common::trim(record.category).empty()) {
        return common::fail(common::ErrorKind::Validation, "category must not be empty");
    }
    if (record.amount.isNegative()) {
        return common::fail(common::ErrorKind::Validation, "amount must not be negative");
    }
    return common::ok();
}

common::Result<RecordId> RecordStore::addExpense(const common::ExpenseRecord& record) {
    auto status = validate(record);
    if (!common::isSuccess(status)) {
        return common::makeError<RecordId>(common::getError(status));
    }

    auto updated = expenses_;
    updated.push_back(record);
    updated.back().category = common::trim(record.category);

    status = persistExpenses(updated);
    if (!common::isSuccess(status)) {
        return common::makeError<RecordId>(common::getError(status));
    }

    expenses_ = std::move(updated);
    spdlog::debug("Added expense #{} {} {} {}", expenses_.size() - 1, record.date.toString(),
                  record.category, record.amount.toString());
    return common::makeSuccess(static_cast<RecordId>(expenses_.size() - 1));
}

common::Status RecordStore::updateExpense(RecordId id, const common::ExpenseRecord& record) {
    if (id >= expenses_.size()) {
        return common::fail(common::ErrorKind::NotFound,
                            "expense #" + std::to_string(id) + " does not exist");
    }

    auto status = validate(record);
    if (!common::isSuccess(status)) {
        return status;
    }

    auto updated = expenses_;
    updated[id] = record;
    updated[id].category = common::trim(record.category);

    status = persistExpenses(updated);
    if (!common::isSuccess(status)) {
        return status;
    }

    expenses_ = std::move(updated);
    spdlog::debug("Updated expense #{}", id);
    return common::ok();
}

common::Status RecordStore::deleteExpense(RecordId id) {
    if (id >= expenses_.size()) {
        return common::fail(common::ErrorKind::NotFound,
                            "expense #" + std::to_string(id) + " does not exist");
    }

    auto updated = expenses_;
    updated.erase(updated.begin() + static_cast<std::ptrdiff_t>(id));

    auto status = persistExpenses(updated);
    if (!common::isSuccess(status)) {
        return status;
    }

    expenses_ = std::move(updated);
    spdlog::debug("Deleted expense #{}", id);
    return common::ok();
}

common::Result<common::ExpenseRecord> RecordStore::getExpense(RecordId id) const {
    if (id >= expenses_.size()) {
        return common::makeError<common::ExpenseRecord>(
            common::ErrorKind::NotFound, "expense #" + std::to_string(id) + " does not exist");
    }
    return expenses_[id];
}

std::vector<common::ExpenseRecord> RecordStore::listExpenses(
    const std::optional<common::MonthKey>& month) const {
    if (!month) {
        return expenses_;
    }

    std::vector<common::ExpenseRecord> filtered;
    std::copy_if(expenses_.begin(), expenses_.end(), std::back_inserter(filtered),
                 [&](const common::ExpenseRecord& record) { return record.month() == *month; });
    return filtered;
}

common::Status RecordStore::setIncome(const common::MonthKey& month, const common::Money& amount) {
    if (!month.isValid()) {
        return common::fail(common::ErrorKind::Validation, "invalid month " + month.toString());
    }
    if (amount.isNegative()) {
        return common::fail(common::ErrorKind::Validation, "income must not be negative");
    }

    auto updated = income_;
    updated[month] = amount;

    auto status = persistIncome(updated);
    if (!common::isSuccess(status)) {
        return status;
    }

    income_ = std::move(updated);
    spdlog::debug("Income for {} set to {}", month.toString(), amount.toString());
    return common::ok();
}

common::Money RecordStore::incomeFor(const common::MonthKey& month) const {
    auto it = income_.find(month);
    return it != income_.end() ? it->second : common::Money();
}

std::vector<common::MonthKey> RecordStore::months() const {
    std::set<common::MonthKey> distinct;
    for (const auto& record : expenses_) {
        distinct.insert(record.month());
    }
    for (const auto& [month, amount] : income_) {
        distinct.insert(month);
    }
    return std::vector<common::MonthKey>(distinct.begin(), distinct.end());
}

StoreSnapshot RecordStore::snapshot() const {
    return StoreSnapshot{expenses_, income_};
}

common::Status RecordStore::persistExpenses(const std::vector<common::ExpenseRecord>& expenses) const {
    auto status = writeFileAtomically(expensePath_, serializeExpenses(expenses));
    if (!common::isSuccess(status)) {
        spdlog::error("Saving expenses failed: {}", common::getError(status).message);
    }
    return status;
}

common::Status RecordStore::persistIncome(const std::map<common::MonthKey, common::Money>& income) const {
    auto status = writeFileAtomically(incomePath_, serializeIncome(income));
    if (!common::isSuccess(status)) {
        spdlog::error("Saving income failed: {}", common::getError(status).message);
    }
    return status;
}

std::string serializeExpenses(const std::vector<common::ExpenseRecord>& expenses) {
    std::vector<csv::Row> rows;
    rows.reserve(expenses.size() + 1);
    rows.push_back(kExpenseHeader);
    for (const auto& record : expenses) {
        rows.push_back({record.date.toString(), record.category, record.amount.toString(),
                        record.currencySymbol, record.note});
    }
    return csv::format(rows);
}

std::string serializeIncome(const std::map<common::MonthKey, common::Money>& income) {
    std::vector<csv::Row> rows;
    rows.reserve(income.size() + 1);
    rows.push_back(kIncomeHeader);
    for (const auto& [month, amount] : income) {
        rows.push_back({month.toString(), amount.toString()});
    }
    return csv::format(rows);
}

}
