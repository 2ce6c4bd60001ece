/*
 * Filename: record_store.hpp
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

#pragma once

#include "common/result.hpp"
#include "common/types.hpp"
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <vector>

namespace storage {

// Position of an expense in storage order.
using RecordId = std::size_t;

struct StoreSnapshot {
    std::vector<common::ExpenseRecord> expenses;
    std::map<common::MonthKey, common::Money> income;
};

/*
 * RecordStore
 * ----------------
 * Expense and income records backed by two CSV files.
 *
 *  - load() reads both files once; a missing file is a first run and is
 *    created with its header row
 *  - every mutation rewrites the complete file through a temporary sibling
 *    and a rename, and only then updates the in-memory copy
 *  - expenses are addressed by position, income is keyed by month
 *
 * Single writer. The background report job works on snapshot() copies.
 */
class RecordStore {
private:
    std::filesystem::path expensePath_;
    std::filesystem::path incomePath_;

    std::vector<common::ExpenseRecord> expenses_;
    std::map<common::MonthKey, common::Money> income_;

public:
    RecordStore(std::filesystem::path expenseFile, std::filesystem::path incomeFile);

    RecordStore(const RecordStore&) = delete;
    RecordStore& operator=(const RecordStore&) = delete;

    common::Status load();

    common::Result<RecordId> addExpense(const common::ExpenseRecord& record);
    common::Status updateExpense(RecordId id, const common::ExpenseRecord& record);
    common::Status deleteExpense(RecordId id);
    common::Result<common::ExpenseRecord> getExpense(RecordId id) const;

    std::vector<common::ExpenseRecord> listExpenses(
        const std::optional<common::MonthKey>& month = std::nullopt) const;
    std::size_t expenseCount() const { return expenses_.size(); }

    common::Status setIncome(const common::MonthKey& month, const common::Money& amount);
    std::map<common::MonthKey, common::Money> listIncome() const { return income_; }
    common::Money incomeFor(const common::MonthKey& month) const;

    std::vector<common::MonthKey> months() const;
    StoreSnapshot snapshot() const;

    static common::Status validate(const common::ExpenseRecord& record);

private:
    common::Status loadExpenses();
    common::Status loadIncome();

    common::Status persistExpenses(const std::vector<common::ExpenseRecord>& expenses) const;
    common::Status persistIncome(const std::map<common::MonthKey, common::Money>& income) const;
};

std::string serializeExpenses(const std::vector<common::ExpenseRecord>& expenses);
std::string serializeIncome(const std::map<common::MonthKey, common::Money>& income);

}
