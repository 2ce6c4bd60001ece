/*
 * Filename: assembler.hpp
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

#include "analytics/aggregation.hpp"
#include "analytics/suggestions.hpp"
#include "common/types.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace report {

inline constexpr std::size_t kReportCategories = 10;

struct ReportLine {
    std::size_t rank = 0;
    std::string category;
    common::Money amount;
    std::string amountText;
    int sharePercent = 0;
};

struct ReportPayload {
    common::MonthKey month;
    std::string title;
    std::string currencySymbol;

    common::Money totalIncome;
    common::Money totalExpense;
    common::Money balance;
    std::string incomeText;
    std::string expenseText;
    std::string balanceText;

    std::vector<ReportLine> categories;
    std::vector<analytics::CategoryAmount> chartSlices;
    std::vector<common::ExpenseRecord> rows;
    std::vector<analytics::Tip> tips;

    bool noData = false;
};

// Everything a renderer needs for one month. `rows` are the month's expense
// records for tabular output; records from other months are dropped.
ReportPayload buildReport(const analytics::MonthlyAggregate& aggregate,
                          const common::Preferences& preferences,
                          const std::vector<common::ExpenseRecord>& rows = {},
                          const analytics::SuggestionThresholds& thresholds = {});

}
