/*
 * Filename: assembler.cpp
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

#include "report/assembler.hpp"
#include <algorithm>
#include <utility>

namespace report {

ReportPayload buildReport(const analytics::MonthlyAggregate& aggregate,
                          const common::Preferences& preferences,
                          const std::vector<common::ExpenseRecord>& rows,
                          const analytics::SuggestionThresholds& thresholds) {
    const std::string& symbol = preferences.currencySymbol;

    ReportPayload payload;
    payload.month = aggregate.month;
    payload.title = "Monthly Expense Report — " + aggregate.month.toString();
    payload.currencySymbol = symbol;

    payload.noData = aggregate.expenseCount == 0;
    payload.totalIncome = aggregate.totalIncome;
    payload.totalExpense = payload.noData ? common::Money() : aggregate.totalExpense;
    payload.balance = payload.totalIncome - payload.totalExpense;
    payload.incomeText = payload.totalIncome.format(symbol);
    payload.expenseText = payload.totalExpense.format(symbol);
    payload.balanceText = payload.balance.format(symbol);

    for (const auto& record : rows) {
        if (record.month() == aggregate.month) {
            payload.rows.push_back(record);
        }
    }
    std::stable_sort(payload.rows.begin(), payload.rows.end(),
                     [](const common::ExpenseRecord& a, const common::ExpenseRecord& b) {
                         return a.date < b.date;
                     });

    if (payload.noData) {
        return payload;
    }

    const auto ranked = analytics::rankCategories(aggregate.categoryTotals, kReportCategories);
    std::size_t rank = 1;
    for (const auto& entry : ranked) {
        ReportLine line;
        line.rank = rank++;
        line.category = entry.category;
        line.amount = entry.amount;
        line.amountText = entry.amount.format(symbol);
        line.sharePercent = analytics::sharePercent(entry.amount, aggregate.totalExpense);
        payload.categories.push_back(std::move(line));
    }

    payload.chartSlices = analytics::shareSlices(aggregate.categoryTotals);
    payload.tips = analytics::suggest(aggregate, preferences, thresholds).tips;
    return payload;
}

}
