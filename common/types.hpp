/*
 * Filename: types.hpp
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

#include "common/money.hpp"
#include <optional>
#include <string>
#include <vector>

namespace common {

inline const std::string kDefaultCurrencySymbol = "₹";
inline const std::string kUncategorized = "Uncategorized";

inline const std::vector<std::string> kCurrencyOptions = {
    "₹", "$", "€", "£", "¥", "AED", "AUD", "CAD", "SGD"
};

inline const std::vector<std::string> kSuggestedCategories = {
    "Food", "Groceries", "Transport", "Rent", "Utilities", "Shopping",
    "Entertainment", "Health", "Education", "Travel", "Other"
};

struct MonthKey {
    int year = 0;
    int month = 0;

    MonthKey() = default;
    MonthKey(int y, int m) : year(y), month(m) {}

    // "YYYY-MM"; the month may be written with one digit.
    static std::optional<MonthKey> parse(const std::string& text);
    static MonthKey current();

    bool isValid() const { return year >= 1 && year <= 9999 && month >= 1 && month <= 12; }
    std::string toString() const;

    MonthKey next() const;

    bool operator==(const MonthKey& other) const { return year == other.year && month == other.month; }
    bool operator!=(const MonthKey& other) const { return !(*this == other); }
    bool operator<(const MonthKey& other) const {
        return year != other.year ? year < other.year : month < other.month;
    }
};

struct CalendarDate {
    int year = 0;
    int month = 0;
    int day = 0;

    CalendarDate() = default;
    CalendarDate(int y, int m, int d) : year(y), month(m), day(d) {}

    // "YYYY-MM-DD". One-digit months and days are accepted and a trailing
    // time part ("T10:30", " 10:30:00") is ignored.
    static std::optional<CalendarDate> parse(const std::string& text);
    static bool isLeapYear(int year);
    static int daysInMonth(int year, int month);

    bool isValid() const;
    std::string toString() const;
    MonthKey monthKey() const { return MonthKey(year, month); }

    bool operator==(const CalendarDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const CalendarDate& other) const { return !(*this == other); }
    bool operator<(const CalendarDate& other) const {
        if (year != other.year) return year < other.year;
        if (month != other.month) return month < other.month;
        return day < other.day;
    }
};

struct ExpenseRecord {
    CalendarDate date;
    std::string category;
    Money amount;
    // Empty means "use the preferred symbol".
    std::string currencySymbol;
    std::string note;

    MonthKey month() const { return date.monthKey(); }

    bool operator==(const ExpenseRecord& other) const {
        return date == other.date && category == other.category && amount == other.amount &&
               currencySymbol == other.currencySymbol && note == other.note;
    }
    bool operator!=(const ExpenseRecord& other) const { return !(*this == other); }
};

struct IncomeRecord {
    MonthKey month;
    Money amount;
};

struct Preferences {
    std::string currencySymbol = kDefaultCurrencySymbol;
    Money defaultMonthlyBudget;

    bool operator==(const Preferences& other) const {
        return currencySymbol == other.currencySymbol &&
               defaultMonthlyBudget == other.defaultMonthlyBudget;
    }
    bool operator!=(const Preferences& other) const { return !(*this == other); }
};

// Symbol to display for a record: its own label, or the preferred one.
const std::string& displaySymbol(const ExpenseRecord& record, const Preferences& preferences);

}
