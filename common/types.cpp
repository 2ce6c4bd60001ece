/*
 * Filename: types.cpp
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

#include "common/types.hpp"
#include "common/strings.hpp"
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace common {

namespace {

// Parses a run of 1..maxDigits decimal digits.
std::optional<int> parseNumber(const std::string& text, std::size_t maxDigits) {
    if (text.empty() || text.size() > maxDigits) {
        return std::nullopt;
    }
    int value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

std::tm localNow() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    return local;
}

}

std::optional<MonthKey> MonthKey::parse(const std::string& text) {
    const auto parts = split(trim(text), '-');
    if (parts.size() != 2 || parts[0].size() != 4) {
        return std::nullopt;
    }

    auto year = parseNumber(parts[0], 4);
    auto month = parseNumber(parts[1], 2);
    if (!year || !month) {
        return std::nullopt;
    }

    MonthKey key(*year, *month);
    if (!key.isValid()) {
        return std::nullopt;
    }
    return key;
}

MonthKey MonthKey::current() {
    const std::tm local = localNow();
    return MonthKey(local.tm_year + 1900, local.tm_mon + 1);
}

std::string MonthKey::toString() const {
    std::ostringstream os;
    os << std::setw(4) << std::setfill('0') << year << '-' << std::setw(2) << month;
    return os.str();
}

MonthKey MonthKey::next() const {
    return month == 12 ? MonthKey(year + 1, 1) : MonthKey(year, month + 1);
}

std::optional<CalendarDate> CalendarDate::parse(const std::string& text) {
    std::string s = trim(text);
    const auto timeStart = s.find_first_of("T ");
    if (timeStart != std::string::npos) {
        s = s.substr(0, timeStart);
    }

    const auto parts = split(s, '-');
    if (parts.size() != 3 || parts[0].size() != 4) {
        return std::nullopt;
    }

    auto year = parseNumber(parts[0], 4);
    auto month = parseNumber(parts[1], 2);
    auto day = parseNumber(parts[2], 2);
    if (!year || !month || !day) {
        return std::nullopt;
    }

    CalendarDate date(*year, *month, *day);
    if (!date.isValid()) {
        return std::nullopt;
    }
    return date;
}

bool CalendarDate::isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int CalendarDate::daysInMonth(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    return (month == 2 && isLeapYear(year)) ? 29 : days[month - 1];
}

bool CalendarDate::isValid() const {
    return year >= 1 && year <= 9999 && month >= 1 && month <= 12 &&
           day >= 1 && day <= daysInMonth(year, month);
}

std::string CalendarDate::toString() const {
    std::ostringstream os;
    os << std::setfill('0') << std::setw(4) << year << '-' << std::setw(2) << month << '-'
       << std::setw(2) << day;
    return os.str();
}

const std::string& displaySymbol(const ExpenseRecord& record, const Preferences& preferences) {
    return record.currencySymbol.empty() ? preferences.currencySymbol : record.currencySymbol;
}

}
