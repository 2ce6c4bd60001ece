/*
 * Filename: money.cpp
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

#include "common/money.hpp"
#include "common/strings.hpp"
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace common {

namespace {

constexpr int kMaxIntegerDigits = 15;
// Largest cent count a double converts to int64 without overflow.
constexpr double kMaxCentsMagnitude = 9.2e18;

std::uint64_t magnitudeOf(std::int64_t cents) {
    return cents < 0 ? std::uint64_t(0) - static_cast<std::uint64_t>(cents)
                     : static_cast<std::uint64_t>(cents);
}

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::string groupThousands(const std::string& digits) {
    std::string grouped;
    const auto length = digits.size();
    for (std::size_t i = 0; i < length; ++i) {
        if (i > 0 && (length - i) % 3 == 0) {
            grouped += ',';
        }
        grouped += digits[i];
    }
    return grouped;
}

}

Money Money::fromDouble(double value) {
    const auto money = tryFromDouble(value);
    return money ? *money : Money();
}

std::optional<Money> Money::tryFromDouble(double value) {
    const double cents = value * 100.0;
    if (!std::isfinite(cents) || std::abs(cents) >= kMaxCentsMagnitude) {
        return std::nullopt;
    }
    return Money(static_cast<std::int64_t>(std::llround(cents)));
}

std::optional<Money> Money::parse(const std::string& text) {
    const std::string s = trim(text);
    if (s.empty()) {
        return std::nullopt;
    }

    std::size_t pos = 0;
    bool negative = false;
    if (s[pos] == '-' || s[pos] == '+') {
        negative = s[pos] == '-';
        ++pos;
    }

    std::int64_t units = 0;
    int integerDigits = 0;
    bool sawDigit = false;
    bool lastWasComma = false;
    for (; pos < s.size(); ++pos) {
        const char c = s[pos];
        if (isDigit(c)) {
            if (integerDigits >= kMaxIntegerDigits) {
                return std::nullopt;
            }
            units = units * 10 + (c - '0');
            ++integerDigits;
            sawDigit = true;
            lastWasComma = false;
        } else if (c == ',') {
            if (!sawDigit || lastWasComma) {
                return std::nullopt;
            }
            lastWasComma = true;
        } else {
            break;
        }
    }
    if (lastWasComma) {
        return std::nullopt;
    }

    std::int64_t fraction = 0;
    int fractionDigits = 0;
    bool roundUp = false;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        for (; pos < s.size() && isDigit(s[pos]); ++pos) {
            const int digit = s[pos] - '0';
            if (fractionDigits < 2) {
                fraction = fraction * 10 + digit;
            } else if (fractionDigits == 2) {
                roundUp = digit >= 5;
            }
            ++fractionDigits;
            sawDigit = true;
        }
    }

    if (pos != s.size() || !sawDigit) {
        return std::nullopt;
    }
    if (fractionDigits == 1) {
        fraction *= 10;
    }

    std::int64_t cents = units * 100 + fraction + (roundUp ? 1 : 0);
    return Money(negative ? -cents : cents);
}

std::string Money::toString() const {
    const std::uint64_t magnitude = magnitudeOf(cents_);
    std::ostringstream os;
    if (cents_ < 0) {
        os << '-';
    }
    os << magnitude / 100 << '.' << std::setw(2) << std::setfill('0') << magnitude % 100;
    return os.str();
}

std::string Money::format(const std::string& symbol, bool grouping) const {
    const std::uint64_t magnitude = magnitudeOf(cents_);
    std::string units = std::to_string(magnitude / 100);
    if (grouping) {
        units = groupThousands(units);
    }

    std::ostringstream os;
    if (cents_ < 0) {
        os << '-';
    }
    os << symbol << units << '.' << std::setw(2) << std::setfill('0') << magnitude % 100;
    return os.str();
}

std::optional<LabelledAmount> parseLabelledAmount(const std::string& text) {
    std::string s = trim(text);
    bool negative = false;
    if (s.size() > 1 && s[0] == '-' && !isDigit(s[1]) && s[1] != '.') {
        negative = true;
        s = s.substr(1);
    }

    const auto start = s.find_first_of("0123456789.-+");
    if (start == std::string::npos) {
        return std::nullopt;
    }

    auto amount = Money::parse(s.substr(start));
    if (!amount) {
        return std::nullopt;
    }

    LabelledAmount parsed;
    parsed.amount = negative ? -*amount : *amount;
    parsed.symbol = trim(s.substr(0, start));
    return parsed;
}

}
