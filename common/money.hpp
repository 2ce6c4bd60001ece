/*
 * Filename: money.hpp
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

#include <cstdint>
#include <optional>
#include <string>

namespace common {

// Fixed-point amount in cents. Currency symbols are display labels only and
// are carried by the records, not by Money.
class Money {
private:
    std::int64_t cents_ = 0;

    explicit Money(std::int64_t cents) : cents_(cents) {}

public:
    Money() = default;

    static Money fromCents(std::int64_t cents) { return Money(cents); }
    static Money fromUnits(std::int64_t units) { return Money(units * 100); }
    // Rounds half away from zero to the nearest cent. Zero when the value is
    // out of range.
    static Money fromDouble(double value);
    // Same rounding; nullopt when the value is not finite or does not fit in
    // int64 cents.
    static std::optional<Money> tryFromDouble(double value);
    // Plain decimal text: optional sign, digits with optional thousands
    // separators, optional fraction. Extra fraction digits are rounded.
    static std::optional<Money> parse(const std::string& text);

    std::int64_t getCents() const { return cents_; }
    double toDouble() const { return static_cast<double>(cents_) / 100.0; }

    bool isZero() const { return cents_ == 0; }
    bool isNegative() const { return cents_ < 0; }

    // "1234.50", "-0.05"
    std::string toString() const;
    // "₹1,234.50" with grouping, "₹1234.50" without.
    std::string format(const std::string& symbol, bool grouping = true) const;

    Money operator+(const Money& other) const { return Money(cents_ + other.cents_); }
    Money operator-(const Money& other) const { return Money(cents_ - other.cents_); }
    Money operator-() const { return Money(-cents_); }
    Money operator*(std::int64_t multiplier) const { return Money(cents_ * multiplier); }
    Money& operator+=(const Money& other) { cents_ += other.cents_; return *this; }
    Money& operator-=(const Money& other) { cents_ -= other.cents_; return *this; }

    bool operator==(const Money& other) const { return cents_ == other.cents_; }
    bool operator!=(const Money& other) const { return cents_ != other.cents_; }
    bool operator<(const Money& other) const { return cents_ < other.cents_; }
    bool operator>(const Money& other) const { return cents_ > other.cents_; }
    bool operator<=(const Money& other) const { return cents_ <= other.cents_; }
    bool operator>=(const Money& other) const { return cents_ >= other.cents_; }
};

// Amount text as written by the original tracker, e.g. "₹500.00",
// "$1,234.50", "AED 12", " 300 ". The leading label, if any, is returned
// as the symbol.
struct LabelledAmount {
    Money amount;
    std::string symbol;
};

std::optional<LabelledAmount> parseLabelledAmount(const std::string& text);

}
