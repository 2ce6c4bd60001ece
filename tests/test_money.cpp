/*
 * Filename: test_money.cpp
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
#include "common/types.hpp"
#include "test_harness.hpp"
#include <cmath>
#include <cstdint>
#include <limits>

using common::Money;

TEST(test_parse_plain_decimals) {
    ASSERT_EQ(Money::parse("1234.5")->getCents(), 123450);
    ASSERT_EQ(Money::parse(" 300 ")->getCents(), 30000);
    ASSERT_EQ(Money::parse("-0.05")->getCents(), -5);
    ASSERT_EQ(Money::parse("1,234.50")->getCents(), 123450);
    ASSERT_EQ(Money::parse("0.005")->getCents(), 1);
}

TEST(test_parse_rejects_garbage) {
    ASSERT_FALSE(Money::parse("").has_value());
    ASSERT_FALSE(Money::parse("abc").has_value());
    ASSERT_FALSE(Money::parse("12abc").has_value());
    ASSERT_FALSE(Money::parse(",100").has_value());
    ASSERT_FALSE(Money::parse("1,,000").has_value());
}

TEST(test_format_with_symbol) {
    ASSERT_EQ(Money::fromCents(123450).format("₹"), std::string("₹1,234.50"));
    ASSERT_EQ(Money::fromCents(123450).format("$", false), std::string("$1234.50"));
    ASSERT_EQ(Money::fromUnits(0).toString(), std::string("0.00"));
    ASSERT_EQ(Money::fromCents(-5).toString(), std::string("-0.05"));
}

TEST(test_from_double_rounds_half_away_from_zero) {
    ASSERT_EQ(Money::fromDouble(0.125).getCents(), 13);
    ASSERT_EQ(Money::fromDouble(-0.125).getCents(), -13);
    ASSERT_EQ(Money::fromDouble(64046.6396).getCents(), 6404664);
}

TEST(test_extreme_values) {
    const auto lowest = Money::fromCents(std::numeric_limits<std::int64_t>::min());
    ASSERT_EQ(lowest.toString(), std::string("-92233720368547758.08"));
    ASSERT_EQ(lowest.format("$"), std::string("-$92,233,720,368,547,758.08"));

    ASSERT_FALSE(Money::tryFromDouble(1e17).has_value());
    ASSERT_FALSE(Money::tryFromDouble(-1e17).has_value());
    ASSERT_FALSE(Money::tryFromDouble(std::nan("")).has_value());
    ASSERT_EQ(Money::tryFromDouble(1e15)->getCents(), std::int64_t(100000000000000000));
    ASSERT_TRUE(Money::fromDouble(1e300).isZero());
}

TEST(test_labelled_amounts_from_legacy_files) {
    auto rupees = common::parseLabelledAmount("₹500.00");
    ASSERT_TRUE(rupees.has_value());
    ASSERT_EQ(rupees->amount.getCents(), 50000);
    ASSERT_EQ(rupees->symbol, std::string("₹"));

    auto dirham = common::parseLabelledAmount("AED 12");
    ASSERT_TRUE(dirham.has_value());
    ASSERT_EQ(dirham->amount.getCents(), 1200);
    ASSERT_EQ(dirham->symbol, std::string("AED"));

    auto bare = common::parseLabelledAmount(" 300 ");
    ASSERT_TRUE(bare.has_value());
    ASSERT_EQ(bare->amount.getCents(), 30000);
    ASSERT_TRUE(bare->symbol.empty());

    ASSERT_FALSE(common::parseLabelledAmount("lots").has_value());
}

TEST(test_month_and_date_keys) {
    auto month = common::MonthKey::parse("2025-3");
    ASSERT_TRUE(month.has_value());
    ASSERT_EQ(month->toString(), std::string("2025-03"));
    ASSERT_EQ(common::MonthKey(2025, 12).next().toString(), std::string("2026-01"));

    auto date = common::CalendarDate::parse("2024-02-29T10:30");
    ASSERT_TRUE(date.has_value());
    ASSERT_TRUE(date->isValid());
    ASSERT_EQ(date->monthKey().toString(), std::string("2024-02"));

    auto invalid = common::CalendarDate::parse("2023-02-29");
    ASSERT_TRUE(!invalid || !invalid->isValid());
}

TEST(test_normalize_key) {
    ASSERT_EQ(common::normalizeKey(" Currency Symbol "), std::string("currency_symbol"));
    ASSERT_EQ(common::trim("\t food \n"), std::string("food"));
    ASSERT_EQ(common::split("a,b,,c", ',').size(), std::size_t(4));
}

int main() {
    std::cout << "Money and calendar tests:\n";
    RUN_TEST(test_parse_plain_decimals);
    RUN_TEST(test_parse_rejects_garbage);
    RUN_TEST(test_format_with_symbol);
    RUN_TEST(test_from_double_rounds_half_away_from_zero);
    RUN_TEST(test_extreme_values);
    RUN_TEST(test_labelled_amounts_from_legacy_files);
    RUN_TEST(test_month_and_date_keys);
    RUN_TEST(test_normalize_key);
    return TEST_RESULT();
}
