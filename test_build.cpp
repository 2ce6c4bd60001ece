/*
 * Filename: test_build.cpp
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

#include "analytics/aggregation.hpp"
#include "common/types.hpp"
#include "math/sip/calculator.hpp"
#include <iostream>

int main() {
    std::cout << "ExpenseDesk Build Test\n";
    std::cout << "======================\n\n";

    // Money and calendar types
    common::Money lunch = common::Money::fromCents(25050);
    common::Money metro = common::Money::fromUnits(120);
    common::Money total = lunch + metro;

    std::cout << "Money test: " << lunch.format("₹") << " + " << metro.format("₹")
              << " = " << total.format("₹") << "\n";

    // One month aggregated
    common::ExpenseRecord food;
    food.date = common::CalendarDate(2025, 3, 2);
    food.category = "Food";
    food.amount = lunch;
    common::ExpenseRecord transport = food;
    transport.category = "Transport";
    transport.amount = metro;

    const auto month = analytics::aggregate({food, transport}, common::Money::fromUnits(1000),
                                            common::MonthKey(2025, 3));
    std::cout << "Aggregate test - " << month.month.toString()
              << ": spent " << month.totalExpense.format("₹")
              << ", balance " << month.balance.format("₹") << "\n";

    // SIP projection
    math::sip::SipParameters parameters;
    parameters.months = 12;
    auto projection = math::sip::futureValue(common::Money::fromUnits(5000), parameters);
    if (!common::isSuccess(projection)) {
        std::cout << "SIP test failed: " << common::describe(common::getError(projection)) << "\n";
        return 1;
    }
    std::cout << "SIP test - corpus: " << common::getValue(projection).futureValue.format("₹") << "\n";

    if (total.getCents() != 37050 || common::getValue(projection).futureValue.getCents() != 6404664) {
        std::cout << "\nUnexpected values\n";
        return 1;
    }

    std::cout << "\n✅ Basic ExpenseDesk structures working correctly!\n";
    return 0;
}
