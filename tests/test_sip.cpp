/*
 * Filename: test_sip.cpp
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

#include "math/sip/calculator.hpp"
#include "test_harness.hpp"

using common::Money;
using math::sip::AnnuityTiming;
using math::sip::SipParameters;

namespace {

SipParameters parameters(double rate, int months, AnnuityTiming timing = AnnuityTiming::Due) {
    SipParameters p;
    p.annualRatePercent = rate;
    p.months = months;
    p.timing = timing;
    return p;
}

}

TEST(test_future_value_one_year) {
    auto projection = math::sip::futureValue(Money::fromUnits(5000), parameters(12.0, 12));
    ASSERT_OK(projection);
    const auto& p = common::getValue(projection);
    ASSERT_EQ(p.futureValue.getCents(), std::int64_t(6404664));
    ASSERT_EQ(p.totalInvested.getCents(), std::int64_t(6000000));
    ASSERT_EQ(p.estimatedGains.getCents(), std::int64_t(404664));
}

TEST(test_ordinary_annuity_is_one_month_less_growth) {
    auto projection = math::sip::futureValue(Money::fromUnits(5000), parameters(12.0, 12, AnnuityTiming::Ordinary));
    ASSERT_OK(projection);
    ASSERT_NEAR(common::getValue(projection).futureValue.toDouble(), 63412.52, 0.011);
}

TEST(test_zero_rate_is_plain_sum) {
    auto projection = math::sip::futureValue(Money::fromUnits(1000), parameters(0.0, 24));
    ASSERT_OK(projection);
    const auto& p = common::getValue(projection);
    ASSERT_EQ(p.futureValue.getCents(), std::int64_t(2400000));
    ASSERT_TRUE(p.estimatedGains.isZero());
    ASSERT_NEAR(math::sip::annuityFactor(0.0, 24, AnnuityTiming::Due), 24.0, 1e-12);
}

TEST(test_required_investment_inverts_projection) {
    const auto params = parameters(12.0, 120);
    auto projection = math::sip::futureValue(Money::fromUnits(5000), params);
    ASSERT_OK(projection);

    auto requirement = math::sip::requiredInvestment(common::getValue(projection).futureValue, params);
    ASSERT_OK(requirement);
    ASSERT_NEAR(common::getValue(requirement).requiredMonthlyInvestment.toDouble(), 5000.0, 0.011);

    auto zeroRate = math::sip::requiredInvestment(Money::fromUnits(12000), parameters(0.0, 12));
    ASSERT_OK(zeroRate);
    ASSERT_EQ(common::getValue(zeroRate).requiredMonthlyInvestment.getCents(), std::int64_t(100000));
}

TEST(test_rejects_invalid_inputs) {
    ASSERT_ERROR(math::sip::futureValue(Money::fromUnits(-1), parameters(12.0, 12)), common::ErrorKind::Validation);
    ASSERT_ERROR(math::sip::futureValue(Money::fromUnits(100), parameters(-1.0, 12)), common::ErrorKind::Validation);
    ASSERT_ERROR(math::sip::futureValue(Money::fromUnits(100), parameters(12.0, 0)), common::ErrorKind::Validation);
    ASSERT_ERROR(math::sip::requiredInvestment(Money::fromUnits(-5), parameters(12.0, 12)),
                 common::ErrorKind::Validation);
}

TEST(test_long_horizon_beyond_money_range) {
    auto months = math::sip::monthsForYears(300.0);
    ASSERT_OK(months);
    ASSERT_EQ(common::getValue(months), 3600);

    ASSERT_ERROR(math::sip::futureValue(Money::fromUnits(5000), parameters(12.0, common::getValue(months))),
                 common::ErrorKind::Validation);
    auto requirement = math::sip::requiredInvestment(Money::fromUnits(1000000),
                                                     parameters(12.0, common::getValue(months)));
    ASSERT_OK(requirement);
    ASSERT_TRUE(common::getValue(requirement).requiredMonthlyInvestment.isZero());
}

TEST(test_total_invested_overflow) {
    const auto instalment = Money::parse("999999999999999");
    ASSERT_TRUE(instalment.has_value());
    ASSERT_ERROR(math::sip::futureValue(*instalment, parameters(0.0, 12000)), common::ErrorKind::Validation);
    ASSERT_ERROR(math::sip::futureValue(*instalment, parameters(12.0, 12000)), common::ErrorKind::Validation);

    auto largest = math::sip::futureValue(*instalment, parameters(0.0, 12));
    ASSERT_OK(largest);
    ASSERT_EQ(common::getValue(largest).totalInvested.getCents(), std::int64_t(1199999999999998800));
}

TEST(test_months_for_years) {
    ASSERT_EQ(common::getValue(math::sip::monthsForYears(10.0)), 120);
    ASSERT_EQ(common::getValue(math::sip::monthsForYears(0.5)), 6);
    ASSERT_EQ(common::getValue(math::sip::monthsForYears(2.99)), 35);
    ASSERT_ERROR(math::sip::monthsForYears(0.05), common::ErrorKind::Validation);
    ASSERT_ERROR(math::sip::monthsForYears(0.0), common::ErrorKind::Validation);
    ASSERT_ERROR(math::sip::monthsForYears(2000.0), common::ErrorKind::Validation);
}

TEST(test_describe_projection_and_goal) {
    const auto params = parameters(12.0, 12);
    const auto projection = common::getValue(math::sip::futureValue(Money::fromUnits(5000), params));
    const auto goal = common::getValue(math::sip::requiredInvestment(Money::fromUnits(100000), params));

    const auto text = math::sip::describe(projection, goal, "₹");
    ASSERT_TRUE(text.find("Monthly SIP: ₹5,000.00\n") != std::string::npos);
    ASSERT_TRUE(text.find("Annual return assumed: 12%\n") != std::string::npos);
    ASSERT_TRUE(text.find("Period: 1 year (12 months)\n") != std::string::npos);
    ASSERT_TRUE(text.find("Estimated corpus at end: ₹64,046.64\n") != std::string::npos);
    ASSERT_TRUE(text.find("To reach goal ₹100,000.00, you need ~ ₹7,806.81/month") != std::string::npos);

    const auto plain = math::sip::describe(projection, std::nullopt, "$");
    ASSERT_TRUE(plain.find("To reach goal") == std::string::npos);
    ASSERT_TRUE(plain.find("Suggestion: Automate this SIP") != std::string::npos);
}

int main() {
    std::cout << "SIP calculator tests:\n";
    RUN_TEST(test_future_value_one_year);
    RUN_TEST(test_ordinary_annuity_is_one_month_less_growth);
    RUN_TEST(test_zero_rate_is_plain_sum);
    RUN_TEST(test_required_investment_inverts_projection);
    RUN_TEST(test_rejects_invalid_inputs);
    RUN_TEST(test_long_horizon_beyond_money_range);
    RUN_TEST(test_total_invested_overflow);
    RUN_TEST(test_months_for_years);
    RUN_TEST(test_describe_projection_and_goal);
    return TEST_RESULT();
}
