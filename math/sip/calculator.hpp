#pragma once

#include "../core/types.hpp"
#include "common/money.hpp"
#include "common/result.hpp"
#include <optional>
#include <string>
#include <variant>

namespace math::sip {

// Due: each instalment is invested at the start of its month and earns that
// month's return. Ordinary: invested at the end of the month.
enum class AnnuityTiming {
    Due, Ordinary
};

struct SipParameters {
    core::Real annualRatePercent = 12.0;
    int months = 120;
    AnnuityTiming timing = AnnuityTiming::Due;

    core::Real monthlyRate() const { return annualRatePercent / core::kMonthsPerYear / core::kPercent; }
};

struct SipProjection {
    SipParameters parameters;
    common::Money monthlyInvestment;
    common::Money futureValue;
    common::Money totalInvested;
    common::Money estimatedGains;
};

struct SipRequirement {
    SipParameters parameters;
    common::Money targetValue;
    common::Money requiredMonthlyInvestment;
};

using SipResult = std::variant<SipProjection, SipRequirement>;

// Future value of one unit invested every month: ((1+r)^n - 1) / r, times
// (1+r) for annuity-due. Equals n when r is zero.
core::Real annuityFactor(core::Real monthlyRate, int months, AnnuityTiming timing);

common::Result<SipProjection> futureValue(const common::Money& monthlyInvestment,
                                          const SipParameters& parameters);

common::Result<SipRequirement> requiredInvestment(const common::Money& targetValue,
                                                  const SipParameters& parameters);

// Whole months in a period given in (possibly fractional) years, truncated.
common::Result<int> monthsForYears(core::Real years);

// Calculator output: instalment, assumed return, period, estimated corpus,
// the goal requirement when one was asked for, and a closing advice line.
std::string describe(const SipProjection& projection,
                     const std::optional<SipRequirement>& goal,
                     const std::string& currencySymbol);

common::Status validate(const SipParameters& parameters);

}
