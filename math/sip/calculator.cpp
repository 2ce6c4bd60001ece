#include "calculator.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <iomanip>
#include <sstream>
#include <utility>

namespace math::sip {

namespace {

const char* const kOutOfRange = "projected value is out of range";

std::string formatRate(core::Real percent) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << percent;
    std::string text = os.str();
    while (!text.empty() && text.back() == '0') {
        text.pop_back();
    }
    if (!text.empty() && text.back() == '.') {
        text.pop_back();
    }
    return text;
}

std::string formatPeriod(int months) {
    if (months % 12 == 0) {
        const int years = months / 12;
        return std::to_string(years) + (years == 1 ? " year" : " years");
    }
    return std::to_string(months) + (months == 1 ? " month" : " months");
}

}

core::Real annuityFactor(core::Real monthlyRate, int months, AnnuityTiming timing) {
    const core::Real n = static_cast<core::Real>(months);
    if (monthlyRate == 0.0) {
        return n;
    }
    const core::Real growth = std::pow(1.0 + monthlyRate, n);
    const core::Real ordinary = (growth - 1.0) / monthlyRate;
    return timing == AnnuityTiming::Due ? ordinary * (1.0 + monthlyRate) : ordinary;
}

common::Status validate(const SipParameters& parameters) {
    if (!std::isfinite(parameters.annualRatePercent)) {
        return common::fail(common::ErrorKind::Validation, "annual rate must be a finite number");
    }
    if (parameters.annualRatePercent < 0.0) {
        return common::fail(common::ErrorKind::Validation, "annual rate must not be negative");
    }
    if (parameters.months <= 0) {
        return common::fail(common::ErrorKind::Validation, "investment period must be at least one month");
    }
    return common::ok();
}

common::Result<SipProjection> futureValue(const common::Money& monthlyInvestment,
                                          const SipParameters& parameters) {
    const auto status = validate(parameters);
    if (!common::isSuccess(status)) {
        return common::makeError<SipProjection>(common::getError(status));
    }
    if (monthlyInvestment.isNegative()) {
        return common::makeError<SipProjection>(common::ErrorKind::Validation,
                                                "monthly investment must not be negative");
    }

    if (monthlyInvestment.getCents() > std::numeric_limits<std::int64_t>::max() / parameters.months) {
        return common::makeError<SipProjection>(common::ErrorKind::Validation, kOutOfRange);
    }

    SipProjection projection;
    projection.parameters = parameters;
    projection.monthlyInvestment = monthlyInvestment;
    projection.totalInvested = monthlyInvestment * parameters.months;

    const core::Real r = parameters.monthlyRate();
    if (r == 0.0) {
        projection.futureValue = projection.totalInvested;
    } else {
        const core::Real factor = annuityFactor(r, parameters.months, parameters.timing);
        const auto value = common::Money::tryFromDouble(monthlyInvestment.toDouble() * factor);
        if (!value) {
            return common::makeError<SipProjection>(common::ErrorKind::Validation, kOutOfRange);
        }
        projection.futureValue = *value;
    }
    projection.estimatedGains = projection.futureValue - projection.totalInvested;
    return common::makeSuccess(std::move(projection));
}

common::Result<SipRequirement> requiredInvestment(const common::Money& targetValue,
                                                  const SipParameters& parameters) {
    const auto status = validate(parameters);
    if (!common::isSuccess(status)) {
        return common::makeError<SipRequirement>(common::getError(status));
    }
    if (targetValue.isNegative()) {
        return common::makeError<SipRequirement>(common::ErrorKind::Validation,
                                                 "target value must not be negative");
    }

    const core::Real factor = annuityFactor(parameters.monthlyRate(), parameters.months, parameters.timing);
    if (!std::isfinite(factor) || factor <= 0.0) {
        return common::makeError<SipRequirement>(common::ErrorKind::Validation,
                                                 "growth factor is out of range");
    }

    SipRequirement requirement;
    requirement.parameters = parameters;
    requirement.targetValue = targetValue;
    const auto required = common::Money::tryFromDouble(targetValue.toDouble() / factor);
    if (!required) {
        return common::makeError<SipRequirement>(common::ErrorKind::Validation, kOutOfRange);
    }
    requirement.requiredMonthlyInvestment = *required;
    return common::makeSuccess(std::move(requirement));
}

common::Result<int> monthsForYears(core::Real years) {
    if (!std::isfinite(years) || years <= 0.0) {
        return common::makeError<int>(common::ErrorKind::Validation, "years must be a positive number");
    }
    const core::Real months = std::floor(years * core::kMonthsPerYear);
    if (months < 1.0) {
        return common::makeError<int>(common::ErrorKind::Validation,
                                      "investment period must be at least one month");
    }
    if (months > 12000.0) {
        return common::makeError<int>(common::ErrorKind::Validation, "investment period is too long");
    }
    return common::makeSuccess(static_cast<int>(months));
}

std::string describe(const SipProjection& projection,
                     const std::optional<SipRequirement>& goal,
                     const std::string& currencySymbol) {
    const auto& parameters = projection.parameters;
    std::ostringstream os;
    os << "Monthly SIP: " << projection.monthlyInvestment.format(currencySymbol) << "\n"
       << "Annual return assumed: " << formatRate(parameters.annualRatePercent) << "%\n"
       << "Period: " << formatPeriod(parameters.months) << " (" << parameters.months << " months)\n"
       << "\n"
       << "Total invested: " << projection.totalInvested.format(currencySymbol) << "\n"
       << "Estimated gains: " << projection.estimatedGains.format(currencySymbol) << "\n"
       << "Estimated corpus at end: " << projection.futureValue.format(currencySymbol) << "\n";
    if (goal) {
        os << "To reach goal " << goal->targetValue.format(currencySymbol) << ", you need ~ "
           << goal->requiredMonthlyInvestment.format(currencySymbol) << "/month\n";
    }
    os << "\n"
       << "Suggestion: Automate this SIP via your bank or mutual fund platform. "
          "Start small and increase regularly.\n";
    return os.str();
}

}
