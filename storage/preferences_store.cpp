/*
 * Filename: preferences_store.cpp
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

#include "storage/preferences_store.hpp"
#include "common/strings.hpp"
#include "storage/atomic_file.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace storage {

PreferencesStore::PreferencesStore(std::filesystem::path path) : path_(std::move(path)) {}

common::Result<common::Preferences> PreferencesStore::get() {
    if (cached_) {
        return *cached_;
    }

    auto content = readFile(path_);
    if (!common::isSuccess(content)) {
        const auto& error = common::getError(content);
        if (error.kind != common::ErrorKind::NotFound) {
            return common::makeError<common::Preferences>(error);
        }

        common::Preferences defaults;
        auto status = persist(defaults);
        if (!common::isSuccess(status)) {
            return common::makeError<common::Preferences>(common::getError(status));
        }
        spdlog::info("Created default preferences at {}", path_.string());
        cached_ = defaults;
        return defaults;
    }

    auto parsed = fromJson(common::getValue(content));
    if (!common::isSuccess(parsed)) {
        return common::makeError<common::Preferences>(
            common::ErrorKind::Storage, path_.string() + ": " + common::getError(parsed).message);
    }

    cached_ = common::getValue(parsed);
    return *cached_;
}

common::Status PreferencesStore::set(const common::Preferences& preferences) {
    auto status = validate(preferences);
    if (!common::isSuccess(status)) {
        return status;
    }

    common::Preferences normalized = preferences;
    normalized.currencySymbol = common::trim(preferences.currencySymbol);

    status = persist(normalized);
    if (!common::isSuccess(status)) {
        return status;
    }

    cached_ = normalized;
    spdlog::info("Preferences saved: currency '{}', budget {}", normalized.currencySymbol,
                 normalized.defaultMonthlyBudget.toString());
    return common::ok();
}

common::Status PreferencesStore::validate(const common::Preferences& preferences) {
    if (common::trim(preferences.currencySymbol).empty()) {
        return common::fail(common::ErrorKind::Validation, "currency symbol must not be empty");
    }
    if (preferences.defaultMonthlyBudget.isNegative()) {
        return common::fail(common::ErrorKind::Validation, "default monthly budget must not be negative");
    }
    return common::ok();
}

std::string PreferencesStore::toJson(const common::Preferences& preferences) {
    nlohmann::json j;
    j["currency_symbol"] = preferences.currencySymbol;
    j["default_monthly_budget"] = preferences.defaultMonthlyBudget.toDouble();
    return j.dump(2) + "\n";
}

common::Result<common::Preferences> PreferencesStore::fromJson(const std::string& text) {
    common::Preferences preferences;

    try {
        const nlohmann::json j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            return common::makeError<common::Preferences>(common::ErrorKind::Storage,
                                                          "preferences must be a JSON object");
        }

        if (j.contains("currency_symbol")) {
            preferences.currencySymbol = common::trim(j["currency_symbol"].get<std::string>());
            if (preferences.currencySymbol.empty()) {
                preferences.currencySymbol = common::kDefaultCurrencySymbol;
            }
        }

        if (j.contains("default_monthly_budget")) {
            const auto& budget = j["default_monthly_budget"];
            if (budget.is_number()) {
                auto converted = common::Money::tryFromDouble(budget.get<double>());
                if (!converted) {
                    return common::makeError<common::Preferences>(
                        common::ErrorKind::Storage, "default_monthly_budget is out of range");
                }
                preferences.defaultMonthlyBudget = *converted;
            } else if (budget.is_string()) {
                auto parsed = common::Money::parse(budget.get<std::string>());
                if (!parsed) {
                    return common::makeError<common::Preferences>(
                        common::ErrorKind::Storage, "default_monthly_budget is not a number");
                }
                preferences.defaultMonthlyBudget = *parsed;
            } else if (!budget.is_null()) {
                return common::makeError<common::Preferences>(
                    common::ErrorKind::Storage, "default_monthly_budget is not a number");
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return common::makeError<common::Preferences>(common::ErrorKind::Storage,
                                                      std::string("invalid preferences: ") + e.what());
    }

    if (preferences.defaultMonthlyBudget.isNegative()) {
        return common::makeError<common::Preferences>(common::ErrorKind::Storage,
                                                      "default_monthly_budget is negative");
    }
    return preferences;
}

common::Status PreferencesStore::persist(const common::Preferences& preferences) const {
    auto status = writeFileAtomically(path_, toJson(preferences));
    if (!common::isSuccess(status)) {
        spdlog::error("Saving preferences failed: {}", common::getError(status).message);
    }
    return status;
}

}
