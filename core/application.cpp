/*
 * Filename: application.cpp
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

#include "core/application.hpp"
#include "report/csv_renderer.hpp"
#include "storage/atomic_file.hpp"
#include <cstdlib>
#include <utility>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace core {

namespace fs = std::filesystem;

namespace {

fs::path resolveAgainst(const std::string& directory, const std::string& file) {
    const fs::path path(file);
    if (path.is_absolute() || directory.empty()) {
        return path;
    }
    return fs::path(directory) / path;
}

}

fs::path ApplicationConfig::expensePath() const {
    return resolveAgainst(dataDirectory, expenseFile);
}

fs::path ApplicationConfig::incomePath() const {
    return resolveAgainst(dataDirectory, incomeFile);
}

fs::path ApplicationConfig::preferencesPath() const {
    return resolveAgainst(dataDirectory, preferencesFile);
}

Application::Application() : Application(ApplicationConfig()) {}

Application::Application(ApplicationConfig config) : config_(std::move(config)) {}

Application::~Application() {
    shutdown();
}

void Application::notifyStatusUpdate(const std::string& status) {
    spdlog::info("{}", status);
    std::shared_lock<std::shared_mutex> lock(callbackLock_);
    for (const auto& callback : statusCallbacks_) {
        try {
            callback(status);
        } catch (const std::exception& e) {
            spdlog::error("Status callback raised: {}", e.what());
        }
    }
}

void Application::notifyDataChanged() {
    std::shared_lock<std::shared_mutex> lock(callbackLock_);
    for (const auto& callback : dataChangedCallbacks_) {
        try {
            callback();
        } catch (const std::exception& e) {
            spdlog::error("Data change callback raised: {}", e.what());
        }
    }
}

void Application::addStatusCallback(StatusCallback callback) {
    std::unique_lock<std::shared_mutex> lock(callbackLock_);
    statusCallbacks_.push_back(std::move(callback));
}

void Application::addDataChangedCallback(DataChangedCallback callback) {
    std::unique_lock<std::shared_mutex> lock(callbackLock_);
    dataChangedCallbacks_.push_back(std::move(callback));
}

common::Status Application::initialize() {
    records_ = std::make_unique<storage::RecordStore>(config_.expensePath(), config_.incomePath());
    preferences_ = std::make_unique<storage::PreferencesStore>(config_.preferencesPath());

    auto loaded = records_->load();
    if (!common::isSuccess(loaded)) {
        return loaded;
    }

    auto preferences = preferences_->get();
    if (!common::isSuccess(preferences)) {
        return common::fail(common::getError(preferences));
    }

    registerBuiltinRenderers();
    initialized_ = true;
    notifyStatusUpdate("Loaded " + std::to_string(records_->expenseCount()) + " expenses from " +
                       config_.dataDirectory);
    return common::ok();
}

void Application::shutdown() {
    std::lock_guard<std::mutex> lock(reportLock_);
    if (reportJob_) {
        reportJob_->cancel();
        reportJob_->wait();
        reportJob_.reset();
    }
}

void Application::registerBuiltinRenderers() {
    if (renderers_.isRegistered("csv")) {
        return;
    }
    renderers_.registerRenderer(std::make_unique<report::FunctionRendererFactory>(
        "csv", []() { return std::make_unique<report::CsvTableRenderer>(); }));
}

common::Status Application::requireInitialized() const {
    if (!initialized_) {
        return common::fail(common::ErrorKind::Storage, "application is not initialized");
    }
    return common::ok();
}

common::Result<storage::RecordId> Application::addExpense(const common::ExpenseRecord& record) {
    auto ready = requireInitialized();
    if (!common::isSuccess(ready)) {
        return common::makeError<storage::RecordId>(common::getError(ready));
    }

    auto result = records_->addExpense(record);
    if (common::isSuccess(result)) {
        notifyStatusUpdate("Added " + record.category + " expense of " + record.amount.toString());
        notifyDataChanged();
    }
    return result;
}

common::Status Application::updateExpense(storage::RecordId id, const common::ExpenseRecord& record) {
    auto ready = requireInitialized();
    if (!common::isSuccess(ready)) {
        return ready;
    }

    auto status = records_->updateExpense(id, record);
    if (common::isSuccess(status)) {
        notifyStatusUpdate("Updated expense #" + std::to_string(id));
        notifyDataChanged();
    }
    return status;
}

common::Status Application::deleteExpense(storage::RecordId id) {
    auto ready = requireInitialized();
    if (!common::isSuccess(ready)) {
        return ready;
    }

    auto status = records_->deleteExpense(id);
    if (common::isSuccess(status)) {
        notifyStatusUpdate("Deleted expense #" + std::to_string(id));
        notifyDataChanged();
    }
    return status;
}

common::Status Application::setIncome(const common::MonthKey& month, const common::Money& amount) {
    auto ready = requireInitialized();
    if (!common::isSuccess(ready)) {
        return ready;
    }

    auto status = records_->setIncome(month, amount);
    if (common::isSuccess(status)) {
        notifyStatusUpdate("Income for " + month.toString() + " set to " + amount.toString());
        notifyDataChanged();
    }
    return status;
}

common::Result<common::Preferences> Application::getPreferences() {
    auto ready = requireInitialized();
    if (!common::isSuccess(ready)) {
        return common::makeError<common::Preferences>(common::getError(ready));
    }
    return preferences_->get();
}

common::Status Application::setPreferences(const common::Preferences& preferences) {
    auto ready = requireInitialized();
    if (!common::isSuccess(ready)) {
        return ready;
    }

    auto status = preferences_->set(preferences);
    if (common::isSuccess(status)) {
        notifyStatusUpdate("Preferences saved");
        notifyDataChanged();
    }
    return status;
}

analytics::MonthlyAggregate Application::aggregateMonth(const common::MonthKey& month) const {
    if (!records_) {
        analytics::MonthlyAggregate empty;
        empty.month = month;
        return empty;
    }
    return analytics::aggregate(records_->listExpenses(month), records_->incomeFor(month), month,
                                config_.topCategories);
}

common::Result<analytics::SuggestionReport> Application::suggestionsFor(const common::MonthKey& month) {
    auto preferences = getPreferences();
    if (!common::isSuccess(preferences)) {
        return common::makeError<analytics::SuggestionReport>(common::getError(preferences));
    }
    return common::makeSuccess(
        analytics::suggest(aggregateMonth(month), common::getValue(preferences), config_.suggestions));
}

common::Result<std::string> Application::summaryText(const common::MonthKey& month) {
    auto preferences = getPreferences();
    if (!common::isSuccess(preferences)) {
        return common::makeError<std::string>(common::getError(preferences));
    }
    const auto report = analytics::suggest(aggregateMonth(month), common::getValue(preferences),
                                           config_.suggestions);
    return common::makeSuccess(analytics::formatSummary(report, common::getValue(preferences)));
}

common::Result<std::unique_ptr<report::IReportRenderer>> Application::resolveRenderer() const {
    auto preferred = renderers_.create(config_.preferredRenderer);
    if (common::isSuccess(preferred)) {
        return preferred;
    }
    spdlog::warn("Renderer '{}' unavailable, using fallback", config_.preferredRenderer);

    std::vector<std::unique_ptr<report::IReportRenderer>> parts;
    for (const auto& name : config_.fallbackRenderers) {
        auto renderer = renderers_.create(name);
        if (!common::isSuccess(renderer)) {
            spdlog::warn("Fallback renderer '{}' unavailable", name);
            continue;
        }
        parts.push_back(std::move(common::getValue(renderer)));
    }

    if (parts.empty()) {
        std::string available;
        for (const auto& name : renderers_.getAvailableRenderers()) {
            available += (available.empty() ? "" : ", ") + name;
        }
        return common::makeError<std::unique_ptr<report::IReportRenderer>>(
            common::ErrorKind::DependencyUnavailable,
            "no report renderer available (wanted '" + config_.preferredRenderer +
                "', registered: " + (available.empty() ? "none" : available) + ")");
    }
    if (parts.size() == 1) {
        return common::makeSuccess(std::move(parts.front()));
    }
    return common::makeSuccess(
        std::unique_ptr<report::IReportRenderer>(std::make_unique<report::CompositeRenderer>(std::move(parts))));
}

common::Result<report::ReportRequest> Application::prepareReport(const common::MonthKey& month,
                                                                 const fs::path& destination,
                                                                 const report::IReportRenderer& renderer) {
    auto ready = requireInitialized();
    if (!common::isSuccess(ready)) {
        return common::makeError<report::ReportRequest>(common::getError(ready));
    }
    if (!month.isValid()) {
        return common::makeError<report::ReportRequest>(common::ErrorKind::Validation,
                                                        "invalid report month");
    }
    if (destination.empty()) {
        return common::makeError<report::ReportRequest>(common::ErrorKind::Validation,
                                                        "report destination is empty");
    }

    auto preferences = preferences_->get();
    if (!common::isSuccess(preferences)) {
        return common::makeError<report::ReportRequest>(common::getError(preferences));
    }

    report::ReportRequest request;
    request.month = month;
    request.snapshot = records_->snapshot();
    request.preferences = common::getValue(preferences);
    request.thresholds = config_.suggestions;
    request.destinations = report::targetsFor(destination, renderer.getOutputExtensions());
    return common::makeSuccess(std::move(request));
}

common::Status Application::startReport(const common::MonthKey& month,
                                        const fs::path& destination,
                                        ReportCallback onComplete) {
    std::lock_guard<std::mutex> lock(reportLock_);
    if (reportJob_ && reportJob_->isRunning()) {
        return common::fail(common::ErrorKind::Validation, "a report is already being generated");
    }

    auto renderer = resolveRenderer();
    if (!common::isSuccess(renderer)) {
        return common::fail(common::getError(renderer));
    }
    auto request = prepareReport(month, destination, *common::getValue(renderer));
    if (!common::isSuccess(request)) {
        return common::fail(common::getError(request));
    }

    reportJob_.reset();
    reportJob_ = std::make_unique<report::ReportJob>(std::move(common::getValue(renderer)),
                                                     std::move(common::getValue(request)),
                                                     std::move(onComplete));
    auto started = reportJob_->start();
    if (common::isSuccess(started)) {
        notifyStatusUpdate("Generating report for " + month.toString());
    }
    return started;
}

common::Result<report::ReportOutcome> Application::generateReport(const common::MonthKey& month,
                                                                  const fs::path& destination) {
    auto renderer = resolveRenderer();
    if (!common::isSuccess(renderer)) {
        return common::makeError<report::ReportOutcome>(common::getError(renderer));
    }
    auto request = prepareReport(month, destination, *common::getValue(renderer));
    if (!common::isSuccess(request)) {
        return common::makeError<report::ReportOutcome>(common::getError(request));
    }

    report::ReportJob job(std::move(common::getValue(renderer)), std::move(common::getValue(request)));
    auto outcome = job.runNow();
    if (outcome.state == report::JobState::Failed) {
        return common::makeError<report::ReportOutcome>(common::ErrorKind::Storage, outcome.error);
    }
    return common::makeSuccess(std::move(outcome));
}

bool Application::isReportRunning() const {
    std::lock_guard<std::mutex> lock(reportLock_);
    return reportJob_ && reportJob_->isRunning();
}

void Application::cancelReport() {
    std::lock_guard<std::mutex> lock(reportLock_);
    if (reportJob_) {
        reportJob_->cancel();
    }
}

void Application::waitForReport() {
    std::lock_guard<std::mutex> lock(reportLock_);
    if (reportJob_) {
        reportJob_->wait();
    }
}

std::string ConfigManager::toJson(const ApplicationConfig& config) {
    nlohmann::json j;

    j["dataDirectory"] = config.dataDirectory;
    j["expenseFile"] = config.expenseFile;
    j["incomeFile"] = config.incomeFile;
    j["preferencesFile"] = config.preferencesFile;
    j["topCategories"] = config.topCategories;
    j["preferredRenderer"] = config.preferredRenderer;
    j["fallbackRenderers"] = config.fallbackRenderers;

    j["suggestions"] = {
        {"lowSavingsPercent", config.suggestions.lowSavingsPercent},
        {"highSavingsPercent", config.suggestions.highSavingsPercent},
        {"categoryTips", config.suggestions.categoryTips}
    };

    j["logging"] = {
        {"enableDebugLogging", config.logging.enableDebugLogging},
        {"logLevel", config.logging.logLevel},
        {"logFile", config.logging.logFile}
    };

    return j.dump(2) + "\n";
}

common::Result<ApplicationConfig> ConfigManager::fromJson(const std::string& text) {
    ApplicationConfig config;

    try {
        const nlohmann::json j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            return common::makeError<ApplicationConfig>(common::ErrorKind::Storage,
                                                        "configuration must be a JSON object");
        }

        if (j.contains("dataDirectory")) {
            config.dataDirectory = j["dataDirectory"].get<std::string>();
        }

        if (j.contains("expenseFile")) {
            config.expenseFile = j["expenseFile"].get<std::string>();
        }

        if (j.contains("incomeFile")) {
            config.incomeFile = j["incomeFile"].get<std::string>();
        }

        if (j.contains("preferencesFile")) {
            config.preferencesFile = j["preferencesFile"].get<std::string>();
        }

        if (j.contains("topCategories")) {
            config.topCategories = j["topCategories"].get<std::size_t>();
        }

        if (j.contains("preferredRenderer")) {
            config.preferredRenderer = j["preferredRenderer"].get<std::string>();
        }

        if (j.contains("fallbackRenderers")) {
            config.fallbackRenderers = j["fallbackRenderers"].get<std::vector<std::string>>();
        }

        if (j.contains("suggestions")) {
            const auto& suggestions = j["suggestions"];
            config.suggestions.lowSavingsPercent =
                suggestions.value("lowSavingsPercent", config.suggestions.lowSavingsPercent);
            config.suggestions.highSavingsPercent =
                suggestions.value("highSavingsPercent", config.suggestions.highSavingsPercent);
            config.suggestions.categoryTips =
                suggestions.value("categoryTips", config.suggestions.categoryTips);
        }

        if (j.contains("logging")) {
            const auto& logging = j["logging"];
            config.logging.enableDebugLogging =
                logging.value("enableDebugLogging", config.logging.enableDebugLogging);
            config.logging.logLevel = logging.value("logLevel", config.logging.logLevel);
            config.logging.logFile = logging.value("logFile", config.logging.logFile);
        }
    } catch (const nlohmann::json::exception& e) {
        return common::makeError<ApplicationConfig>(common::ErrorKind::Storage,
                                                    std::string("malformed configuration: ") + e.what());
    }

    if (config.suggestions.lowSavingsPercent < 0 || config.suggestions.highSavingsPercent < 0) {
        return common::makeError<ApplicationConfig>(common::ErrorKind::Storage,
                                                    "savings thresholds must not be negative");
    }
    if (!isValidLogLevel(config.logging.logLevel)) {
        return common::makeError<ApplicationConfig>(common::ErrorKind::Storage,
                                                    "unknown log level '" + config.logging.logLevel + "'");
    }

    return common::makeSuccess(std::move(config));
}

common::Result<ApplicationConfig> ConfigManager::loadFromFile(const std::string& filename) {
    auto text = storage::readFile(filename);
    if (!common::isSuccess(text)) {
        if (common::getError(text).kind == common::ErrorKind::NotFound) {
            ApplicationConfig defaults;
            defaults.configFile = filename;
            return common::makeSuccess(std::move(defaults));
        }
        return common::makeError<ApplicationConfig>(common::getError(text));
    }

    auto config = fromJson(common::getValue(text));
    if (!common::isSuccess(config)) {
        const auto& error = common::getError(config);
        return common::makeError<ApplicationConfig>(error.kind, filename + ": " + error.message);
    }
    common::getValue(config).configFile = filename;
    return config;
}

common::Status ConfigManager::saveToFile(const ApplicationConfig& config, const std::string& filename) {
    return storage::writeFileAtomically(filename, toJson(config));
}

ApplicationConfig ConfigManager::loadFromEnvironment(const ApplicationConfig& base) {
    ApplicationConfig config = base;

    if (const char* directory = std::getenv("EXPENSEDESK_DATA_DIR")) {
        if (*directory != '\0') {
            config.dataDirectory = directory;
        }
    }

    if (const char* renderer = std::getenv("EXPENSEDESK_RENDERER")) {
        if (*renderer != '\0') {
            config.preferredRenderer = renderer;
        }
    }

    if (const char* level = std::getenv("LOG_LEVEL")) {
        if (isValidLogLevel(level)) {
            config.logging.logLevel = level;
        } else {
            spdlog::warn("Ignoring LOG_LEVEL '{}'", level);
        }
    }

    return config;
}

}
