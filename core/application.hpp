/*
 * Filename: application.hpp
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

#include "analytics/aggregation.hpp"
#include "analytics/suggestions.hpp"
#include "common/result.hpp"
#include "common/types.hpp"
#include "core/logging.hpp"
#include "report/job.hpp"
#include "report/registry.hpp"
#include "storage/preferences_store.hpp"
#include "storage/record_store.hpp"
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace core {

struct ApplicationConfig {
    std::string dataDirectory = ".";
    std::string expenseFile = "expenses.csv";
    std::string incomeFile = "income.csv";
    std::string preferencesFile = "preferences.json";
    std::size_t topCategories = analytics::kDefaultTopCategories;

    std::string preferredRenderer = "pdf";
    std::vector<std::string> fallbackRenderers = {"png", "csv"};

    analytics::SuggestionThresholds suggestions;
    LoggingConfig logging;

    std::string configFile = "expensedesk.json";

    // File names are resolved against dataDirectory unless absolute.
    std::filesystem::path expensePath() const;
    std::filesystem::path incomePath() const;
    std::filesystem::path preferencesPath() const;
};

class Application {
public:
    using StatusCallback = std::function<void(const std::string&)>;
    using DataChangedCallback = std::function<void()>;
    using ReportCallback = report::ReportJob::CompletionCallback;

private:
    ApplicationConfig config_;

    std::unique_ptr<storage::RecordStore> records_;
    std::unique_ptr<storage::PreferencesStore> preferences_;
    report::RendererRegistry renderers_;

    std::unique_ptr<report::ReportJob> reportJob_;
    mutable std::mutex reportLock_;

    std::vector<StatusCallback> statusCallbacks_;
    std::vector<DataChangedCallback> dataChangedCallbacks_;
    mutable std::shared_mutex callbackLock_;

    bool initialized_ = false;

public:
    Application();
    explicit Application(ApplicationConfig config);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Opens both stores, loads the records and registers the built-in
    // renderers.
    common::Status initialize();
    void shutdown();

    bool isInitialized() const { return initialized_; }
    const ApplicationConfig& getConfig() const { return config_; }

    storage::RecordStore& getRecords() { return *records_; }
    const storage::RecordStore& getRecords() const { return *records_; }
    report::RendererRegistry& getRenderers() { return renderers_; }

    common::Result<storage::RecordId> addExpense(const common::ExpenseRecord& record);
    common::Status updateExpense(storage::RecordId id, const common::ExpenseRecord& record);
    common::Status deleteExpense(storage::RecordId id);
    common::Status setIncome(const common::MonthKey& month, const common::Money& amount);

    common::Result<common::Preferences> getPreferences();
    common::Status setPreferences(const common::Preferences& preferences);

    analytics::MonthlyAggregate aggregateMonth(const common::MonthKey& month) const;
    common::Result<analytics::SuggestionReport> suggestionsFor(const common::MonthKey& month);
    common::Result<std::string> summaryText(const common::MonthKey& month);

    // The preferred renderer, or the available fallbacks combined when it is
    // not registered.
    common::Result<std::unique_ptr<report::IReportRenderer>> resolveRenderer() const;

    // Runs a report in the background. Fails when another report is running.
    // `onComplete` runs on the worker thread and must not call back into the
    // Application.
    common::Status startReport(const common::MonthKey& month,
                               const std::filesystem::path& destination,
                               ReportCallback onComplete = nullptr);
    // Same work on the calling thread.
    common::Result<report::ReportOutcome> generateReport(const common::MonthKey& month,
                                                         const std::filesystem::path& destination);
    bool isReportRunning() const;
    void cancelReport();
    void waitForReport();

    void addStatusCallback(StatusCallback callback);
    void addDataChangedCallback(DataChangedCallback callback);

private:
    common::Status requireInitialized() const;
    common::Result<report::ReportRequest> prepareReport(const common::MonthKey& month,
                                                        const std::filesystem::path& destination,
                                                        const report::IReportRenderer& renderer);

    void registerBuiltinRenderers();

    void notifyStatusUpdate(const std::string& status);
    void notifyDataChanged();
};

class ConfigManager {
public:
    // A missing file yields the defaults; a malformed one is a StorageError.
    static common::Result<ApplicationConfig> loadFromFile(const std::string& filename);
    static common::Status saveToFile(const ApplicationConfig& config, const std::string& filename);
    // Applies EXPENSEDESK_DATA_DIR, EXPENSEDESK_RENDERER and LOG_LEVEL on top
    // of `base`.
    static ApplicationConfig loadFromEnvironment(const ApplicationConfig& base = ApplicationConfig());

    static std::string toJson(const ApplicationConfig& config);
    static common::Result<ApplicationConfig> fromJson(const std::string& text);
};

}
