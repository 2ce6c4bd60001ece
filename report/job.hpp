/*
 * Filename: job.hpp
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

#include "analytics/suggestions.hpp"
#include "interfaces/renderer.hpp"
#include "storage/record_store.hpp"
#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace report {

enum class JobState {
    Idle, Running, Completed, Failed, Cancelled
};

const char* toString(JobState state);

struct ReportRequest {
    common::MonthKey month;
    storage::StoreSnapshot snapshot;
    common::Preferences preferences;
    analytics::SuggestionThresholds thresholds;
    // One destination per extension of the renderer, in the same order.
    RenderTargets destinations;
};

struct ReportOutcome {
    JobState state = JobState::Idle;
    RenderTargets published;
    std::string rendererName;
    bool noData = false;
    std::string error;
};

/*
 * ReportJob
 * ----------------
 * Builds and renders one monthly report on a worker thread.
 *
 *  - works only on the snapshot and preferences copied into the request
 *  - every output is rendered to a ".partial" sibling and renamed over its
 *    destination once all outputs rendered successfully
 *  - cancel() before publication removes the temporaries, nothing is
 *    published
 *
 * The completion callback runs on the worker thread.
 */
class ReportJob {
public:
    using CompletionCallback = std::function<void(const ReportOutcome&)>;

private:
    std::unique_ptr<IReportRenderer> renderer_;
    ReportRequest request_;
    CompletionCallback onComplete_;

    std::thread worker_;
    std::atomic<bool> cancelRequested_{false};
    std::atomic<JobState> state_{JobState::Idle};

    mutable std::mutex outcomeLock_;
    ReportOutcome outcome_;

public:
    ReportJob(std::unique_ptr<IReportRenderer> renderer, ReportRequest request,
              CompletionCallback onComplete = nullptr);
    ~ReportJob();

    ReportJob(const ReportJob&) = delete;
    ReportJob& operator=(const ReportJob&) = delete;

    common::Status start();
    void cancel() { cancelRequested_ = true; }
    void wait();

    JobState getState() const { return state_.load(); }
    bool isRunning() const { return state_.load() == JobState::Running; }
    ReportOutcome getOutcome() const;

    // Runs the whole job on the calling thread.
    ReportOutcome runNow();

private:
    ReportOutcome execute();
    void finish(const ReportOutcome& outcome);
};

// Destinations for a renderer's extensions derived from one base path:
// "report.pdf" with {"png","csv"} gives "report.png" and "report.csv".
RenderTargets targetsFor(const std::filesystem::path& base, const std::vector<std::string>& extensions);

}
