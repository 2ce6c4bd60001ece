/*
 * Filename: job.cpp
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

#include "report/job.hpp"
#include "report/assembler.hpp"
#include "storage/atomic_file.hpp"
#include <exception>
#include <utility>
#include <spdlog/spdlog.h>

namespace report {

namespace fs = std::filesystem;

const char* toString(JobState state) {
    switch (state) {
        case JobState::Idle: return "idle";
        case JobState::Running: return "running";
        case JobState::Completed: return "completed";
        case JobState::Failed: return "failed";
        case JobState::Cancelled: return "cancelled";
    }
    return "idle";
}

RenderTargets targetsFor(const fs::path& base, const std::vector<std::string>& extensions) {
    RenderTargets targets;
    targets.reserve(extensions.size());
    for (const auto& extension : extensions) {
        fs::path target = base;
        target.replace_extension("." + extension);
        targets.push_back(std::move(target));
    }
    return targets;
}

ReportJob::ReportJob(std::unique_ptr<IReportRenderer> renderer, ReportRequest request,
                     CompletionCallback onComplete)
    : renderer_(std::move(renderer)), request_(std::move(request)), onComplete_(std::move(onComplete)) {}

ReportJob::~ReportJob() {
    cancel();
    wait();
}

common::Status ReportJob::start() {
    if (!renderer_) {
        return common::fail(common::ErrorKind::DependencyUnavailable, "no renderer for report job");
    }
    JobState expected = JobState::Idle;
    if (!state_.compare_exchange_strong(expected, JobState::Running)) {
        return common::fail(common::ErrorKind::Validation, "report job was already started");
    }

    spdlog::info("Report job for {} started with renderer '{}'", request_.month.toString(), renderer_->getName());
    worker_ = std::thread([this]() {
        finish(execute());
    });
    return common::ok();
}

void ReportJob::wait() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

ReportOutcome ReportJob::getOutcome() const {
    std::lock_guard<std::mutex> lock(outcomeLock_);
    return outcome_;
}

ReportOutcome ReportJob::runNow() {
    ReportOutcome outcome;
    if (!renderer_) {
        outcome.state = JobState::Failed;
        outcome.error = "no renderer for report job";
        finish(outcome);
        return outcome;
    }
    JobState expected = JobState::Idle;
    if (!state_.compare_exchange_strong(expected, JobState::Running)) {
        outcome.state = JobState::Failed;
        outcome.error = "report job was already started";
        return outcome;
    }
    outcome = execute();
    finish(outcome);
    return outcome;
}

ReportOutcome ReportJob::execute() {
    ReportOutcome outcome;
    outcome.rendererName = renderer_->getName();

    const auto extensions = renderer_->getOutputExtensions();
    if (request_.destinations.size() != extensions.size()) {
        outcome.state = JobState::Failed;
        outcome.error = "renderer '" + outcome.rendererName + "' writes " + std::to_string(extensions.size()) +
                        " outputs but " + std::to_string(request_.destinations.size()) + " were given";
        return outcome;
    }

    const auto& snapshot = request_.snapshot;
    auto incomeIt = snapshot.income.find(request_.month);
    const common::Money income = incomeIt != snapshot.income.end() ? incomeIt->second : common::Money();
    const auto aggregate = analytics::aggregate(snapshot.expenses, income, request_.month);
    const auto payload = buildReport(aggregate, request_.preferences, snapshot.expenses, request_.thresholds);
    outcome.noData = payload.noData;

    RenderTargets temporaries;
    temporaries.reserve(request_.destinations.size());
    for (const auto& destination : request_.destinations) {
        std::error_code ec;
        const fs::path directory = destination.parent_path();
        if (!directory.empty()) {
            fs::create_directories(directory, ec);
        }
        temporaries.push_back(storage::partialPathFor(destination));
    }

    auto discard = [&temporaries]() {
        for (const auto& temporary : temporaries) {
            storage::removeQuietly(temporary);
        }
    };

    if (cancelRequested_) {
        outcome.state = JobState::Cancelled;
        return outcome;
    }

    common::Status status = common::ok();
    try {
        status = renderer_->render(payload, temporaries);
    } catch (const std::exception& e) {
        status = common::fail(common::ErrorKind::Storage, std::string("renderer raised: ") + e.what());
    }
    if (!common::isSuccess(status)) {
        discard();
        outcome.state = JobState::Failed;
        outcome.error = common::describe(common::getError(status));
        return outcome;
    }

    if (cancelRequested_) {
        discard();
        outcome.state = JobState::Cancelled;
        return outcome;
    }

    for (std::size_t i = 0; i < temporaries.size(); ++i) {
        auto published = storage::publishFile(temporaries[i], request_.destinations[i]);
        if (!common::isSuccess(published)) {
            for (std::size_t j = i + 1; j < temporaries.size(); ++j) {
                storage::removeQuietly(temporaries[j]);
            }
            outcome.state = JobState::Failed;
            outcome.error = common::describe(common::getError(published));
            return outcome;
        }
        outcome.published.push_back(request_.destinations[i]);
    }

    outcome.state = JobState::Completed;
    return outcome;
}

void ReportJob::finish(const ReportOutcome& outcome) {
    {
        std::lock_guard<std::mutex> lock(outcomeLock_);
        outcome_ = outcome;
    }
    state_ = outcome.state;

    switch (outcome.state) {
        case JobState::Completed:
            spdlog::info("Report for {} published ({} files)", request_.month.toString(), outcome.published.size());
            break;
        case JobState::Cancelled:
            spdlog::info("Report job for {} cancelled", request_.month.toString());
            break;
        default:
            spdlog::error("Report job for {} failed: {}", request_.month.toString(), outcome.error);
            break;
    }

    if (onComplete_) {
        try {
            onComplete_(outcome);
        } catch (const std::exception& e) {
            spdlog::error("Report completion callback raised: {}", e.what());
        }
    }
}

}
