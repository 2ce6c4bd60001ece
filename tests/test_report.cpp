/*
 * Filename: test_report.cpp
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

#include "report/assembler.hpp"
#include "report/csv_renderer.hpp"
#include "report/job.hpp"
#include "report/registry.hpp"
#include "storage/atomic_file.hpp"
#include "test_harness.hpp"
#include <functional>

using common::Money;
using common::MonthKey;
using testing::TempDir;
using testing::readText;
using testing::writeText;

namespace {

common::ExpenseRecord expense(int y, int m, int d, const std::string& category, std::int64_t units,
                              const std::string& note = "") {
    common::ExpenseRecord record;
    record.date = common::CalendarDate(y, m, d);
    record.category = category;
    record.amount = Money::fromUnits(units);
    record.note = note;
    return record;
}

storage::StoreSnapshot sampleSnapshot() {
    storage::StoreSnapshot snapshot;
    snapshot.expenses = {
        expense(2025, 3, 15, "Food", 150, "dinner"),
        expense(2025, 3, 2, "Food", 250),
        expense(2025, 3, 10, "Transport", 120),
        expense(2025, 4, 1, "Rent", 999),
    };
    snapshot.income[MonthKey(2025, 3)] = Money::fromUnits(1000);
    return snapshot;
}

// Writes a fixed text to every target, then runs the hook.
class TextRenderer : public report::IReportRenderer {
private:
    std::string name_;
    std::string extension_;
    std::function<void()> afterRender_;
    bool fail_ = false;

public:
    TextRenderer(std::string name, std::string extension, std::function<void()> afterRender = nullptr,
                 bool fail = false)
        : name_(std::move(name)), extension_(std::move(extension)),
          afterRender_(std::move(afterRender)), fail_(fail) {}

    std::string getName() const override { return name_; }
    std::vector<std::string> getOutputExtensions() const override { return {extension_}; }

    common::Status render(const report::ReportPayload& payload, const report::RenderTargets& targets) override {
        for (const auto& target : targets) {
            writeText(target, payload.title);
        }
        if (afterRender_) {
            afterRender_();
        }
        if (fail_) {
            return common::fail(common::ErrorKind::Storage, "disk full");
        }
        return common::ok();
    }
};

report::ReportRequest requestFor(const report::IReportRenderer& renderer, const std::filesystem::path& base) {
    report::ReportRequest request;
    request.month = MonthKey(2025, 3);
    request.snapshot = sampleSnapshot();
    request.destinations = report::targetsFor(base, renderer.getOutputExtensions());
    return request;
}

}

TEST(test_payload_for_month) {
    const auto snapshot = sampleSnapshot();
    const auto aggregate = analytics::aggregate(snapshot.expenses, Money::fromUnits(1000), MonthKey(2025, 3));
    const auto payload = report::buildReport(aggregate, common::Preferences(), snapshot.expenses);

    ASSERT_EQ(payload.title, std::string("Monthly Expense Report — 2025-03"));
    ASSERT_FALSE(payload.noData);
    ASSERT_EQ(payload.expenseText, std::string("₹520.00"));
    ASSERT_EQ(payload.balanceText, std::string("₹480.00"));
    ASSERT_EQ(payload.categories.size(), std::size_t(2));
    ASSERT_EQ(payload.categories[0].rank, std::size_t(1));
    ASSERT_EQ(payload.categories[0].sharePercent, 77);
    ASSERT_EQ(payload.rows.size(), std::size_t(3));
    ASSERT_EQ(payload.rows.front().date.day, 2);
    ASSERT_TRUE(!payload.tips.empty());
}

TEST(test_payload_without_expenses) {
    const auto snapshot = sampleSnapshot();
    const auto aggregate = analytics::aggregate(snapshot.expenses, Money::fromUnits(700), MonthKey(2025, 5));
    const auto payload = report::buildReport(aggregate, common::Preferences(), snapshot.expenses);
    ASSERT_TRUE(payload.noData);
    ASSERT_EQ(payload.incomeText, std::string("₹700.00"));
    ASSERT_TRUE(payload.categories.empty());
    ASSERT_TRUE(payload.tips.empty());
    ASSERT_TRUE(payload.rows.empty());
}

TEST(test_table_output) {
    const auto snapshot = sampleSnapshot();
    const auto aggregate = analytics::aggregate(snapshot.expenses, Money(), MonthKey(2025, 3));
    common::Preferences preferences;
    preferences.currencySymbol = "$";
    const auto table = report::formatReportTable(report::buildReport(aggregate, preferences, snapshot.expenses));
    ASSERT_EQ(table, std::string("Date,Category,Amount,Note\n"
                                 "2025-03-02,Food,$250.00,\n"
                                 "2025-03-10,Transport,$120.00,\n"
                                 "2025-03-15,Food,$150.00,dinner\n"));
}

TEST(test_registry_lookup) {
    report::RendererRegistry registry;
    registry.registerRenderer(std::make_unique<report::FunctionRendererFactory>(
        "csv", []() { return std::make_unique<report::CsvTableRenderer>(); }));
    registry.registerRenderer(std::make_unique<report::FunctionRendererFactory>(
        "broken", []() { return std::unique_ptr<report::IReportRenderer>(); }));

    ASSERT_TRUE(registry.isRegistered("csv"));
    ASSERT_OK(registry.create("csv"));
    ASSERT_ERROR(registry.create("pdf"), common::ErrorKind::DependencyUnavailable);
    ASSERT_ERROR(registry.create("broken"), common::ErrorKind::DependencyUnavailable);

    registry.unregisterRenderer("csv");
    ASSERT_FALSE(registry.isRegistered("csv"));
}

TEST(test_targets_follow_extensions) {
    const auto targets = report::targetsFor("out/report.pdf", {"png", "csv"});
    ASSERT_EQ(targets.size(), std::size_t(2));
    ASSERT_EQ(targets[0].string(), std::string("out/report.png"));
    ASSERT_EQ(targets[1].string(), std::string("out/report.csv"));
}

TEST(test_job_publishes_all_outputs) {
    TempDir dir;
    std::vector<std::unique_ptr<report::IReportRenderer>> parts;
    parts.push_back(std::make_unique<TextRenderer>("text", "txt"));
    parts.push_back(std::make_unique<report::CsvTableRenderer>());
    auto renderer = std::make_unique<report::CompositeRenderer>(std::move(parts));
    ASSERT_EQ(renderer->getName(), std::string("text+csv"));

    auto request = requestFor(*renderer, dir / "reports" / "march.pdf");
    report::ReportJob job(std::move(renderer), std::move(request));
    const auto outcome = job.runNow();

    ASSERT_TRUE(outcome.state == report::JobState::Completed);
    ASSERT_EQ(outcome.published.size(), std::size_t(2));
    ASSERT_EQ(readText(dir / "reports" / "march.txt"), std::string("Monthly Expense Report — 2025-03"));
    ASSERT_TRUE(readText(dir / "reports" / "march.csv").find("Transport") != std::string::npos);
    ASSERT_FALSE(std::filesystem::exists(storage::partialPathFor(dir / "reports" / "march.csv")));
}

TEST(test_cancel_before_publication) {
    TempDir dir;
    writeText(dir / "march.txt", "previous");

    report::ReportJob* running = nullptr;
    auto renderer = std::make_unique<TextRenderer>("text", "txt", [&running]() { running->cancel(); });
    auto request = requestFor(*renderer, dir / "march.txt");
    report::ReportJob job(std::move(renderer), std::move(request));
    running = &job;

    const auto outcome = job.runNow();
    ASSERT_TRUE(outcome.state == report::JobState::Cancelled);
    ASSERT_TRUE(outcome.published.empty());
    ASSERT_EQ(readText(dir / "march.txt"), std::string("previous"));
    ASSERT_FALSE(std::filesystem::exists(storage::partialPathFor(dir / "march.txt")));
}

TEST(test_failed_render_keeps_previous_file) {
    TempDir dir;
    writeText(dir / "march.txt", "previous");

    auto renderer = std::make_unique<TextRenderer>("text", "txt", nullptr, true);
    auto request = requestFor(*renderer, dir / "march.txt");
    report::ReportJob job(std::move(renderer), std::move(request));

    const auto outcome = job.runNow();
    ASSERT_TRUE(outcome.state == report::JobState::Failed);
    ASSERT_TRUE(outcome.error.find("disk full") != std::string::npos);
    ASSERT_EQ(readText(dir / "march.txt"), std::string("previous"));
    ASSERT_FALSE(std::filesystem::exists(storage::partialPathFor(dir / "march.txt")));
}

TEST(test_background_job_reports_completion) {
    TempDir dir;
    std::atomic<bool> notified{false};
    auto renderer = std::make_unique<report::CsvTableRenderer>();
    auto request = requestFor(*renderer, dir / "march.csv");
    report::ReportJob job(std::move(renderer), std::move(request),
                          [&notified](const report::ReportOutcome& outcome) {
                              notified = outcome.state == report::JobState::Completed;
                          });

    ASSERT_OK(job.start());
    ASSERT_ERROR(job.start(), common::ErrorKind::Validation);
    job.wait();

    ASSERT_TRUE(notified.load());
    ASSERT_TRUE(job.getState() == report::JobState::Completed);
    ASSERT_TRUE(std::filesystem::exists(dir / "march.csv"));

    const auto outcome = job.getOutcome();
    ASSERT_TRUE(outcome.state == report::JobState::Completed);
    ASSERT_TRUE(outcome.error.empty());
    ASSERT_FALSE(outcome.noData);
}

int main() {
    std::cout << "Report tests:\n";
    RUN_TEST(test_payload_for_month);
    RUN_TEST(test_payload_without_expenses);
    RUN_TEST(test_table_output);
    RUN_TEST(test_registry_lookup);
    RUN_TEST(test_targets_follow_extensions);
    RUN_TEST(test_job_publishes_all_outputs);
    RUN_TEST(test_cancel_before_publication);
    RUN_TEST(test_failed_render_keeps_previous_file);
    RUN_TEST(test_background_job_reports_completion);
    return TEST_RESULT();
}
