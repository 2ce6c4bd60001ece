/*
 * Filename: csv_renderer.cpp
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

#include "report/csv_renderer.hpp"
#include "storage/csv.hpp"
#include <fstream>

namespace report {

std::string formatReportTable(const ReportPayload& payload) {
    common::Preferences preferences;
    preferences.currencySymbol = payload.currencySymbol;

    std::vector<storage::csv::Row> rows;
    rows.reserve(payload.rows.size() + 1);
    rows.push_back({"Date", "Category", "Amount", "Note"});
    for (const auto& record : payload.rows) {
        rows.push_back({
            record.date.toString(),
            record.category,
            common::displaySymbol(record, preferences) + record.amount.toString(),
            record.note,
        });
    }
    return storage::csv::format(rows);
}

common::Status CsvTableRenderer::render(const ReportPayload& payload, const RenderTargets& targets) {
    if (targets.empty()) {
        return common::fail(common::ErrorKind::Validation, "csv renderer needs an output path");
    }

    const std::string content = formatReportTable(payload);
    std::ofstream file(targets.front(), std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return common::fail(common::ErrorKind::Storage, "cannot open " + targets.front().string());
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    if (!file.good()) {
        return common::fail(common::ErrorKind::Storage, "write failed for " + targets.front().string());
    }
    return common::ok();
}

}
