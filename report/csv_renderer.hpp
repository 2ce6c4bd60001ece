/*
 * Filename: csv_renderer.hpp
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

#include "interfaces/renderer.hpp"

namespace report {

// Tabular output: one row per expense of the report month.
class CsvTableRenderer : public IReportRenderer {
public:
    std::string getName() const override { return "csv"; }
    std::vector<std::string> getOutputExtensions() const override { return {"csv"}; }
    common::Status render(const ReportPayload& payload, const RenderTargets& targets) override;
    std::string getDescription() const override { return "Expense table (CSV)"; }
};

std::string formatReportTable(const ReportPayload& payload);

}
