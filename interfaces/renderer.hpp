/*
 * Filename: renderer.hpp
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

#include "common/result.hpp"
#include "report/assembler.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace report {

// Output produced by one render call, one path per extension the renderer
// declares, in the same order.
using RenderTargets = std::vector<std::filesystem::path>;

class IReportRenderer {
public:
    virtual ~IReportRenderer() = default;

    virtual std::string getName() const = 0;
    // Extensions without the dot, e.g. {"pdf"} or {"png"}.
    virtual std::vector<std::string> getOutputExtensions() const = 0;
    // Writes the payload to `targets`. Must not modify anything else.
    virtual common::Status render(const ReportPayload& payload, const RenderTargets& targets) = 0;

    virtual std::string getDescription() const { return ""; }
};

class IRendererFactory {
public:
    virtual ~IRendererFactory() = default;

    virtual std::unique_ptr<IReportRenderer> createRenderer() = 0;
    virtual std::string getName() const = 0;
    virtual bool isAvailable() const { return true; }
};

}
