/*
 * Filename: logging.hpp
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
#include <string>

namespace core {

inline const std::string kLoggerName = "expensedesk";

struct LoggingConfig {
    bool enableDebugLogging = false;
    std::string logLevel = "info";
    // Empty disables the file sink.
    std::string logFile;
};

// Installs the "expensedesk" logger (colour stderr plus optional file) as
// the spdlog default. Safe to call again with a new configuration.
common::Status setupLogging(const LoggingConfig& config);

// "trace", "debug", "info", "warn"/"warning", "error", "critical", "off";
// case-insensitive.
bool isValidLogLevel(const std::string& level);

}
