/*
 * Filename: logging.cpp
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

#include "core/logging.hpp"
#include "common/strings.hpp"
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace core {

namespace {

spdlog::level::level_enum parseLevel(const std::string& text) {
    const std::string level = common::toLower(common::trim(text));
    if (level == "warning") {
        return spdlog::level::warn;
    }
    return spdlog::level::from_str(level);
}

}

bool isValidLogLevel(const std::string& level) {
    const std::string normalized = common::toLower(common::trim(level));
    return normalized == "off" || normalized == "warning" ||
           spdlog::level::from_str(normalized) != spdlog::level::off;
}

common::Status setupLogging(const LoggingConfig& config) {
    if (!isValidLogLevel(config.logLevel)) {
        return common::fail(common::ErrorKind::Validation, "unknown log level '" + config.logLevel + "'");
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!config.logFile.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.logFile));
        } catch (const spdlog::spdlog_ex& e) {
            return common::fail(common::ErrorKind::Storage,
                                "cannot open log file " + config.logFile + ": " + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(config.enableDebugLogging ? spdlog::level::debug : parseLevel(config.logLevel));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(kLoggerName);
    spdlog::set_default_logger(logger);
    return common::ok();
}

}
