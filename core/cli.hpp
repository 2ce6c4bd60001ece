/*
 * Filename: cli.hpp
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
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace core {

class Application;

inline const std::string kVersion = "1.0";

enum class Command {
    Gui, Summary, AddExpense, SetIncome, List, Sip, Report, Help, Version
};

struct CommandLine {
    Command command = Command::Gui;
    std::vector<std::string> arguments;
    std::optional<std::string> goal;

    std::string configFile;
    std::string dataDirectory;
    std::string logLevel;
};

// Options may appear in any order; exactly one command is allowed.
common::Result<CommandLine> parseCommandLine(const std::vector<std::string>& args);

void printUsage(std::ostream& out, const std::string& programName);

// Runs a non-GUI command against an initialized application. Returns the
// process exit code: 0 on success, 1 on any error.
int runCommand(Application& app, const CommandLine& commandLine, std::ostream& out, std::ostream& err);

}
