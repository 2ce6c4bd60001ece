/*
 * Filename: main.cpp
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

#include "core/application.hpp"
#include "core/cli.hpp"
#include "core/logging.hpp"
#include "core/signals.hpp"
#include "gui/main_window.hpp"
#include <QApplication>
#include <QTimer>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>

namespace {
    constexpr int kShutdownPollMs = 200;
}

int runConsoleMode(const core::ApplicationConfig& config, const core::CommandLine& commandLine) {
    core::Application app(config);
    auto status = app.initialize();
    if (!common::isSuccess(status)) {
        std::cerr << "Error: " << common::describe(common::getError(status)) << std::endl;
        return 1;
    }

    const int result = core::runCommand(app, commandLine, std::cout, std::cerr);
    app.shutdown();
    return result;
}

int runGuiMode(int argc, char* argv[], const core::ApplicationConfig& config) {
    QApplication qtApp(argc, argv);
    qtApp.setApplicationName("ExpenseDesk");
    qtApp.setApplicationVersion(QString::fromStdString(core::kVersion));
    qtApp.setApplicationDisplayName("ExpenseDesk");

    auto app = std::make_unique<core::Application>(config);
    auto status = app->initialize();
    if (!common::isSuccess(status)) {
        std::cerr << "Error: " << common::describe(common::getError(status)) << std::endl;
        return 1;
    }

    gui::MainWindow mainWindow(std::move(app));

    core::installShutdownHandlers();
    QTimer shutdownPoll;
    QObject::connect(&shutdownPoll, &QTimer::timeout, [&mainWindow, &qtApp]() {
        if (core::shutdownRequested()) {
            spdlog::info("Shutdown signal received");
            mainWindow.close();
            qtApp.quit();
        }
    });
    shutdownPoll.start(kShutdownPollMs);

    mainWindow.show();
    return qtApp.exec();
}

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = core::parseCommandLine(args);
    if (!common::isSuccess(parsed)) {
        std::cerr << common::getError(parsed).message << std::endl;
        core::printUsage(std::cerr, argv[0]);
        return 1;
    }
    const auto& commandLine = common::getValue(parsed);

    if (commandLine.command == core::Command::Help) {
        core::printUsage(std::cout, argv[0]);
        return 0;
    }
    if (commandLine.command == core::Command::Version) {
        std::cout << "ExpenseDesk v" << core::kVersion << std::endl;
        return 0;
    }

    core::ApplicationConfig config;
    if (!commandLine.configFile.empty()) {
        auto loaded = core::ConfigManager::loadFromFile(commandLine.configFile);
        if (!common::isSuccess(loaded)) {
            std::cerr << "Failed to load config: " << common::describe(common::getError(loaded)) << std::endl;
            return 1;
        }
        config = common::getValue(loaded);
    }

    config = core::ConfigManager::loadFromEnvironment(config);
    if (!commandLine.dataDirectory.empty()) {
        config.dataDirectory = commandLine.dataDirectory;
    }
    if (!commandLine.logLevel.empty()) {
        config.logging.logLevel = commandLine.logLevel;
    }

    auto logging = core::setupLogging(config.logging);
    if (!common::isSuccess(logging)) {
        std::cerr << "Logging setup failed: " << common::describe(common::getError(logging)) << std::endl;
        return 1;
    }
    spdlog::debug("Data directory: {}", config.dataDirectory);

    if (commandLine.command == core::Command::Gui) {
        return runGuiMode(argc, argv, config);
    }
    return runConsoleMode(config, commandLine);
}
