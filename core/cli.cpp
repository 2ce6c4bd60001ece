/*
 * Filename: cli.cpp
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

#include "core/cli.hpp"
#include "core/application.hpp"
#include "common/strings.hpp"
#include "math/sip/calculator.hpp"
#include <cstddef>
#include <iomanip>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace core {

namespace {

bool isOption(const std::string& arg) {
    return arg.size() > 2 && arg.compare(0, 2, "--") == 0;
}

std::optional<double> parseNumber(const std::string& text) {
    try {
        std::size_t used = 0;
        const double value = std::stod(text, &used);
        if (used != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

common::Result<common::MonthKey> monthArgument(const CommandLine& commandLine, std::size_t index) {
    if (commandLine.arguments.size() <= index) {
        return common::makeSuccess(common::MonthKey::current());
    }
    const auto month = common::MonthKey::parse(commandLine.arguments[index]);
    if (!month || !month->isValid()) {
        return common::makeError<common::MonthKey>(common::ErrorKind::Validation,
                                                   "invalid month '" + commandLine.arguments[index] +
                                                       "', expected YYYY-MM");
    }
    return common::makeSuccess(*month);
}

int reportError(std::ostream& err, const common::Error& error) {
    err << "Error: " << common::describe(error) << "\n";
    return 1;
}

int runSummary(Application& app, const CommandLine& commandLine, std::ostream& out, std::ostream& err) {
    auto month = monthArgument(commandLine, 0);
    if (!common::isSuccess(month)) {
        return reportError(err, common::getError(month));
    }
    auto text = app.summaryText(common::getValue(month));
    if (!common::isSuccess(text)) {
        return reportError(err, common::getError(text));
    }
    out << common::getValue(text);
    return 0;
}

int runAddExpense(Application& app, const CommandLine& commandLine, std::ostream& out, std::ostream& err) {
    const auto& args = commandLine.arguments;

    const auto date = common::CalendarDate::parse(args[0]);
    if (!date || !date->isValid()) {
        return reportError(err, {common::ErrorKind::Validation, "invalid date '" + args[0] + "', expected YYYY-MM-DD"});
    }
    const auto amount = common::parseLabelledAmount(args[2]);
    if (!amount) {
        return reportError(err, {common::ErrorKind::Validation, "invalid amount '" + args[2] + "'"});
    }

    common::ExpenseRecord record;
    record.date = *date;
    record.category = common::trim(args[1]);
    record.amount = amount->amount;
    record.currencySymbol = amount->symbol;
    record.note = args.size() > 3 ? args[3] : "";

    auto id = app.addExpense(record);
    if (!common::isSuccess(id)) {
        return reportError(err, common::getError(id));
    }
    out << "Added expense #" << common::getValue(id) << "\n";
    return 0;
}

int runSetIncome(Application& app, const CommandLine& commandLine, std::ostream& out, std::ostream& err) {
    auto month = monthArgument(commandLine, 0);
    if (!common::isSuccess(month)) {
        return reportError(err, common::getError(month));
    }
    const auto amount = common::parseLabelledAmount(commandLine.arguments[1]);
    if (!amount) {
        return reportError(err, {common::ErrorKind::Validation, "invalid amount '" + commandLine.arguments[1] + "'"});
    }

    auto status = app.setIncome(common::getValue(month), amount->amount);
    if (!common::isSuccess(status)) {
        return reportError(err, common::getError(status));
    }
    out << "Income for " << common::getValue(month).toString() << " saved\n";
    return 0;
}

int runList(Application& app, const CommandLine& commandLine, std::ostream& out, std::ostream& err) {
    std::optional<common::MonthKey> filter;
    if (!commandLine.arguments.empty()) {
        auto month = monthArgument(commandLine, 0);
        if (!common::isSuccess(month)) {
            return reportError(err, common::getError(month));
        }
        filter = common::getValue(month);
    }

    auto preferences = app.getPreferences();
    if (!common::isSuccess(preferences)) {
        return reportError(err, common::getError(preferences));
    }

    const auto expenses = app.getRecords().listExpenses();
    std::size_t shown = 0;
    for (std::size_t id = 0; id < expenses.size(); ++id) {
        const auto& record = expenses[id];
        if (filter && record.month() != *filter) {
            continue;
        }
        out << std::setw(5) << id << "  " << record.date.toString() << "  "
            << std::left << std::setw(16) << record.category << std::right << "  "
            << std::setw(14) << record.amount.format(common::displaySymbol(record, common::getValue(preferences)));
        if (!record.note.empty()) {
            out << "  " << record.note;
        }
        out << "\n";
        ++shown;
    }
    if (shown == 0) {
        out << "No expenses recorded\n";
    }
    return 0;
}

int runSip(Application& app, const CommandLine& commandLine, std::ostream& out, std::ostream& err) {
    const auto& args = commandLine.arguments;

    const auto monthly = common::Money::parse(args[0]);
    const auto rate = parseNumber(args[1]);
    const auto years = parseNumber(args[2]);
    if (!monthly || !rate || !years) {
        return reportError(err, {common::ErrorKind::Validation, "please enter valid numeric values"});
    }

    auto months = math::sip::monthsForYears(*years);
    if (!common::isSuccess(months)) {
        return reportError(err, common::getError(months));
    }

    math::sip::SipParameters parameters;
    parameters.annualRatePercent = *rate;
    parameters.months = common::getValue(months);

    auto projection = math::sip::futureValue(*monthly, parameters);
    if (!common::isSuccess(projection)) {
        return reportError(err, common::getError(projection));
    }

    std::optional<math::sip::SipRequirement> goal;
    if (commandLine.goal) {
        const auto target = common::Money::parse(*commandLine.goal);
        if (!target) {
            return reportError(err, {common::ErrorKind::Validation, "invalid goal '" + *commandLine.goal + "'"});
        }
        auto requirement = math::sip::requiredInvestment(*target, parameters);
        if (!common::isSuccess(requirement)) {
            return reportError(err, common::getError(requirement));
        }
        goal = common::getValue(requirement);
    }

    auto preferences = app.getPreferences();
    if (!common::isSuccess(preferences)) {
        return reportError(err, common::getError(preferences));
    }
    out << math::sip::describe(common::getValue(projection), goal, common::getValue(preferences).currencySymbol);
    return 0;
}

int runReport(Application& app, const CommandLine& commandLine, std::ostream& out, std::ostream& err) {
    auto month = monthArgument(commandLine, 0);
    if (!common::isSuccess(month)) {
        return reportError(err, common::getError(month));
    }

    auto outcome = app.generateReport(common::getValue(month), commandLine.arguments[1]);
    if (!common::isSuccess(outcome)) {
        return reportError(err, common::getError(outcome));
    }

    const auto& result = common::getValue(outcome);
    if (result.noData) {
        out << "No expenses found for " << common::getValue(month).toString() << "\n";
    }
    out << "Report written with '" << result.rendererName << "':\n";
    for (const auto& path : result.published) {
        out << "  " << path.string() << "\n";
    }
    return 0;
}

}

common::Result<CommandLine> parseCommandLine(const std::vector<std::string>& args) {
    CommandLine commandLine;
    bool haveCommand = false;

    auto setCommand = [&](Command command) -> common::Status {
        if (haveCommand) {
            return common::fail(common::ErrorKind::Validation, "only one command may be given");
        }
        commandLine.command = command;
        haveCommand = true;
        return common::ok();
    };

    auto takeValue = [&](std::size_t& i, const std::string& option) -> common::Result<std::string> {
        if (i + 1 >= args.size()) {
            return common::makeError<std::string>(common::ErrorKind::Validation, option + " needs a value");
        }
        return common::makeSuccess(args[++i]);
    };

    auto takeArguments = [&](std::size_t& i, const std::string& option, std::size_t required,
                             std::size_t optional) -> common::Status {
        for (std::size_t n = 0; n < required; ++n) {
            if (i + 1 >= args.size() || isOption(args[i + 1])) {
                return common::fail(common::ErrorKind::Validation,
                                    option + " needs " + std::to_string(required) + " argument(s)");
            }
            commandLine.arguments.push_back(args[++i]);
        }
        for (std::size_t n = 0; n < optional; ++n) {
            if (i + 1 >= args.size() || isOption(args[i + 1])) {
                break;
            }
            commandLine.arguments.push_back(args[++i]);
        }
        return common::ok();
    };

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        common::Status status = common::ok();

        if (arg == "--help" || arg == "-h") {
            status = setCommand(Command::Help);
        } else if (arg == "--version") {
            status = setCommand(Command::Version);
        } else if (arg == "--gui") {
            status = setCommand(Command::Gui);
        } else if (arg == "--summary") {
            status = setCommand(Command::Summary);
            if (common::isSuccess(status)) {
                status = takeArguments(i, arg, 0, 1);
            }
        } else if (arg == "--add-expense") {
            status = setCommand(Command::AddExpense);
            if (common::isSuccess(status)) {
                status = takeArguments(i, arg, 3, 1);
            }
        } else if (arg == "--set-income") {
            status = setCommand(Command::SetIncome);
            if (common::isSuccess(status)) {
                status = takeArguments(i, arg, 2, 0);
            }
        } else if (arg == "--list") {
            status = setCommand(Command::List);
            if (common::isSuccess(status)) {
                status = takeArguments(i, arg, 0, 1);
            }
        } else if (arg == "--sip") {
            status = setCommand(Command::Sip);
            if (common::isSuccess(status)) {
                status = takeArguments(i, arg, 3, 0);
            }
        } else if (arg == "--report") {
            status = setCommand(Command::Report);
            if (common::isSuccess(status)) {
                status = takeArguments(i, arg, 2, 0);
            }
        } else if (arg == "--goal" || arg == "--config" || arg == "--data-dir" || arg == "--log-level") {
            auto value = takeValue(i, arg);
            if (!common::isSuccess(value)) {
                return common::makeError<CommandLine>(common::getError(value));
            }
            if (arg == "--goal") {
                commandLine.goal = common::getValue(value);
            } else if (arg == "--config") {
                commandLine.configFile = common::getValue(value);
            } else if (arg == "--data-dir") {
                commandLine.dataDirectory = common::getValue(value);
            } else {
                commandLine.logLevel = common::getValue(value);
            }
        } else {
            return common::makeError<CommandLine>(common::ErrorKind::Validation, "unknown option: " + arg);
        }

        if (!common::isSuccess(status)) {
            return common::makeError<CommandLine>(common::getError(status));
        }
    }

    if (commandLine.goal && commandLine.command != Command::Sip) {
        return common::makeError<CommandLine>(common::ErrorKind::Validation, "--goal is only valid with --sip");
    }
    return common::makeSuccess(std::move(commandLine));
}

void printUsage(std::ostream& out, const std::string& programName) {
    out << "Usage: " << programName << " [OPTIONS]\n\n"
        << "Options:\n"
        << "  --gui                               Launch the graphical interface (default)\n"
        << "  --config FILE                       Use a specific configuration file\n"
        << "  --data-dir DIR                      Directory holding the data files\n"
        << "  --log-level LEVEL                   trace, debug, info, warn, error, critical, off\n"
        << "  --summary [YYYY-MM]                 Print the monthly summary and suggestions\n"
        << "  --add-expense DATE CATEGORY AMOUNT [NOTE]\n"
        << "                                      Record an expense\n"
        << "  --set-income YYYY-MM AMOUNT         Set the income of a month\n"
        << "  --list [YYYY-MM]                    List stored expenses with their ids\n"
        << "  --sip MONTHLY RATE YEARS [--goal TARGET]\n"
        << "                                      SIP projection\n"
        << "  --report YYYY-MM PATH               Write the monthly report\n"
        << "  --help                              Show this help message\n"
        << "  --version                           Show version information\n\n"
        << "Environment Variables:\n"
        << "  EXPENSEDESK_DATA_DIR                Data directory override\n"
        << "  EXPENSEDESK_RENDERER                Preferred report renderer\n"
        << "  LOG_LEVEL                           Logging level override\n";
}

int runCommand(Application& app, const CommandLine& commandLine, std::ostream& out, std::ostream& err) {
    switch (commandLine.command) {
        case Command::Summary: return runSummary(app, commandLine, out, err);
        case Command::AddExpense: return runAddExpense(app, commandLine, out, err);
        case Command::SetIncome: return runSetIncome(app, commandLine, out, err);
        case Command::List: return runList(app, commandLine, out, err);
        case Command::Sip: return runSip(app, commandLine, out, err);
        case Command::Report: return runReport(app, commandLine, out, err);
        case Command::Help:
            printUsage(out, "expensedesk");
            return 0;
        case Command::Version:
            out << "ExpenseDesk v" << kVersion << "\n";
            return 0;
        case Command::Gui:
            break;
    }
    err << "Error: the graphical interface cannot be started from here\n";
    return 1;
}

}
