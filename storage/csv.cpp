/*
 * Filename: csv.cpp
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

#include "storage/csv.hpp"

namespace storage::csv {

namespace {

bool needsQuoting(const std::string& field) {
    if (field.find_first_of(",\"\r\n") != std::string::npos) {
        return true;
    }
    return !field.empty() && (field.front() == ' ' || field.back() == ' ');
}

bool isBlank(const Row& row) {
    return row.size() == 1 && row.front().empty();
}

}

common::Result<std::vector<Line>> parse(const std::string& text) {
    std::vector<Line> lines;

    std::size_t pos = 0;
    if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        pos = 3;
    }

    std::size_t lineNumber = 1;
    Line current;
    current.number = lineNumber;
    std::string field;
    bool inQuotes = false;
    bool fieldWasQuoted = false;

    auto endRow = [&]() {
        current.fields.push_back(std::move(field));
        field.clear();
        fieldWasQuoted = false;
        if (!isBlank(current.fields)) {
            lines.push_back(std::move(current));
        }
        current = Line{};
        current.number = lineNumber;
    };

    while (pos < text.size()) {
        const char c = text[pos];

        if (inQuotes) {
            if (c == '"') {
                if (pos + 1 < text.size() && text[pos + 1] == '"') {
                    field += '"';
                    pos += 2;
                    continue;
                }
                inQuotes = false;
            } else {
                if (c == '\n') {
                    ++lineNumber;
                }
                field += c;
            }
            ++pos;
            continue;
        }

        switch (c) {
            case '"':
                if (!field.empty() || fieldWasQuoted) {
                    return common::makeError<std::vector<Line>>(
                        common::ErrorKind::Storage,
                        "line " + std::to_string(lineNumber) + ": unexpected quote inside field");
                }
                inQuotes = true;
                fieldWasQuoted = true;
                break;
            case ',':
                current.fields.push_back(std::move(field));
                field.clear();
                fieldWasQuoted = false;
                break;
            case '\r':
                if (pos + 1 < text.size() && text[pos + 1] == '\n') {
                    ++pos;
                }
                ++lineNumber;
                endRow();
                break;
            case '\n':
                ++lineNumber;
                endRow();
                break;
            default:
                if (fieldWasQuoted) {
                    return common::makeError<std::vector<Line>>(
                        common::ErrorKind::Storage,
                        "line " + std::to_string(lineNumber) + ": text after closing quote");
                }
                field += c;
                break;
        }
        ++pos;
    }

    if (inQuotes) {
        return common::makeError<std::vector<Line>>(
            common::ErrorKind::Storage,
            "line " + std::to_string(current.number) + ": unterminated quoted field");
    }

    if (!field.empty() || fieldWasQuoted || !current.fields.empty()) {
        endRow();
    }

    return lines;
}

std::string formatRow(const Row& row) {
    std::string out;
    for (std::size_t i = 0; i < row.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        const std::string& field = row[i];
        if (!needsQuoting(field)) {
            out += field;
            continue;
        }
        out += '"';
        for (char c : field) {
            if (c == '"') {
                out += '"';
            }
            out += c;
        }
        out += '"';
    }
    return out;
}

std::string format(const std::vector<Row>& rows) {
    std::string out;
    for (const auto& row : rows) {
        out += formatRow(row);
        out += '\n';
    }
    return out;
}

}
