/*
 * Filename: csv.hpp
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
#include <cstddef>
#include <string>
#include <vector>

namespace storage::csv {

using Row = std::vector<std::string>;

struct Line {
    std::size_t number = 0;   // 1-based line where the row starts
    Row fields;
};

// RFC 4180 reader: quoted fields may contain commas, doubled quotes and line
// breaks; LF and CRLF endings and a leading UTF-8 BOM are accepted. Blank
// lines are skipped.
common::Result<std::vector<Line>> parse(const std::string& text);

std::string formatRow(const Row& row);
std::string format(const std::vector<Row>& rows);

}
