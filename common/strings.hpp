/*
 * Filename: strings.hpp
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

#include <string>
#include <vector>

namespace common {

std::string trim(const std::string& text);
std::string toLower(std::string text);

// "Currency Symbol", " currency_symbol " -> "currency_symbol"
std::string normalizeKey(const std::string& text);

std::vector<std::string> split(const std::string& text, char delimiter);

}
