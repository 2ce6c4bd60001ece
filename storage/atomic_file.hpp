/*
 * Filename: atomic_file.hpp
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
#include <filesystem>
#include <string>

namespace storage {

// Temporary sibling used while a file is being produced: "<dir>/.<name>.partial".
std::filesystem::path partialPathFor(const std::filesystem::path& target);

// Moves a finished temporary file over its target in one rename.
common::Status publishFile(const std::filesystem::path& temporary,
                           const std::filesystem::path& target);

// Writes the whole content to a temporary sibling, then publishes it. A reader
// sees either the previous file or the complete new one.
common::Status writeFileAtomically(const std::filesystem::path& target, const std::string& content);

// Reads a whole file. NotFound when it does not exist, Storage when it cannot
// be read.
common::Result<std::string> readFile(const std::filesystem::path& path);

void removeQuietly(const std::filesystem::path& path);

}
