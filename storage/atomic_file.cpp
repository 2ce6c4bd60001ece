/*
 * Filename: atomic_file.cpp
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

#include "storage/atomic_file.hpp"
#include <fstream>
#include <sstream>
#include <system_error>
#include <spdlog/spdlog.h>

namespace storage {

namespace fs = std::filesystem;

fs::path partialPathFor(const fs::path& target) {
    fs::path partial = target.parent_path();
    partial /= "." + target.filename().string() + ".partial";
    return partial;
}

common::Status publishFile(const fs::path& temporary, const fs::path& target) {
    std::error_code ec;
    fs::rename(temporary, target, ec);
    if (ec) {
        removeQuietly(temporary);
        return common::fail(common::ErrorKind::Storage,
                            "cannot publish " + target.string() + ": " + ec.message());
    }
    return common::ok();
}

common::Status writeFileAtomically(const fs::path& target, const std::string& content) {
    std::error_code ec;
    const fs::path directory = target.parent_path();
    if (!directory.empty() && !fs::exists(directory, ec)) {
        fs::create_directories(directory, ec);
        if (ec) {
            return common::fail(common::ErrorKind::Storage,
                                "cannot create directory " + directory.string() + ": " + ec.message());
        }
    }

    const fs::path temporary = partialPathFor(target);
    {
        std::ofstream file(temporary, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return common::fail(common::ErrorKind::Storage,
                                "cannot open " + temporary.string() + " for writing");
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();
        if (!file.good()) {
            file.close();
            removeQuietly(temporary);
            return common::fail(common::ErrorKind::Storage, "write failed for " + temporary.string());
        }
    }

    spdlog::debug("Publishing {} ({} bytes)", target.string(), content.size());
    return publishFile(temporary, target);
}

common::Result<std::string> readFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return common::makeError<std::string>(common::ErrorKind::NotFound,
                                              path.string() + " does not exist");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return common::makeError<std::string>(common::ErrorKind::Storage,
                                              "cannot open " + path.string() + " for reading");
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        return common::makeError<std::string>(common::ErrorKind::Storage,
                                              "read failed for " + path.string());
    }
    return content.str();
}

void removeQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::warn("Could not remove {}: {}", path.string(), ec.message());
    }
}

}
