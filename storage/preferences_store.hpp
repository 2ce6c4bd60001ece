/*
 * Filename: preferences_store.hpp
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
#include "common/types.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace storage {

class PreferencesStore {
private:
    std::filesystem::path path_;
    std::optional<common::Preferences> cached_;

public:
    explicit PreferencesStore(std::filesystem::path path);

    // Creates and persists the defaults on first use.
    common::Result<common::Preferences> get();
    common::Status set(const common::Preferences& preferences);

    static common::Status validate(const common::Preferences& preferences);

    static std::string toJson(const common::Preferences& preferences);
    static common::Result<common::Preferences> fromJson(const std::string& text);

private:
    common::Status persist(const common::Preferences& preferences) const;
};

}
