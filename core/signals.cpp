/*
 * Filename: signals.cpp
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

#include "core/signals.hpp"
#include <atomic>
#include <csignal>

namespace core {

namespace {

std::atomic<bool> shutdownFlag{false};

static_assert(std::atomic<bool>::is_always_lock_free, "signal flag must be lock-free");

void handleShutdownSignal(int) {
    shutdownFlag.store(true);
}

}

void installShutdownHandlers() {
    std::signal(SIGINT, handleShutdownSignal);
    std::signal(SIGTERM, handleShutdownSignal);
}

bool shutdownRequested() {
    return shutdownFlag.load();
}

void clearShutdownRequest() {
    shutdownFlag.store(false);
}

}
