/*
 * Filename: test_harness.hpp
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
#include <atomic>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>

namespace testing {

struct TestFailure : std::runtime_error {
    using std::runtime_error::runtime_error;
};

inline int& failureCount() {
    static int count = 0;
    return count;
}

// Scratch directory removed when the fixture goes out of scope.
class TempDir {
private:
    std::filesystem::path path_;

public:
    TempDir() {
        std::random_device device;
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("expensedesk_test_" + std::to_string(stamp) + "_" + std::to_string(device()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }
};

inline void writeText(const std::filesystem::path& path, const std::string& text) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << text;
}

inline std::string readText(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream os;
    os << file.rdbuf();
    return os.str();
}

}

#define TEST(name) void name()

#define RUN_TEST(name)                                                                   \
    do {                                                                                 \
        std::cout << "  " << #name << "... ";                                            \
        try {                                                                            \
            name();                                                                      \
            std::cout << "PASSED\n";                                                     \
        } catch (const testing::TestFailure& e) {                                        \
            std::cout << "FAILED\n    " << e.what() << "\n";                             \
            ++testing::failureCount();                                                   \
        } catch (const std::exception& e) {                                              \
            std::cout << "FAILED (exception: " << e.what() << ")\n";                     \
            ++testing::failureCount();                                                   \
        }                                                                                \
    } while (0)

#define TEST_RESULT()                                                                    \
    (std::cout << (testing::failureCount() == 0 ? "\nAll tests passed\n"                 \
                                                : "\nSome tests failed\n"),              \
     testing::failureCount() == 0 ? 0 : 1)

#define FAIL_AT(message)                                                                 \
    do {                                                                                 \
        std::ostringstream failureStream_;                                               \
        failureStream_ << __FILE__ << ":" << __LINE__ << ": " << message;                \
        throw testing::TestFailure(failureStream_.str());                                \
    } while (0)

#define ASSERT_TRUE(expr)                                                                \
    do {                                                                                 \
        if (!(expr)) {                                                                   \
            FAIL_AT(#expr << " is false");                                               \
        }                                                                                \
    } while (0)

#define ASSERT_FALSE(expr) ASSERT_TRUE(!(expr))

#define ASSERT_EQ(a, b)                                                                  \
    do {                                                                                 \
        const auto& lhs_ = (a);                                                          \
        const auto& rhs_ = (b);                                                          \
        if (!(lhs_ == rhs_)) {                                                           \
            FAIL_AT(#a << " (" << lhs_ << ") != " << #b << " (" << rhs_ << ")");         \
        }                                                                                \
    } while (0)

#define ASSERT_NEAR(a, b, tol)                                                           \
    do {                                                                                 \
        const double lhs_ = (a);                                                         \
        const double rhs_ = (b);                                                         \
        if (std::abs(lhs_ - rhs_) > (tol)) {                                             \
            FAIL_AT(#a << " (" << lhs_ << ") != " << #b << " (" << rhs_ << ") within "   \
                       << (tol));                                                        \
        }                                                                                \
    } while (0)

#define ASSERT_OK(result)                                                                \
    do {                                                                                 \
        const auto& result_ = (result);                                                  \
        if (!common::isSuccess(result_)) {                                               \
            FAIL_AT(#result << " failed: " << common::describe(common::getError(result_))); \
        }                                                                                \
    } while (0)

#define ASSERT_ERROR(result, expectedKind)                                               \
    do {                                                                                 \
        const auto& result_ = (result);                                                  \
        if (common::isSuccess(result_)) {                                                \
            FAIL_AT(#result << " succeeded, expected " << common::toString(expectedKind)); \
        }                                                                                \
        if (common::getError(result_).kind != (expectedKind)) {                          \
            FAIL_AT(#result << " gave " << common::describe(common::getError(result_))   \
                            << ", expected " << common::toString(expectedKind));         \
        }                                                                                \
    } while (0)
