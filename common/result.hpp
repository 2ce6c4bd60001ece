/*
 * Filename: result.hpp
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
#include <type_traits>
#include <utility>
#include <variant>

namespace common {

enum class ErrorKind {
    Validation, NotFound, Storage, DependencyUnavailable
};

struct Error {
    ErrorKind kind = ErrorKind::Validation;
    std::string message;
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::NotFound: return "NotFoundError";
        case ErrorKind::Storage: return "StorageError";
        case ErrorKind::DependencyUnavailable: return "DependencyUnavailable";
    }
    return "Error";
}

inline std::string describe(const Error& error) {
    return std::string(toString(error.kind)) + ": " + error.message;
}

template<typename T>
using Result = std::variant<T, Error>;

// Operations that only succeed or fail.
using Status = Result<std::monostate>;

template<typename T>
bool isSuccess(const Result<T>& result) {
    return std::holds_alternative<T>(result);
}

template<typename T>
const T& getValue(const Result<T>& result) {
    return std::get<T>(result);
}

template<typename T>
T& getValue(Result<T>& result) {
    return std::get<T>(result);
}

template<typename T>
const Error& getError(const Result<T>& result) {
    return std::get<Error>(result);
}

template<typename T>
Result<std::decay_t<T>> makeSuccess(T&& value) {
    return Result<std::decay_t<T>>(std::in_place_index<0>, std::forward<T>(value));
}

template<typename T>
Result<T> makeError(ErrorKind kind, std::string message) {
    return Result<T>(std::in_place_index<1>, Error{kind, std::move(message)});
}

template<typename T>
Result<T> makeError(const Error& error) {
    return Result<T>(std::in_place_index<1>, error);
}

inline Status ok() {
    return Status(std::in_place_index<0>);
}

inline Status fail(ErrorKind kind, std::string message) {
    return makeError<std::monostate>(kind, std::move(message));
}

inline Status fail(const Error& error) {
    return makeError<std::monostate>(error);
}

}
