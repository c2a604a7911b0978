// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <variant>
#include <string>
#include <stdexcept>
#include <utility>
#include <source_location>

namespace raycast::core {

template<typename T>
class Result;

// Error class - represents failures with context
class Error {
public:
    std::string Message;
    std::source_location Location;

    Error(std::string message,
          std::source_location location = std::source_location::current())
        : Message(std::move(message)), Location(location) {}

    const char* What() const noexcept { return Message.c_str(); }

    // Prefix the message with what was being attempted
    Error WithContext(const std::string& context) const {
        return Error(context + ": " + Message, Location);
    }
};

inline Error MakeError(const std::string& message,
                       std::source_location location = std::source_location::current()) {
    return Error(message, location);
}

/**
 * @brief Value-or-error return type for fallible operations
 *
 * Usage:
 *   Result<MeshData> Evaluate() {
 *     if (broken) return MakeError("no geometry");
 *     return mesh;
 *   }
 */
template<typename T>
class Result {
private:
    std::variant<T, Error> data_;

public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    static Result Ok(T value) { return Result(std::move(value)); }
    static Result Err(Error error) { return Result(std::move(error)); }
    static Result Err(const std::string& message,
                      std::source_location location = std::source_location::current()) {
        return Result(MakeError(message, location));
    }

    bool IsOk() const noexcept { return std::holds_alternative<T>(data_); }
    bool IsErr() const noexcept { return std::holds_alternative<Error>(data_); }
    explicit operator bool() const noexcept { return IsOk(); }

    // Access value (throws if error)
    T& Value() & {
        if (IsErr()) {
            throw std::runtime_error(GetError().Message);
        }
        return std::get<T>(data_);
    }

    T&& Value() && {
        if (IsErr()) {
            throw std::runtime_error(GetError().Message);
        }
        return std::get<T>(std::move(data_));
    }

    const T& Value() const & {
        if (IsErr()) {
            throw std::runtime_error(GetError().Message);
        }
        return std::get<T>(data_);
    }

    // Access error (undefined if ok)
    Error& GetError() & { return std::get<Error>(data_); }
    const Error& GetError() const & { return std::get<Error>(data_); }
    Error&& GetError() && { return std::get<Error>(std::move(data_)); }

    T ValueOr(T default_value) const & {
        return IsOk() ? Value() : std::move(default_value);
    }

    T ValueOr(T default_value) && {
        return IsOk() ? std::move(*this).Value() : std::move(default_value);
    }

    T Unwrap() && {
        if (IsErr()) {
            throw std::runtime_error(GetError().Message);
        }
        return std::get<T>(std::move(data_));
    }

    T Expect(const std::string& message) && {
        if (IsErr()) {
            throw std::runtime_error(message + ": " + GetError().Message);
        }
        return std::get<T>(std::move(data_));
    }

    template<typename F>
    auto Map(F&& func) && -> Result<decltype(func(std::declval<T>()))> {
        using U = decltype(func(std::declval<T>()));
        if (IsOk()) {
            return Result<U>::Ok(func(std::move(*this).Value()));
        }
        return Result<U>::Err(std::move(*this).GetError());
    }

    Result WithContext(const std::string& context) && {
        if (IsErr()) {
            return Result::Err(GetError().WithContext(context));
        }
        return std::move(*this);
    }
};

template<>
class Result<void> {
private:
    std::variant<std::monostate, Error> data_;

public:
    Result() : data_(std::monostate{}) {}
    Result(Error error) : data_(std::move(error)) {}

    static Result Ok() { return Result(); }
    static Result Err(Error error) { return Result(std::move(error)); }
    static Result Err(const std::string& message,
                      std::source_location location = std::source_location::current()) {
        return Result(MakeError(message, location));
    }

    bool IsOk() const noexcept { return std::holds_alternative<std::monostate>(data_); }
    bool IsErr() const noexcept { return std::holds_alternative<Error>(data_); }
    explicit operator bool() const noexcept { return IsOk(); }

    Error& GetError() & { return std::get<Error>(data_); }
    const Error& GetError() const & { return std::get<Error>(data_); }
    Error&& GetError() && { return std::get<Error>(std::move(data_)); }

    void Unwrap() const {
        if (IsErr()) {
            throw std::runtime_error(GetError().Message);
        }
    }

    void Expect(const std::string& message) const {
        if (IsErr()) {
            throw std::runtime_error(message + ": " + GetError().Message);
        }
    }

    Result WithContext(const std::string& context) && {
        if (IsErr()) {
            return Result::Err(GetError().WithContext(context));
        }
        return std::move(*this);
    }
};

} // namespace raycast::core
