// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 attrval Contributors

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace attrval {

// Type aliases
using ByteVector = std::vector<std::byte>;

// Error types
enum class ErrorCode {
    Success = 0,
    TypeMismatch,     // wire field required by the target shape is absent
    InvalidNumber,    // number text is neither an integer nor a float
    EmptyCharacter,   // character requested from an empty string
    InvalidKey,       // map key did not serialize to a string
    MissingValue,     // map value without a key, or key without a value
    UnsupportedValue, // no recognised wire field during self-describing dispatch
    InvalidData,      // malformed wire data outside the codec's own checks
    Custom,           // free-form message from the visitation protocol
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::TypeMismatch:
            return "Type mismatch";
        case ErrorCode::InvalidNumber:
            return "Invalid number";
        case ErrorCode::EmptyCharacter:
            return "Empty character";
        case ErrorCode::InvalidKey:
            return "Invalid key";
        case ErrorCode::MissingValue:
            return "Missing value";
        case ErrorCode::UnsupportedValue:
            return "Unsupported value";
        case ErrorCode::InvalidData:
            return "Invalid data";
        case ErrorCode::Custom:
            return "Custom error";
        case ErrorCode::Unknown:
            return "Unknown error";
    }
    return "Unknown error";
}

// Error struct shared by the encode and decode paths
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(const Error& other) const = default;

    bool operator==(ErrorCode c) const { return code == c; }
};

// Simple Result type for operations that can fail (compatible with pre-C++23)
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace attrval

// fmt library support for ErrorCode (for spdlog)
#include <fmt/format.h>
template <> struct fmt::formatter<attrval::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(attrval::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", attrval::errorToString(error));
    }
};
