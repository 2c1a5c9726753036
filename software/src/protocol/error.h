/*
 * Copyright (C) 2024-2026 Niklas Klügel <lodsb@lodsb.org>
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * version 2, as published by the Free Software Foundation.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * General Public License version 2 for more details.
 *
 * You should have received a copy of the GNU General Public License
 * version 2 along with this program; if not, write to the Free
 * Software Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA 02110-1301, USA.
 *
 */

// Status and result types returned by every fallible driver operation
#pragma once

#include <optional>
#include <string>
#include <utility>

namespace icmd {
namespace protocol {

enum class ErrorKind {
    TRANSPORT_FAULT,       // Bus failure reported by the transport
    PROTOCOL_VIOLATION,    // Bad length, width, access or value; caller/config problem
    DECODE_INCONSISTENCY   // Chip reported an error alongside its data
};

const char* error_kind_name(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::PROTOCOL_VIOLATION;
    std::string detail;

    // "KIND: detail"
    std::string to_string() const;
};

inline Error transport_fault(std::string detail)
{
    return Error{ErrorKind::TRANSPORT_FAULT, std::move(detail)};
}

inline Error protocol_violation(std::string detail)
{
    return Error{ErrorKind::PROTOCOL_VIOLATION, std::move(detail)};
}

inline Error decode_inconsistency(std::string detail)
{
    return Error{ErrorKind::DECODE_INCONSISTENCY, std::move(detail)};
}

//
// Status - success, or an Error
//
class Status {
public:
    Status() = default;
    Status(Error error) : error_(std::move(error)) {}

    static Status success() { return Status(); }

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    // Only valid when !ok()
    const Error& error() const { return *error_; }

private:
    std::optional<Error> error_;
};

//
// Result<T> - a value, or an Error; never both
//
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(Error error) : error_(std::move(error)) {}

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    // Only valid when ok()
    const T& value() const { return *value_; }
    T& value() { return *value_; }

    // Only valid when !ok()
    const Error& error() const { return error_; }

    Status status() const { return ok() ? Status() : Status(error_); }

private:
    std::optional<T> value_;
    Error error_;
};

} // namespace protocol
} // namespace icmd
