/*
    Copyright (c) 2015 Evgeny Safronov <division494@gmail.com>
    Copyright (c) 2011-2015 Other contributors as noted in the AUTHORS file.
    This file is part of ShapeShift.
    ShapeShift is free software; you can redistribute it and/or modify
    it under the terms of the GNU Lesser General Public License as published by
    the Free Software Foundation; either version 3 of the License, or
    (at your option) any later version.
    ShapeShift is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
    GNU Lesser General Public License for more details.
    You should have received a copy of the GNU Lesser General Public License
    along with this program. If not, see <http://www.gnu.org/licenses/>.
*/

#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <string>
#include <system_error>

/// This module provides access to the library error codes and exceptions.

namespace shapeshift {

namespace error {

/// Malformed or truncated input.
enum protocol_errors {
    /// The token has started but its bytes are not all available yet.
    insufficient_data = 1,
    /// No more bytes are available and no more will ever come.
    end_of_stream,
    /// The next token has a different type than the requested one.
    unexpected_token,
    /// The decoded integer does not fit into the requested type.
    integer_overflow,
    /// A string payload is not valid UTF-8.
    invalid_utf8,
    /// Object properties appear out of declaration order.
    property_order,
    /// Array or map has an unexpected number of elements.
    invalid_length
};

/// Input that is well-formed, but exceeds the configured safety limits.
enum security_errors {
    /// Nesting level exceeded the maximum allowed depth.
    depth_exceeded = 1
};

/// Misuse of the library API.
enum usage_errors {
    /// Broken lending protocol of an asynchronous reader or writer.
    loan_violation = 1,
    /// There is no converter registered for the requested type.
    converter_not_found,
    /// The requested operation is not supported by this object.
    not_supported
};

/// Identifies the protocol error category by returning an const lvalue reference to it.
const std::error_category& protocol_category();

/// Identifies the security error category by returning an const lvalue reference to it.
const std::error_category& security_category();

/// Identifies the usage error category by returning an const lvalue reference to it.
const std::error_category& usage_category();

/*!
 * Constructs an `protocol_errors` error code.
 *
 * This function is called by the constructor of std::error_code when given an `protocol_errors`
 * argument.
 */
std::error_code make_error_code(protocol_errors err);
std::error_condition make_error_condition(protocol_errors err);

std::error_code make_error_code(security_errors err);
std::error_condition make_error_condition(security_errors err);

std::error_code make_error_code(usage_errors err);
std::error_condition make_error_condition(usage_errors err);

} // namespace error

/*!
 * The error class represents the root of the library error hierarchy.
 */
class error_t : public std::system_error {
public:
    error_t(const std::error_code& ec, const std::string& description);

    ~error_t() noexcept;
};

/// Thrown when a token has started, but the buffer ends before it does.
class insufficient_data_error : public error_t {
public:
    explicit insufficient_data_error(std::size_t offset);
};

/// Thrown when more bytes are required, but the stream has completed.
class end_of_stream_error : public error_t {
public:
    end_of_stream_error();
    explicit end_of_stream_error(std::size_t offset);
};

/*!
 * The exception class, that is thrown when the next token has another type than requested.
 *
 * You can always obtain the offending marker byte and its stream offset.
 */
class unexpected_token_error : public error_t {
    std::uint8_t code_;
    std::size_t offset_;

public:
    unexpected_token_error(std::uint8_t code, std::size_t offset, const char* expected);

    /// Returns the marker byte that was found.
    std::uint8_t code() const noexcept;

    /// Returns the position of the marker byte.
    std::size_t offset() const noexcept;
};

/// Thrown when a decoded integer does not fit into the destination type.
class overflow_error : public error_t {
public:
    overflow_error(std::size_t offset, const char* type);
};

/// Thrown when the payload nesting exceeds the allowed depth.
class depth_exceeded_error : public error_t {
    int max_depth_;

public:
    explicit depth_exceeded_error(int max_depth);

    int max_depth() const noexcept;
};

/// Thrown on any breach of the reader/writer lending protocol.
class loan_violation_error : public error_t {
public:
    explicit loan_violation_error(const std::string& reason);
};

/// Thrown when an asynchronous operation observes a cancellation request.
class cancelled_error : public error_t {
public:
    cancelled_error();
};

class converter_not_found_error : public error_t {
public:
    explicit converter_not_found_error(const char* type);
};

/// Generic protocol violation with an explicit error code.
class protocol_error : public error_t {
public:
    protocol_error(error::protocol_errors err, const std::string& description);
};

/*!
 * The exception class, that wraps every failure leaving a top-level serializer operation.
 *
 * The original cause is preserved and its error code is exposed through `code()`.
 */
class serialization_error : public error_t {
    std::exception_ptr cause_;

public:
    explicit serialization_error(std::exception_ptr cause);

    ~serialization_error() noexcept;

    /// Returns the exception that caused this one.
    std::exception_ptr cause() const noexcept;

    /// Rethrows the original cause.
    void rethrow_cause() const;
};

} // namespace shapeshift

namespace std {

template<>
struct is_error_code_enum<shapeshift::error::protocol_errors> :
    public true_type
{};

template<>
struct is_error_code_enum<shapeshift::error::security_errors> :
    public true_type
{};

template<>
struct is_error_code_enum<shapeshift::error::usage_errors> :
    public true_type
{};

} // namespace std
