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

#include "shapeshift/error.hpp"

#include "shapeshift/detail/format.hpp"

namespace shapeshift {

/// Extended description formatting patterns.
static const char ERROR_INSUFFICIENT_DATA[] = "the token at offset %d is truncated";
static const char ERROR_END_OF_STREAM[]     = "unexpected end of stream at offset %d";
static const char ERROR_UNEXPECTED_TOKEN[]  = "expected %s, but found token 0x%02x at offset %d";
static const char ERROR_OVERFLOW[]          = "the value at offset %d does not fit into %s";
static const char ERROR_DEPTH_EXCEEDED[]    = "the maximum nesting depth of %d has been exceeded";
static const char ERROR_CONVERTER[]         = "no converter is registered for type '%s'";

namespace {

struct protocol_category_t : public std::error_category {
    const char*
    name() const noexcept {
        return "shapeshift protocol";
    }

    std::string
    message(int err) const noexcept {
        switch (err) {
        case static_cast<int>(error::insufficient_data):
            return "insufficient data to decode the token";
        case static_cast<int>(error::end_of_stream):
            return "unexpected end of stream";
        case static_cast<int>(error::unexpected_token):
            return "unexpected token type";
        case static_cast<int>(error::integer_overflow):
            return "integer overflow";
        case static_cast<int>(error::invalid_utf8):
            return "string is not valid utf-8";
        case static_cast<int>(error::property_order):
            return "properties are out of order";
        case static_cast<int>(error::invalid_length):
            return "unexpected number of elements";
        default:
            return "unexpected protocol error";
        }
    }
};

struct security_category_t : public std::error_category {
    const char*
    name() const noexcept {
        return "shapeshift security";
    }

    std::string
    message(int err) const noexcept {
        switch (err) {
        case static_cast<int>(error::depth_exceeded):
            return "maximum nesting depth exceeded";
        default:
            return "unexpected security error";
        }
    }
};

struct usage_category_t : public std::error_category {
    const char*
    name() const noexcept {
        return "shapeshift usage";
    }

    std::string
    message(int err) const noexcept {
        switch (err) {
        case static_cast<int>(error::loan_violation):
            return "lending protocol violation";
        case static_cast<int>(error::converter_not_found):
            return "converter not found";
        case static_cast<int>(error::not_supported):
            return "operation is not supported";
        default:
            return "unexpected usage error";
        }
    }
};

std::error_code
code_of(const std::exception_ptr& cause) {
    if (!cause) {
        return std::error_code();
    }

    try {
        std::rethrow_exception(cause);
    } catch (const std::system_error& err) {
        return err.code();
    } catch (...) {
        // The cause is kept as is, only its code is unknown.
        return std::make_error_code(std::errc::io_error);
    }
}

std::string
describe(const std::exception_ptr& cause) {
    if (!cause) {
        return "unknown serialization error";
    }

    try {
        std::rethrow_exception(cause);
    } catch (const std::exception& err) {
        return err.what();
    } catch (...) {
        return "unknown serialization error";
    }
}

} // namespace

const std::error_category&
error::protocol_category() {
    static protocol_category_t category;
    return category;
}

const std::error_category&
error::security_category() {
    static security_category_t category;
    return category;
}

const std::error_category&
error::usage_category() {
    static usage_category_t category;
    return category;
}

std::error_code
error::make_error_code(error::protocol_errors err) {
    return std::error_code(static_cast<int>(err), error::protocol_category());
}

std::error_condition
error::make_error_condition(error::protocol_errors err) {
    return std::error_condition(static_cast<int>(err), error::protocol_category());
}

std::error_code
error::make_error_code(error::security_errors err) {
    return std::error_code(static_cast<int>(err), error::security_category());
}

std::error_condition
error::make_error_condition(error::security_errors err) {
    return std::error_condition(static_cast<int>(err), error::security_category());
}

std::error_code
error::make_error_code(error::usage_errors err) {
    return std::error_code(static_cast<int>(err), error::usage_category());
}

std::error_condition
error::make_error_condition(error::usage_errors err) {
    return std::error_condition(static_cast<int>(err), error::usage_category());
}

error_t::error_t(const std::error_code& ec, const std::string& description) :
    std::system_error(ec, description)
{}

error_t::~error_t() noexcept {}

insufficient_data_error::insufficient_data_error(std::size_t offset) :
    error_t(error::insufficient_data, shapeshift::format(ERROR_INSUFFICIENT_DATA, offset))
{}

end_of_stream_error::end_of_stream_error() :
    error_t(error::end_of_stream, "no more bytes are available")
{}

end_of_stream_error::end_of_stream_error(std::size_t offset) :
    error_t(error::end_of_stream, shapeshift::format(ERROR_END_OF_STREAM, offset))
{}

unexpected_token_error::unexpected_token_error(std::uint8_t code, std::size_t offset, const char* expected) :
    error_t(error::unexpected_token,
        shapeshift::format(ERROR_UNEXPECTED_TOKEN, expected, static_cast<unsigned int>(code), offset)),
    code_(code),
    offset_(offset)
{}

std::uint8_t
unexpected_token_error::code() const noexcept {
    return code_;
}

std::size_t
unexpected_token_error::offset() const noexcept {
    return offset_;
}

overflow_error::overflow_error(std::size_t offset, const char* type) :
    error_t(error::integer_overflow, shapeshift::format(ERROR_OVERFLOW, offset, type))
{}

depth_exceeded_error::depth_exceeded_error(int max_depth) :
    error_t(error::depth_exceeded, shapeshift::format(ERROR_DEPTH_EXCEEDED, max_depth)),
    max_depth_(max_depth)
{}

int
depth_exceeded_error::max_depth() const noexcept {
    return max_depth_;
}

loan_violation_error::loan_violation_error(const std::string& reason) :
    error_t(error::loan_violation, reason)
{}

cancelled_error::cancelled_error() :
    error_t(std::make_error_code(std::errc::operation_canceled), "the operation has been cancelled")
{}

converter_not_found_error::converter_not_found_error(const char* type) :
    error_t(error::converter_not_found, shapeshift::format(ERROR_CONVERTER, type))
{}

protocol_error::protocol_error(error::protocol_errors err, const std::string& description) :
    error_t(err, description)
{}

serialization_error::serialization_error(std::exception_ptr cause) :
    error_t(code_of(cause), describe(cause)),
    cause_(std::move(cause))
{}

serialization_error::~serialization_error() noexcept {}

std::exception_ptr
serialization_error::cause() const noexcept {
    return cause_;
}

void
serialization_error::rethrow_cause() const {
    std::rethrow_exception(cause_);
}

} // namespace shapeshift
