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
#include <string>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

#include "shapeshift/wire.hpp"

namespace shapeshift {

/// Serializer settings.
struct options_t {
    /// Maximum nesting level of arrays, maps and objects.
    int max_depth;

    /// How objects with declared properties are encoded.
    object_layout layout;

    /// Whether equal decoded strings should share a single pooled instance.
    bool intern_strings;

    /// Whether arrays of primitives may use bulk encoding.
    bool hardware_acceleration;

    /// Asynchronous writers flush once this many bytes are buffered.
    std::size_t unflushed_bytes_threshold;

    /// Asynchronous readers ask the source for at least this many bytes at once.
    std::size_t minimum_fetch_size;

    options_t();

    /// Describes the settings as command-line options bound to this instance.
    ///
    /// Values are stored once `apply` is called with the parsed variables.
    boost::program_options::options_description
    description();

    /// Stores parsed values, validating them.
    ///
    /// \throw boost::program_options::error on invalid values.
    void
    apply(const boost::program_options::variables_map& vm);

    /// Parses command-line arguments to extract all serializer settings.
    ///
    /// Can internally terminate the program when asked for help or version, providing the help
    /// message and returning a proper exit code.
    static
    options_t
    from_command_line(int argc, char** argv);
};

object_layout
parse_layout(const std::string& name);

const char*
describe(object_layout layout);

} // namespace shapeshift
