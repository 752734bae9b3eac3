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

#include "shapeshift/options.hpp"

#include <cstdlib>
#include <iostream>

#include <boost/program_options.hpp>

#include "shapeshift/config.hpp"

using namespace shapeshift;

namespace po = boost::program_options;

namespace {

void help(const char* program, const po::options_description& description) {
    std::cerr << "Usage: " << program << " [OPTIONS]" << std::endl << std::endl;
    std::cerr << description << std::endl;
}

} // namespace

options_t::options_t() :
    max_depth(64),
    layout(object_layout::map),
    intern_strings(false),
    hardware_acceleration(true),
    unflushed_bytes_threshold(64 * 1024),
    minimum_fetch_size(4 * 1024)
{}

po::options_description
options_t::description() {
    po::options_description options("Serialization");
    options.add_options()
        ("max-depth",
            po::value<int>()->default_value(max_depth),
            "maximum nesting depth of the payload")
        ("layout",
            po::value<std::string>()->default_value(shapeshift::describe(layout)),
            "object layout, either 'map' or 'array'")
        ("intern-strings",
            po::value<bool>()->default_value(intern_strings),
            "share equal decoded strings")
        ("hardware-acceleration",
            po::value<bool>()->default_value(hardware_acceleration),
            "bulk encoding of primitive arrays")
        ("flush-threshold",
            po::value<std::size_t>()->default_value(unflushed_bytes_threshold),
            "number of buffered bytes to trigger an asynchronous flush")
        ("fetch-size",
            po::value<std::size_t>()->default_value(minimum_fetch_size),
            "minimum number of bytes to request from a source");
    return options;
}

void
options_t::apply(const po::variables_map& vm) {
    if (vm.count("max-depth")) {
        const int depth = vm["max-depth"].as<int>();
        if (depth <= 0) {
            throw po::validation_error(po::validation_error::invalid_option_value, "max-depth");
        }
        max_depth = depth;
    }

    if (vm.count("layout")) {
        layout = parse_layout(vm["layout"].as<std::string>());
    }

    if (vm.count("intern-strings")) {
        intern_strings = vm["intern-strings"].as<bool>();
    }

    if (vm.count("hardware-acceleration")) {
        hardware_acceleration = vm["hardware-acceleration"].as<bool>();
    }

    if (vm.count("flush-threshold")) {
        unflushed_bytes_threshold = vm["flush-threshold"].as<std::size_t>();
    }

    if (vm.count("fetch-size")) {
        const std::size_t size = vm["fetch-size"].as<std::size_t>();
        if (size == 0) {
            throw po::validation_error(po::validation_error::invalid_option_value, "fetch-size");
        }
        minimum_fetch_size = size;
    }
}

options_t
options_t::from_command_line(int argc, char** argv) {
    options_t result;

    po::options_description general("General options");
    general.add(result.description());
    general.add_options()
        ("help,h",     "display this help and exit")
        ("version,v",  "output the library version information and exit");

    po::command_line_parser parser(argc, argv);
    parser.options(general);

    po::variables_map vm;
    po::store(parser.run(), vm);
    po::notify(vm);

    if (vm.count("help")) {
        help(argv[0], general);
        std::exit(0);
    }

    if (vm.count("version")) {
        std::cerr << SHAPESHIFT_VERSION_MAJOR << "."
                  << SHAPESHIFT_VERSION_MINOR << "."
                  << SHAPESHIFT_VERSION_PATCH << std::endl;
        std::exit(0);
    }

    result.apply(vm);
    return result;
}

object_layout
shapeshift::parse_layout(const std::string& name) {
    if (name == "map") {
        return object_layout::map;
    }

    if (name == "array") {
        return object_layout::array;
    }

    throw po::validation_error(po::validation_error::invalid_option_value, "layout", name);
}

const char*
shapeshift::describe(object_layout layout) {
    return layout == object_layout::map ? "map" : "array";
}
