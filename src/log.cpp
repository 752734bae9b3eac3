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

#include "shapeshift/detail/log.hpp"

#ifdef SHAPESHIFT_USE_INTERNAL_LOGGING

#include <algorithm>
#include <array>
#include <cstdlib>
#include <cstring>
#include <iterator>

#include <blackhole/formatter/string.hpp>
#include <blackhole/sink/stream.hpp>

namespace shapeshift {

namespace detail {

// >> op - start of a fetch, flush or nested asynchronous conversion
// << op - completion of the same
// !! - lending protocol violation, always logged with the warning severity

namespace {

const std::array<const char*, 5> abbreviations = {{ "D", "N", "I", "W", "E" }};
const std::array<const char*, 5> names = {{ "debug", "notice", "info", "warn", "error" }};

void
map_severity(blackhole::aux::attachable_ostringstream& stream, const level_t& level) {
    const std::size_t value = static_cast<std::size_t>(level);

    if (value < abbreviations.size()) {
        stream << abbreviations[value];
    } else {
        stream << value;
    }
}

/// Reads the threshold from the SHAPESHIFT_LOG_LEVEL environment variable, if any.
level_t
threshold() {
    const char* value = std::getenv("SHAPESHIFT_LOG_LEVEL");

    if (value == nullptr) {
        return level_t::debug;
    }

    const auto it = std::find_if(names.begin(), names.end(), [&](const char* name) {
        return std::strcmp(name, value) == 0;
    });

    if (it == names.end()) {
        return level_t::debug;
    }

    return static_cast<level_t>(std::distance(names.begin(), it));
}

bool
match_context(const blackhole::attribute::pair_t& pair) {
    return pair.first == "context";
}

logger_type
create() {
    logger_type logger(threshold());

    auto formatter = blackhole::aux::util::make_unique<
        blackhole::formatter::string_t
    >("[%(severity)s] [%(timestamp)s] [%(lwp)s]: %(context:[:] )s%(message)s");

    blackhole::mapping::value_t mapper;
    mapper.add<blackhole::keyword::tag::timestamp_t>("%H:%M:%S.%f");
    mapper.add<blackhole::keyword::tag::severity_t<level_t>>(&map_severity);
    formatter->set_mapper(mapper);

    // Decoded payloads may go to stdout, as the dump tool does.
    auto sink = blackhole::aux::util::make_unique<
        blackhole::sink::stream_t
    >(blackhole::sink::stream_t::output_t::stderr);

    auto frontend = blackhole::aux::util::make_unique<
        blackhole::frontend_t<
            blackhole::formatter::string_t,
            blackhole::sink::stream_t
        >
    >(std::move(formatter), std::move(sink));

    logger.add_frontend(std::move(frontend));
    return logger;
}

} // namespace

logger_type&
logger() {
    static logger_type log = create();
    return log;
}

std::string
merge_context(std::string context) {
    blackhole::scoped_attributes_t scoped(logger(), blackhole::attribute::set_t());
    const auto& attributes = scoped.attributes();
    const auto it = std::find_if(attributes.begin(), attributes.end(), &match_context);

    if (it == attributes.end()) {
        return context;
    }

    return blackhole::utils::format("%s/%s", boost::get<std::string>(it->second.value), context);
}

} // namespace detail

} // namespace shapeshift

#endif
