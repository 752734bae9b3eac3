#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <gtest/gtest.h>

#include <shapeshift/options.hpp>

using namespace shapeshift;

using namespace testing;

namespace po = boost::program_options;

namespace {

options_t
parse(std::vector<std::string> args) {
    args.insert(args.begin(), "shapeshift");

    std::vector<char*> argv;
    for (auto it = args.begin(); it != args.end(); ++it) {
        argv.push_back(&(*it)[0]);
    }

    return options_t::from_command_line(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(options_t, Defaults) {
    const options_t options = parse({});

    EXPECT_EQ(64, options.max_depth);
    EXPECT_EQ(object_layout::map, options.layout);
    EXPECT_FALSE(options.intern_strings);
    EXPECT_TRUE(options.hardware_acceleration);
    EXPECT_EQ(64u * 1024, options.unflushed_bytes_threshold);
    EXPECT_EQ(4u * 1024, options.minimum_fetch_size);
}

TEST(options_t, FromCommandLine) {
    const options_t options = parse({
        "--max-depth=8",
        "--layout=array",
        "--intern-strings=true",
        "--hardware-acceleration=false",
        "--flush-threshold=128",
        "--fetch-size=16"
    });

    EXPECT_EQ(8, options.max_depth);
    EXPECT_EQ(object_layout::array, options.layout);
    EXPECT_TRUE(options.intern_strings);
    EXPECT_FALSE(options.hardware_acceleration);
    EXPECT_EQ(128u, options.unflushed_bytes_threshold);
    EXPECT_EQ(16u, options.minimum_fetch_size);
}

TEST(options_t, InvalidValuesAreRejected) {
    EXPECT_THROW(parse({ "--max-depth=0" }), po::validation_error);
    EXPECT_THROW(parse({ "--max-depth=-3" }), po::validation_error);
    EXPECT_THROW(parse({ "--fetch-size=0" }), po::validation_error);
    EXPECT_THROW(parse({ "--layout=tree" }), po::validation_error);
    EXPECT_THROW(parse({ "--max-depth=deep" }), po::error);
    EXPECT_THROW(parse({ "--unknown" }), po::error);
}

TEST(options_t, ApplyKeepsUnsetValues) {
    options_t options;
    options.max_depth = 3;

    po::options_description description("Serialization");
    description.add_options()
        ("layout", po::value<std::string>(), "");

    const char* argv[] = { "shapeshift", "--layout", "array" };

    po::variables_map vm;
    po::store(po::parse_command_line(3, argv, description), vm);
    po::notify(vm);

    options.apply(vm);

    EXPECT_EQ(3, options.max_depth);
    EXPECT_EQ(object_layout::array, options.layout);
}

TEST(options_t, LayoutNames) {
    EXPECT_EQ(object_layout::map, parse_layout("map"));
    EXPECT_EQ(object_layout::array, parse_layout("array"));
    EXPECT_STREQ("map", describe(object_layout::map));
    EXPECT_STREQ("array", describe(object_layout::array));
}
