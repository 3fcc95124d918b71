#define BOOST_TEST_MODULE HostTests
#include <boost/test/unit_test.hpp>

#include "server/server.hpp"
#include "server/server_config.hpp"
#include "world/dimension.hpp"
#include <asio/io_context.hpp>
#include <filesystem>
#include <fstream>
#include <string>

using namespace strata::server;
using strata::world::Dimension;

namespace fs = std::filesystem;

// Scratch data directory, removed when the test ends
class DataDirFixture {
public:
    DataDirFixture()
        : dir_(fs::temp_directory_path() / ("strata_host_tests_" +
               boost::unit_test::framework::current_test_case().p_name.get())) {
        fs::create_directories(dir_);
    }

    ~DataDirFixture() {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void write(const std::string& file, const std::string& contents) {
        std::ofstream out(dir_ / file);
        out << contents;
    }

    void write_defaults() {
        write("server.json", R"({"tick_rate": 10, "ticks_per_day": 1200, "level_name": "test", "spawn_radius": 0})");
        write("dimensions.json", R"({
            "custom_id_seed": 2000,
            "weather": {"auto_cycle": true, "max_intensity": 100},
            "custom": [
                {"name": "Mirror", "type": 1},
                {"name": "Far", "type": 0, "distance_multiplier": 4.0},
                {"name": "Replacement End", "type": 2, "id": 2, "override": true}
            ]
        })");
    }

    std::string path() const { return dir_.string(); }

private:
    fs::path dir_;
};

// ============================================================================
// Configuration
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(HostConfigTests, DataDirFixture)

BOOST_AUTO_TEST_CASE(TestLoadsBothFiles) {
    write_defaults();
    HostConfig config;
    BOOST_REQUIRE(config.load(path()));

    BOOST_CHECK_CLOSE(config.server().tick_rate, 10.0f, 0.001f);
    BOOST_CHECK_EQUAL(config.server().ticks_per_day, 1200);
    BOOST_CHECK_EQUAL(config.server().level_name, "test");
    BOOST_CHECK_EQUAL(config.server().worker_threads, 2u);

    BOOST_CHECK_EQUAL(config.custom_id_seed(), 2000);
    BOOST_CHECK(config.weather().auto_cycle);
    BOOST_CHECK_EQUAL(config.weather().max_intensity, 100);
    BOOST_CHECK_EQUAL(config.weather().min_rain_ticks, 12000);

    const auto& custom = config.custom_dimensions();
    BOOST_REQUIRE_EQUAL(custom.size(), 3u);
    BOOST_CHECK_EQUAL(custom[0].name, "Mirror");
    BOOST_CHECK(!custom[0].id);
    BOOST_CHECK(!custom[0].distance_multiplier);
    BOOST_REQUIRE(custom[1].distance_multiplier);
    BOOST_CHECK_CLOSE(*custom[1].distance_multiplier, 4.0f, 0.001f);
    BOOST_REQUIRE(custom[2].id);
    BOOST_CHECK_EQUAL(*custom[2].id, 2);
    BOOST_CHECK(custom[2].override_existing);
}

BOOST_AUTO_TEST_CASE(TestMissingFileFails) {
    write("server.json", "{}");
    HostConfig config;
    BOOST_CHECK(!config.load(path()));
    BOOST_CHECK(config.load_server(path() + "/server.json"));
}

BOOST_AUTO_TEST_CASE(TestMalformedJsonFails) {
    write("server.json", "{ \"tick_rate\": ");
    HostConfig config;
    BOOST_CHECK(!config.load_server(path() + "/server.json"));
}

BOOST_AUTO_TEST_CASE(TestNonPositiveTickRateFails) {
    write("server.json", R"({"tick_rate": 0})");
    HostConfig config;
    BOOST_CHECK(!config.load_server(path() + "/server.json"));
}

BOOST_AUTO_TEST_CASE(TestNonPositiveDistanceMultiplierFails) {
    write("dimensions.json", R"({"custom": [{"name": "Flat", "type": 0, "distance_multiplier": 0}]})");
    HostConfig config;
    BOOST_CHECK(!config.load_dimensions(path() + "/dimensions.json"));

    write("dimensions.json", R"({"custom": [{"name": "Flat", "type": 0, "distance_multiplier": -1.5}]})");
    BOOST_CHECK(!config.load_dimensions(path() + "/dimensions.json"));
}

BOOST_AUTO_TEST_CASE(TestUnknownDimensionTypeFails) {
    write("dimensions.json", R"({"custom": [{"name": "Broken", "type": 99}]})");
    HostConfig config;
    BOOST_CHECK(!config.load_dimensions(path() + "/dimensions.json"));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Server
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ServerTests, DataDirFixture)

BOOST_AUTO_TEST_CASE(TestCreatesBuiltinAndConfiguredDimensions) {
    write_defaults();
    HostConfig config;
    BOOST_REQUIRE(config.load(path()));

    asio::io_context io;
    Server server(io, config);
    auto& level = server.level();

    BOOST_CHECK_EQUAL(level.name(), "test");
    BOOST_CHECK_EQUAL(level.dimensions().size(), 5u);
    BOOST_REQUIRE(level.get_dimension(Dimension::ID_OVERWORLD));
    BOOST_CHECK_EQUAL(level.get_dimension(Dimension::ID_OVERWORLD)->dimension_name(), "Overworld");
    BOOST_CHECK_EQUAL(level.get_dimension(Dimension::ID_THE_END)->dimension_name(), "Replacement End");

    auto* mirror = level.get_dimension(2000);
    BOOST_REQUIRE(mirror);
    BOOST_CHECK_EQUAL(mirror->dimension_name(), "Mirror");
    BOOST_CHECK_CLOSE(mirror->distance_multiplier(), 8.0f, 0.001f);

    auto* far_dimension = level.get_dimension(2001);
    BOOST_REQUIRE(far_dimension);
    BOOST_CHECK_CLOSE(far_dimension->distance_multiplier(), 4.0f, 0.001f);
    BOOST_CHECK(far_dimension->weather().config().auto_cycle);
}

BOOST_AUTO_TEST_CASE(TestTickAdvancesLevelTime) {
    write_defaults();
    HostConfig config;
    BOOST_REQUIRE(config.load(path()));

    asio::io_context io;
    Server server(io, config);
    server.tick();
    server.tick();

    BOOST_CHECK_EQUAL(server.current_tick(), 2);
    BOOST_CHECK_EQUAL(server.level().time(), 2);
    BOOST_CHECK_EQUAL(server.level().ticks_per_day(), 1200);
}

BOOST_AUTO_TEST_SUITE_END()
