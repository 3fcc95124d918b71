#define BOOST_TEST_MODULE WeatherTests
#include <boost/test/unit_test.hpp>

#include "test_support.hpp"
#include "world/components.hpp"
#include "world/weather_state.hpp"
#include <vector>

using namespace strata;
using namespace strata::protocol;
using namespace strata::world;

struct WeatherCounter {
    void on_changed(const WeatherState&) { ++count; }
    int count = 0;
};

// Overworld with three players, none of them watching any chunk
class WeatherFixture : public test::LevelFixture {
public:
    WeatherFixture() {
        for (const char* name : {"a", "b", "c"}) {
            auto player = level.create_player(name, ecs::Transform{});
            overworld->add_entity(player);
            player_ids.push_back(id_of(player));
        }
        sink.sent.clear();
    }

protected:
    std::vector<uint32_t> player_ids;
};

// ============================================================================
// Broadcast
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(WeatherBroadcastTests, WeatherFixture)

BOOST_AUTO_TEST_CASE(TestRainReachesEveryPlayer) {
    overworld->set_rain_level(5);

    BOOST_CHECK_EQUAL(sink.sent.size(), 6u);
    for (uint32_t id : player_ids) {
        auto packets = sink.packets_for(id);
        BOOST_REQUIRE_EQUAL(packets.size(), 2u);

        auto rain = test::decode_packet<LevelEventMsg>(packets[0]);
        BOOST_CHECK(rain.event_id == LevelEventId::StartRain);
        BOOST_CHECK_EQUAL(rain.data, 5);

        auto thunder = test::decode_packet<LevelEventMsg>(packets[1]);
        BOOST_CHECK(thunder.event_id == LevelEventId::StopThunder);
    }
}

BOOST_AUTO_TEST_CASE(TestBroadcastWithoutTargetsReachesAllPlayers) {
    overworld->set_rain_level(5);
    sink.sent.clear();

    overworld->send_weather();

    BOOST_CHECK_EQUAL(sink.sent.size(), 6u);
    for (uint32_t id : player_ids) {
        auto packets = sink.packets_for(id);
        BOOST_REQUIRE_EQUAL(packets.size(), 2u);

        auto rain = test::decode_packet<LevelEventMsg>(packets[0]);
        BOOST_CHECK(rain.event_id == LevelEventId::StartRain);
        BOOST_CHECK_EQUAL(rain.data, 5);

        auto thunder = test::decode_packet<LevelEventMsg>(packets[1]);
        BOOST_CHECK(thunder.event_id == LevelEventId::StopThunder);
        BOOST_CHECK_EQUAL(thunder.data, 0);
    }
    BOOST_CHECK_EQUAL(overworld->rain_level(), 5);
}

BOOST_AUTO_TEST_CASE(TestUnchangedLevelSendsNothing) {
    overworld->set_rain_level(5);
    sink.sent.clear();

    overworld->set_rain_level(5);
    overworld->set_thunder_level(0);
    BOOST_CHECK(sink.sent.empty());
}

BOOST_AUTO_TEST_CASE(TestStopRain) {
    overworld->set_rain_level(5);
    sink.sent.clear();

    overworld->set_rain_level(0);
    auto rain = test::decode_packet<LevelEventMsg>(sink.packets_for(player_ids[0])[0]);
    BOOST_CHECK(rain.event_id == LevelEventId::StopRain);
    BOOST_CHECK_EQUAL(rain.data, 0);
}

BOOST_AUTO_TEST_CASE(TestExplicitTargets) {
    std::vector<uint32_t> targets{player_ids[1], 99};
    overworld->send_weather(targets);

    BOOST_CHECK_EQUAL(sink.sent.size(), 4u);
    BOOST_CHECK_EQUAL(sink.packets_for(player_ids[1]).size(), 2u);
    BOOST_CHECK_EQUAL(sink.packets_for(99).size(), 2u);
    BOOST_CHECK(sink.packets_for(player_ids[0]).empty());
}

BOOST_AUTO_TEST_CASE(TestOtherDimensionUnaffected) {
    nether->set_rain_level(3);
    BOOST_CHECK(sink.sent.empty());
    BOOST_CHECK_EQUAL(overworld->rain_level(), 0);
}

BOOST_AUTO_TEST_CASE(TestScheduledChangeAppliedOnTick) {
    overworld->weather().schedule_change(10, 3, 2);

    overworld->do_tick(9);
    BOOST_CHECK(sink.sent.empty());

    overworld->do_tick(10);
    BOOST_CHECK_EQUAL(overworld->rain_level(), 3);
    BOOST_CHECK_EQUAL(overworld->thunder_level(), 2);

    auto packets = sink.packets_for(player_ids[2]);
    BOOST_REQUIRE_EQUAL(packets.size(), 2u);
    auto thunder = test::decode_packet<LevelEventMsg>(packets[1]);
    BOOST_CHECK(thunder.event_id == LevelEventId::StartThunder);
    BOOST_CHECK_EQUAL(thunder.data, 2);
    BOOST_CHECK(!overworld->weather().next_change());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// State machine
// ============================================================================

BOOST_AUTO_TEST_SUITE(WeatherStateTests)

BOOST_AUTO_TEST_CASE(TestNegativeLevelsClampToZero) {
    WeatherState weather;
    WeatherCounter counter;
    weather.on_changed().connect<&WeatherCounter::on_changed>(counter);

    weather.set_rain_level(-4);
    BOOST_CHECK_EQUAL(weather.rain_level(), 0);
    BOOST_CHECK_EQUAL(counter.count, 0);

    weather.set_thunder_level(2);
    BOOST_CHECK(weather.is_thundering());
    BOOST_CHECK_EQUAL(counter.count, 1);
}

BOOST_AUTO_TEST_CASE(TestManualWeatherNeverSchedulesItself) {
    WeatherState weather;
    BOOST_CHECK(!weather.tick(0));
    BOOST_CHECK(!weather.next_change());
}

BOOST_AUTO_TEST_CASE(TestAutoCycleAlternates) {
    WeatherConfig config;
    config.auto_cycle = true;
    config.min_clear_ticks = 100;
    config.max_clear_ticks = 200;
    config.min_rain_ticks = 50;
    config.max_rain_ticks = 60;
    config.max_intensity = 10;
    WeatherState weather(config, 42);

    BOOST_CHECK(!weather.tick(0));
    BOOST_REQUIRE(weather.next_change());
    int64_t rain_at = weather.next_change()->at_tick;
    BOOST_CHECK(rain_at >= 100 && rain_at <= 200);
    BOOST_CHECK(weather.next_change()->rain_level >= 1 && weather.next_change()->rain_level <= 10);

    BOOST_CHECK(weather.tick(rain_at));
    BOOST_CHECK(weather.is_raining());
    BOOST_REQUIRE(weather.next_change());
    int64_t clear_at = weather.next_change()->at_tick;
    BOOST_CHECK(clear_at >= rain_at + 50 && clear_at <= rain_at + 60);
    BOOST_CHECK_EQUAL(weather.next_change()->rain_level, 0);

    BOOST_CHECK(weather.tick(clear_at));
    BOOST_CHECK(!weather.is_raining());
    BOOST_CHECK(!weather.is_thundering());
}

BOOST_AUTO_TEST_SUITE_END()
