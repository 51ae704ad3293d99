/*
 * File: tests/test_config.cpp
 * Project: Display Relay
 * Purpose: Command-line configuration
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>
#include "relay_config.hpp"

TEST_CASE("defaults")
{
    const char *argv[] = {"relay_server"};
    auto c = parse_args(1, argv);
    REQUIRE(c.http_bind == "0.0.0.0:8080");
    REQUIRE(c.ws_bind == "0.0.0.0:8090");
    REQUIRE(c.uploads_dir == "uploads");
    REQUIRE(c.sounds_dir == "sounds");
    REQUIRE(c.eviction_threshold == std::chrono::seconds(10));
    REQUIRE(c.eviction_interval == std::chrono::milliseconds(1000));
    REQUIRE(c.queue_capacity == 100);
}

TEST_CASE("overrides")
{
    const char *argv[] = {"relay_server", "--http", "127.0.0.1:9000", "--ws", "127.0.0.1:9001",
                          "--uploads", "/tmp/u", "--sounds", "/tmp/s",
                          "--threshold", "30", "--interval", "250", "--queue", "8"};
    auto c = parse_args(15, argv);
    REQUIRE(c.http_bind == "127.0.0.1:9000");
    REQUIRE(c.ws_bind == "127.0.0.1:9001");
    REQUIRE(c.uploads_dir == "/tmp/u");
    REQUIRE(c.sounds_dir == "/tmp/s");
    REQUIRE(c.eviction_threshold == std::chrono::seconds(30));
    REQUIRE(c.eviction_interval == std::chrono::milliseconds(250));
    REQUIRE(c.queue_capacity == 8);
    REQUIRE(config_to_json(c)["queue_capacity"] == 8);
}

TEST_CASE("bad values are rejected")
{
    const char *zero[] = {"relay_server", "--queue", "0"};
    REQUIRE_THROWS_AS(parse_args(3, zero), std::invalid_argument);
    const char *neg[] = {"relay_server", "--threshold", "-5"};
    REQUIRE_THROWS_AS(parse_args(3, neg), std::invalid_argument);
    const char *junk[] = {"relay_server", "--interval", "10ms"};
    REQUIRE_THROWS_AS(parse_args(3, junk), std::invalid_argument);
    const char *unknown[] = {"relay_server", "--data", "/data"};
    REQUIRE_THROWS_AS(parse_args(3, unknown), std::invalid_argument);
    const char *missing[] = {"relay_server", "--http"};
    REQUIRE_THROWS_AS(parse_args(2, missing), std::invalid_argument);
    const char *bind[] = {"relay_server", "--ws", "localhost"};
    REQUIRE_THROWS_AS(parse_args(3, bind), std::invalid_argument);
}

TEST_CASE("threshold and interval are bounded")
{
    const char *day[] = {"relay_server", "--threshold", "86400", "--interval", "86400000"};
    auto c = parse_args(5, day);
    REQUIRE(c.eviction_threshold == std::chrono::hours(24));
    REQUIRE(c.eviction_interval == std::chrono::hours(24));

    const char *huge[] = {"relay_server", "--threshold", "18446744073709551615"};
    REQUIRE_THROWS_AS(parse_args(3, huge), std::invalid_argument);
    const char *over[] = {"relay_server", "--threshold", "86401"};
    REQUIRE_THROWS_AS(parse_args(3, over), std::invalid_argument);
    const char *slow[] = {"relay_server", "--interval", "86400001"};
    REQUIRE_THROWS_AS(parse_args(3, slow), std::invalid_argument);
}

TEST_CASE("endpoint parsing")
{
    auto e = parse_endpoint("0.0.0.0:8080");
    REQUIRE(e.host == "0.0.0.0");
    REQUIRE(e.port == 8080);
    REQUIRE_THROWS(parse_endpoint(":80"));
    REQUIRE_THROWS(parse_endpoint("host:"));
    REQUIRE_THROWS(parse_endpoint("host:70000"));
    REQUIRE_THROWS(parse_endpoint("host:8o"));
}
