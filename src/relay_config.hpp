/*
 * File: src/relay_config.hpp
 * Project: Display Relay
 * Purpose: Command-line configuration for relay_server
 * Notes:
 *  - Flags take the form --name value; unknown flags are rejected
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

struct Endpoint
{
    std::string host;
    unsigned short port{0};
};

inline Endpoint parse_endpoint(const std::string &s)
{
    auto p = s.rfind(':');
    if (p == std::string::npos || p == 0 || p + 1 == s.size())
        throw std::invalid_argument("expected host:port, got '" + s + "'");
    unsigned long port = 0;
    try
    {
        size_t used = 0;
        port = std::stoul(s.substr(p + 1), &used);
        if (used != s.size() - p - 1)
            throw std::invalid_argument("trailing characters");
    }
    catch (const std::exception &)
    {
        throw std::invalid_argument("bad port in '" + s + "'");
    }
    if (port > 65535)
        throw std::invalid_argument("port out of range in '" + s + "'");
    return {s.substr(0, p), static_cast<unsigned short>(port)};
}

struct RelayConfig
{
    std::string http_bind = "0.0.0.0:8080";
    std::string ws_bind = "0.0.0.0:8090";
    std::string uploads_dir = "uploads";
    std::string sounds_dir = "sounds";
    std::chrono::seconds eviction_threshold{10};
    std::chrono::milliseconds eviction_interval{1000};
    size_t queue_capacity = 100;
    size_t max_media_bytes = 100 * 1024 * 1024;
    size_t max_sound_bytes = 50 * 1024 * 1024;
};

inline nlohmann::json config_to_json(const RelayConfig &c)
{
    return nlohmann::json{
        {"http", c.http_bind},
        {"ws", c.ws_bind},
        {"uploads_dir", c.uploads_dir},
        {"sounds_dir", c.sounds_dir},
        {"eviction_threshold_s", c.eviction_threshold.count()},
        {"eviction_interval_ms", c.eviction_interval.count()},
        {"queue_capacity", c.queue_capacity},
        {"max_media_bytes", c.max_media_bytes},
        {"max_sound_bytes", c.max_sound_bytes}};
}

// Upper bounds keep the values representable as system_clock durations.
constexpr uint64_t kMaxThresholdSeconds = 24 * 60 * 60;
constexpr uint64_t kMaxIntervalMs = 24 * 60 * 60 * 1000ULL;

inline uint64_t parse_positive(const std::string &flag, const std::string &v,
                               uint64_t max = std::numeric_limits<uint64_t>::max())
{
    uint64_t n = 0;
    try
    {
        size_t used = 0;
        if (!v.empty() && v[0] != '-')
            n = std::stoull(v, &used);
        if (used != v.size())
            n = 0;
    }
    catch (const std::exception &)
    {
        n = 0;
    }
    if (n == 0)
        throw std::invalid_argument(flag + " expects a positive integer, got '" + v + "'");
    if (n > max)
        throw std::invalid_argument(flag + " must be at most " + std::to_string(max) + ", got '" + v + "'");
    return n;
}

inline RelayConfig parse_args(int argc, const char *const *argv)
{
    RelayConfig c;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (i + 1 >= argc)
            throw std::invalid_argument("missing value for " + a);
        std::string v = argv[++i];
        if (a == "--http")
            c.http_bind = v;
        else if (a == "--ws")
            c.ws_bind = v;
        else if (a == "--uploads")
            c.uploads_dir = v;
        else if (a == "--sounds")
            c.sounds_dir = v;
        else if (a == "--threshold")
            c.eviction_threshold = std::chrono::seconds(parse_positive(a, v, kMaxThresholdSeconds));
        else if (a == "--interval")
            c.eviction_interval = std::chrono::milliseconds(parse_positive(a, v, kMaxIntervalMs));
        else if (a == "--queue")
            c.queue_capacity = static_cast<size_t>(parse_positive(a, v));
        else
            throw std::invalid_argument("unknown flag " + a);
    }
    // fail early on malformed binds
    parse_endpoint(c.http_bind);
    parse_endpoint(c.ws_bind);
    return c;
}
