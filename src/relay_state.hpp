/*
 * File: src/relay_state.hpp
 * Project: Display Relay
 * Purpose: Process-wide objects shared by the HTTP, WebSocket and eviction sides
 * Notes:
 *  - Constructed once in main and passed by reference; never a global
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <string>
#include <utility>
#include "common/media.hpp"
#include "notification_hub.hpp"
#include "relay_config.hpp"
#include "relay_view.hpp"

struct RelayState
{
    RelayConfig config;
    SlotStore store;
    NotificationHub hub;
    ViewCoordinator views{store};
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();

    explicit RelayState(RelayConfig cfg)
        : config(std::move(cfg)), hub(config.queue_capacity) {}
};
