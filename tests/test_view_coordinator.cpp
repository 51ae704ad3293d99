/*
 * File: tests/test_view_coordinator.cpp
 * Project: Display Relay
 * Purpose: Claim protocol: each viewer is shown an item at most once
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>
#include <atomic>
#include <thread>
#include <vector>
#include "common/media.hpp"
#include "relay_view.hpp"

static MediaItem item(const std::string &name)
{
    MediaItem m;
    m.filename = name;
    m.created_at = std::chrono::system_clock::now();
    return m;
}

TEST_CASE("two viewers each claim cat.jpg once")
{
    SlotStore store;
    ViewCoordinator views{store};
    store.set_media(item("cat.jpg"));

    auto first = views.claim("10.0.0.1");
    REQUIRE(first);
    REQUIRE(first->filename == "cat.jpg");
    REQUIRE_FALSE(views.claim("10.0.0.1"));

    auto second = views.claim("10.0.0.2");
    REQUIRE(second);
    REQUIRE(second->filename == "cat.jpg");
}

TEST_CASE("claim on an empty or quarantined slot yields nothing")
{
    SlotStore store;
    ViewCoordinator views{store};
    REQUIRE_FALSE(views.claim("10.0.0.1"));

    store.set_media(item("cat.jpg"));
    store.mark_pending_deletion("cat.jpg");
    REQUIRE_FALSE(views.claim("10.0.0.1"));
}

TEST_CASE("concurrent claims by one viewer serve the item once")
{
    SlotStore store;
    ViewCoordinator views{store};
    store.set_media(item("cat.jpg"));

    std::atomic<int> served{0};
    std::vector<std::thread> ts;
    for (int i = 0; i < 8; ++i)
        ts.emplace_back([&]
                        { if (views.claim("10.0.0.1")) ++served; });
    for (auto &t : ts)
        t.join();
    REQUIRE(served == 1);
}

TEST_CASE("a newer upload is claimable after the old one was seen")
{
    SlotStore store;
    ViewCoordinator views{store};
    store.set_media(item("a.jpg"));
    REQUIRE(views.claim("v"));
    store.set_media(item("b.jpg"));
    auto m = views.claim("v");
    REQUIRE(m);
    REQUIRE(m->filename == "b.jpg");
}
