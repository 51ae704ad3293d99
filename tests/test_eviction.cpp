/*
 * File: tests/test_eviction.cpp
 * Project: Display Relay
 * Purpose: Eviction sweep: deletion, quarantine on failure, retry, shutdown
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <thread>
#include <vector>
#include <unistd.h>
#include "common/media.hpp"
#include "relay_eviction.hpp"
#include "relay_log.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace
{
    struct TempDirs
    {
        fs::path root;
        TempDirs()
        {
            root = fs::temp_directory_path() / ("relay_evict_" + std::to_string(::getpid()) + "_" +
                                                std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
            fs::create_directories(root / "uploads");
            fs::create_directories(root / "sounds");
        }
        ~TempDirs()
        {
            std::error_code ec;
            fs::remove_all(root, ec);
        }
        EvictionConfig config() const
        {
            EvictionConfig c;
            c.uploads_dir = root / "uploads";
            c.sounds_dir = root / "sounds";
            c.threshold = 10s;
            c.interval = 20ms;
            return c;
        }
    };

    void touch(const fs::path &p)
    {
        std::ofstream(p) << "x";
    }

    MediaItem aged(const std::string &name, std::chrono::system_clock::duration age)
    {
        MediaItem m;
        m.filename = name;
        m.created_at = std::chrono::system_clock::now() - age;
        return m;
    }
}

TEST_CASE("stale item is deleted from disk and from the store")
{
    TempDirs dirs;
    touch(dirs.root / "uploads" / "cat.jpg");
    SlotStore store;
    store.set_media(aged("cat.jpg", 11s));

    EvictionScheduler sweep{store, dirs.config()};
    auto r = sweep.sweep_once();
    REQUIRE(r.removed == 1);
    REQUIRE(r.quarantined == 0);
    REQUIRE_FALSE(fs::exists(dirs.root / "uploads" / "cat.jpg"));
    REQUIRE_FALSE(store.current_media());
}

TEST_CASE("fresh item is left alone")
{
    TempDirs dirs;
    touch(dirs.root / "uploads" / "cat.jpg");
    SlotStore store;
    store.set_media(aged("cat.jpg", 9s));

    EvictionScheduler sweep{store, dirs.config()};
    auto r = sweep.sweep_once();
    REQUIRE(r.removed == 0);
    REQUIRE(fs::exists(dirs.root / "uploads" / "cat.jpg"));
    REQUIRE(store.get_current_for_viewer("v"));
}

TEST_CASE("stale sound is deleted from the sounds directory")
{
    TempDirs dirs;
    touch(dirs.root / "sounds" / "tune.mp3");
    SlotStore store;
    SoundItem s;
    s.filename = "tune.mp3";
    s.created_at = std::chrono::system_clock::now() - 30s;
    store.set_sound(s);

    EvictionScheduler sweep{store, dirs.config()};
    REQUIRE(sweep.sweep_once().removed == 1);
    REQUIRE_FALSE(fs::exists(dirs.root / "sounds" / "tune.mp3"));
    REQUIRE_FALSE(store.current_sound());
}

TEST_CASE("missing backing file counts as deleted")
{
    TempDirs dirs;
    SlotStore store;
    store.set_media(aged("gone.jpg", 11s));

    EvictionScheduler sweep{store, dirs.config()};
    REQUIRE(sweep.sweep_once().removed == 1);
    REQUIRE_FALSE(store.current_media());
}

TEST_CASE("failed delete quarantines the item for every viewer")
{
    TempDirs dirs;
    SlotStore store;
    store.set_media(aged("cat.jpg", 11s));

    std::vector<std::string> errors;
    std::mutex errors_m;
    Log::set_sink([&](Log::Level l, const std::string &line)
                  {
        if (l == Log::Level::Error)
        {
            std::scoped_lock lk(errors_m);
            errors.push_back(line);
        } });

    EvictionScheduler sweep{store, dirs.config(), [](const fs::path &, std::error_code &ec)
                            {
                                ec = std::make_error_code(std::errc::permission_denied);
                                return false;
                            }};
    auto r = sweep.sweep_once();
    Log::set_sink(nullptr);

    REQUIRE(r.removed == 0);
    REQUIRE(r.quarantined == 1);
    REQUIRE_FALSE(store.get_current_for_viewer("10.0.0.1"));
    REQUIRE_FALSE(store.get_current_for_viewer("10.0.0.2"));
    auto raw = store.current_media();
    REQUIRE(raw);
    REQUIRE(raw->pending_deletion);
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].find("cat.jpg") != std::string::npos);

    // still failing: stays quarantined
    sweep.sweep_once();
    REQUIRE(store.current_media());
    REQUIRE(store.current_media()->pending_deletion);
}

TEST_CASE("quarantined item is retried and removed once deletion succeeds")
{
    TempDirs dirs;
    SlotStore store;
    store.set_media(aged("cat.jpg", 11s));

    bool fail = true;
    EvictionScheduler sweep{store, dirs.config(), [&](const fs::path &p, std::error_code &ec)
                            {
                                if (fail)
                                {
                                    ec = std::make_error_code(std::errc::device_or_resource_busy);
                                    return false;
                                }
                                return EvictionScheduler::remove_file(p, ec);
                            }};
    REQUIRE(sweep.sweep_once().quarantined == 1);
    fail = false;
    REQUIRE(sweep.sweep_once().removed == 1);
    REQUIRE_FALSE(store.current_media());
}

TEST_CASE("superseded item is not evicted")
{
    TempDirs dirs;
    touch(dirs.root / "uploads" / "a.jpg");
    touch(dirs.root / "uploads" / "b.jpg");
    SlotStore store;
    store.set_media(aged("a.jpg", 20s));
    store.set_media(aged("b.jpg", 1s));

    EvictionScheduler sweep{store, dirs.config()};
    REQUIRE(sweep.sweep_once().removed == 0);
    REQUIRE(fs::exists(dirs.root / "uploads" / "a.jpg"));
    REQUIRE(store.current_media()->filename == "b.jpg");
}

TEST_CASE("re-upload during a sweep keeps the new item in the slot")
{
    TempDirs dirs;
    SlotStore store;
    store.set_media(aged("cat.jpg", 11s));

    uint64_t fresh = 0;
    EvictionScheduler sweep{store, dirs.config(), [&](const fs::path &, std::error_code &)
                            {
                                fresh = store.set_media(aged("cat.jpg", 0s));
                                return true;
                            }};
    auto report = sweep.sweep_once();
    REQUIRE(report.removed == 0);
    REQUIRE(store.current_media());
    REQUIRE(store.current_media()->upload_id == fresh);
    REQUIRE(store.get_current_for_viewer("10.0.0.1"));
}

TEST_CASE("re-upload after a failed delete is not quarantined")
{
    TempDirs dirs;
    SlotStore store;
    store.set_media(aged("cat.jpg", 11s));

    EvictionScheduler sweep{store, dirs.config(), [&](const fs::path &, std::error_code &ec)
                            {
                                store.set_media(aged("cat.jpg", 0s));
                                ec = std::make_error_code(std::errc::permission_denied);
                                return false;
                            }};
    REQUIRE(sweep.sweep_once().quarantined == 0);
    REQUIRE_FALSE(store.current_media()->pending_deletion);
    REQUIRE(store.get_current_for_viewer("10.0.0.1"));
}

TEST_CASE("background sweep runs until stopped")
{
    TempDirs dirs;
    touch(dirs.root / "uploads" / "cat.jpg");
    SlotStore store;
    store.set_media(aged("cat.jpg", 11s));

    EvictionScheduler sweep{store, dirs.config()};
    sweep.start();
    REQUIRE(sweep.running());

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (store.current_media() && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(5ms);
    REQUIRE_FALSE(store.current_media());

    auto t0 = std::chrono::steady_clock::now();
    sweep.stop();
    REQUIRE_FALSE(sweep.running());
    REQUIRE(std::chrono::steady_clock::now() - t0 < 1s);
    sweep.stop();
}
