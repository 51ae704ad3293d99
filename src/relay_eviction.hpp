/*
 * File: src/relay_eviction.hpp
 * Project: Display Relay
 * Purpose: Periodic sweep deleting unclaimed slot contents from disk
 * Notes:
 *  - Store locks are held only to list or update; deletion happens outside them
 *  - A failed delete quarantines the item; quarantined items are retried each tick
 *  - stop() (or the destructor) ends the worker thread
 * Last updated: 2026-10-18
 */

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#include "common/media.hpp"
#include "relay_log.hpp"

struct EvictionConfig
{
    std::filesystem::path uploads_dir{"uploads"};
    std::filesystem::path sounds_dir{"sounds"};
    std::chrono::system_clock::duration threshold{std::chrono::seconds(10)};
    std::chrono::milliseconds interval{1000};
};

struct SweepReport
{
    size_t removed{0};
    size_t quarantined{0};
};

class EvictionScheduler
{
public:
    // Returns true when the file is gone. On failure sets ec and returns false.
    using Remover = std::function<bool(const std::filesystem::path &, std::error_code &)>;

    static bool remove_file(const std::filesystem::path &p, std::error_code &ec)
    {
        // std::filesystem::remove reports a missing file as false without an error
        std::filesystem::remove(p, ec);
        return !ec;
    }

    EvictionScheduler(SlotStore &store, EvictionConfig cfg, Remover remover = &EvictionScheduler::remove_file)
        : store_(store), cfg_(std::move(cfg)), remover_(std::move(remover)) {}

    ~EvictionScheduler() { stop(); }

    EvictionScheduler(const EvictionScheduler &) = delete;
    EvictionScheduler &operator=(const EvictionScheduler &) = delete;

    void start()
    {
        if (running_.exchange(true))
            return;
        worker_ = std::thread([this]
                              { run_loop(); });
    }

    void stop()
    {
        {
            std::scoped_lock lk(m_);
            if (!running_.exchange(false))
                return;
        }
        cv_.notify_all();
        if (worker_.joinable())
            worker_.join();
    }

    bool running() const { return running_; }

    SweepReport sweep_once(std::chrono::system_clock::time_point now = std::chrono::system_clock::now())
    {
        SweepReport report;
        auto candidates = store_.list_stale_candidates(cfg_.threshold, now);
        auto retry = store_.list_quarantined();
        candidates.insert(candidates.end(), retry.begin(), retry.end());

        for (const auto &c : candidates)
        {
            const auto path = (c.slot == Slot::Sound ? cfg_.sounds_dir : cfg_.uploads_dir) / c.filename;
            std::error_code ec;
            if (remover_(path, ec))
            {
                if (store_.remove_if_matches(c.slot, c.filename, c.upload_id))
                {
                    ++report.removed;
                    Log::info("evict", "deleted " + path.string());
                }
            }
            else
            {
                if (store_.mark_pending_deletion(c.slot, c.filename, c.upload_id))
                    ++report.quarantined;
                Log::error("evict", "failed to delete " + path.string() + ": " + ec.message());
            }
        }
        return report;
    }

private:
    void run_loop()
    {
        Log::info("evict", "sweep every " + std::to_string(cfg_.interval.count()) + "ms");
        std::unique_lock lk(m_);
        while (running_)
        {
            cv_.wait_for(lk, cfg_.interval, [this]
                         { return !running_; });
            if (!running_)
                break;
            lk.unlock();
            sweep_once();
            lk.lock();
        }
        Log::info("evict", "sweep stopped");
    }

    SlotStore &store_;
    EvictionConfig cfg_;
    Remover remover_;
    std::mutex m_;
    std::condition_variable cv_;
    std::atomic<bool> running_{false};
    std::thread worker_;
};
