/*
 * File: include/notification_hub.hpp
 * Project: Display Relay
 * Purpose: In-process broadcaster, one bounded queue per subscriber
 * Notes:
 *  - publish() never blocks on a subscriber; overflow drops the oldest event
 *  - The registry holds weak references; a dropped Subscription is pruned
 *  - No replay: a new subscriber only sees events published after subscribe()
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "common/events.hpp"

class Subscription
{
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::deque<HubEvent> queue_;
    std::function<void()> notify_;
    const size_t capacity_;
    uint64_t dropped_{0};
    bool closed_{false};

public:
    explicit Subscription(size_t capacity) : capacity_(capacity ? capacity : 1) {}

    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    // Called by the hub. Returns false once the subscription is closed.
    bool push(const HubEvent &e)
    {
        std::function<void()> notify;
        {
            std::scoped_lock lk(m_);
            if (closed_)
                return false;
            if (queue_.size() >= capacity_)
            {
                queue_.pop_front();
                ++dropped_;
            }
            queue_.push_back(e);
            notify = notify_;
        }
        cv_.notify_one();
        if (notify)
            notify();
        return true;
    }

    std::optional<HubEvent> try_pop()
    {
        std::scoped_lock lk(m_);
        if (queue_.empty())
            return std::nullopt;
        HubEvent e = std::move(queue_.front());
        queue_.pop_front();
        return e;
    }

    // Waits up to timeout for an event; returns nothing on timeout or close.
    std::optional<HubEvent> pop_for(std::chrono::milliseconds timeout)
    {
        std::unique_lock lk(m_);
        cv_.wait_for(lk, timeout, [this]
                     { return closed_ || !queue_.empty(); });
        if (queue_.empty())
            return std::nullopt;
        HubEvent e = std::move(queue_.front());
        queue_.pop_front();
        return e;
    }

    // Invoked after every successful push, outside the queue lock. Must not block.
    void set_notify(std::function<void()> fn)
    {
        std::scoped_lock lk(m_);
        notify_ = std::move(fn);
    }

    void close()
    {
        {
            std::scoped_lock lk(m_);
            closed_ = true;
            notify_ = nullptr;
        }
        cv_.notify_all();
    }

    bool closed() const
    {
        std::scoped_lock lk(m_);
        return closed_;
    }

    uint64_t dropped() const
    {
        std::scoped_lock lk(m_);
        return dropped_;
    }

    size_t size() const
    {
        std::scoped_lock lk(m_);
        return queue_.size();
    }

    size_t capacity() const { return capacity_; }
};

class NotificationHub
{
    std::mutex m_;
    std::vector<std::weak_ptr<Subscription>> subs_;
    const size_t capacity_;

public:
    explicit NotificationHub(size_t capacity = 100) : capacity_(capacity) {}

    std::shared_ptr<Subscription> subscribe()
    {
        auto s = std::make_shared<Subscription>(capacity_);
        std::scoped_lock lk(m_);
        subs_.push_back(s);
        return s;
    }

    // Returns the number of subscriptions the event was queued on.
    size_t publish(const HubEvent &e)
    {
        std::vector<std::shared_ptr<Subscription>> live;
        {
            std::scoped_lock lk(m_);
            std::vector<std::weak_ptr<Subscription>> kept;
            kept.reserve(subs_.size());
            live.reserve(subs_.size());
            for (auto &w : subs_)
            {
                if (auto s = w.lock(); s && !s->closed())
                {
                    kept.push_back(w);
                    live.push_back(std::move(s));
                }
            }
            subs_.swap(kept);
        }
        size_t delivered = 0;
        for (auto &s : live)
        {
            if (s->push(e))
                ++delivered;
        }
        return delivered;
    }

    size_t subscriber_count()
    {
        std::scoped_lock lk(m_);
        size_t n = 0;
        for (auto &w : subs_)
        {
            if (auto s = w.lock(); s && !s->closed())
                ++n;
        }
        return n;
    }

    size_t capacity() const { return capacity_; }
};
