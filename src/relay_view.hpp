/*
 * File: src/relay_view.hpp
 * Project: Display Relay
 * Purpose: Decide-then-consume protocol for "show this viewer the current item"
 * Notes:
 *  - Read and mark are two separate lock windows; the mark re-checks identity
 * Last updated: 2026-10-18
 */

#pragma once
#include <optional>
#include <string>
#include "common/media.hpp"
#include "relay_log.hpp"

class ViewCoordinator
{
    SlotStore &store_;

public:
    explicit ViewCoordinator(SlotStore &store) : store_(store) {}

    // Returns the item only if this call recorded the view. A concurrent claim by
    // the same viewer, or a supersession between read and mark, yields nothing.
    std::optional<MediaItem> claim(const std::string &viewer)
    {
        auto candidate = store_.get_current_for_viewer(viewer);
        if (!candidate)
        {
            Log::debug("view", "nothing new for " + viewer);
            return std::nullopt;
        }
        if (!store_.mark_viewed(*candidate, viewer))
        {
            Log::info("view", "lost race for " + candidate->filename + " viewer=" + viewer);
            return std::nullopt;
        }
        Log::info("view", "served " + candidate->filename + " to " + viewer);
        return candidate;
    }
};
