/*
 * File: include/common/events.hpp
 * Project: Display Relay
 * Purpose: Notification envelope sent to viewers: {"event": ..., "url": ...}
 * Notes:
 *  - The only wire format exposed by the relay core
 * Last updated: 2026-10-18
 */

#pragma once
#include <cstdio>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

enum class EventKind
{
    Media,
    Video,
    Song,
    RawUrl
};

struct HubEvent
{
    EventKind kind{EventKind::Media};
    std::string url;
};

inline const char *to_string(EventKind k)
{
    switch (k)
    {
    case EventKind::Media:
        return "media";
    case EventKind::Video:
        return "video";
    case EventKind::Song:
        return "song";
    case EventKind::RawUrl:
        return "raw_url";
    }
    return "unknown";
}

inline EventKind event_kind_from_string(const std::string &s)
{
    if (s == "media")
        return EventKind::Media;
    if (s == "video")
        return EventKind::Video;
    if (s == "song")
        return EventKind::Song;
    if (s == "raw_url")
        return EventKind::RawUrl;
    throw std::invalid_argument("unknown event kind: " + s);
}

// Percent-encodes controls, space, '"', '<', '>' and '`'. Everything else is kept.
inline std::string encode_url_fragment(const std::string &s)
{
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
    {
        if (c < 0x20 || c == 0x7f || c >= 0x80 || c == ' ' || c == '"' || c == '<' || c == '>' || c == '`')
        {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
        else
        {
            out += static_cast<char>(c);
        }
    }
    return out;
}

inline HubEvent media_event()
{
    return {EventKind::Media, "/?ws=true"};
}

inline HubEvent video_event(const std::string &filename)
{
    return {EventKind::Video, "/uploads/" + encode_url_fragment(filename) + "?ws=true"};
}

inline HubEvent song_event(const std::string &filename)
{
    return {EventKind::Song, "/sounds/" + encode_url_fragment(filename) + "?ws=true"};
}

inline HubEvent raw_url_event(std::string url)
{
    return {EventKind::RawUrl, std::move(url)};
}

inline nlohmann::json event_to_json(const HubEvent &e)
{
    return nlohmann::json{{"event", to_string(e.kind)}, {"url", e.url}};
}

inline HubEvent event_from_json(const nlohmann::json &j)
{
    return {event_kind_from_string(j.at("event").get<std::string>()), j.at("url").get<std::string>()};
}
