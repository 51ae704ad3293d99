/*
 * File: src/relay_upload.hpp
 * Project: Display Relay
 * Purpose: Upload validation and the store-then-publish contract
 * Notes:
 *  - Callers write the file first, then call publish_media / publish_sound
 *  - Video uploads publish both a general update and a dedicated video event
 * Last updated: 2026-10-18
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include "common/events.hpp"
#include "common/media.hpp"
#include "notification_hub.hpp"
#include "relay_log.hpp"

inline std::string lower_extension(const std::string &filename)
{
    auto dot = filename.rfind('.');
    std::string ext = (dot == std::string::npos) ? filename : filename.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return ext;
}

inline bool is_image_extension(const std::string &ext)
{
    for (const char *e : {"jpg", "jpeg", "png", "gif", "webp", "bmp", "tiff", "svg"})
        if (ext == e)
            return true;
    return false;
}

inline bool is_video_extension(const std::string &ext)
{
    for (const char *e : {"mp4", "mov", "avi", "webm", "ogg", "mkv", "wmv", "flv", "m4v"})
        if (ext == e)
            return true;
    return false;
}

inline bool is_media_filename(const std::string &filename)
{
    auto ext = lower_extension(filename);
    return is_image_extension(ext) || is_video_extension(ext);
}

inline bool is_sound_filename(const std::string &filename)
{
    auto ext = lower_extension(filename);
    for (const char *e : {"mp3", "wav", "ogg", "flac", "m4a"})
        if (ext == e)
            return true;
    return false;
}

inline MediaKind detect_media_kind(const std::string &filename)
{
    return is_video_extension(lower_extension(filename)) ? MediaKind::Video : MediaKind::Image;
}

// Accepts a plain file name only; anything that could address another directory is refused.
inline bool is_plain_filename(const std::string &name)
{
    if (name.empty() || name == "." || name == "..")
        return false;
    return name.find_first_of("/\\") == std::string::npos && name.find('\0') == std::string::npos;
}

inline uint64_t clamp_display_duration(uint64_t requested)
{
    return std::clamp<uint64_t>(requested, 1, 60);
}

// Unsigned decimal seconds only; signs, blanks, trailing text or overflow give nothing.
inline std::optional<uint64_t> parse_duration_seconds(const std::string &v)
{
    if (v.empty() || !std::all_of(v.begin(), v.end(), [](unsigned char c)
                                  { return std::isdigit(c) != 0; }))
        return std::nullopt;
    try
    {
        return std::stoull(v);
    }
    catch (const std::out_of_range &)
    {
        return std::nullopt;
    }
}

namespace detail
{
    inline bool starts_with(const std::string &data, const char *magic, size_t n)
    {
        return data.size() >= n && std::memcmp(data.data(), magic, n) == 0;
    }

    inline bool has_at(const std::string &data, size_t off, const char *tag, size_t n)
    {
        return data.size() >= off + n && std::memcmp(data.data() + off, tag, n) == 0;
    }
}

// Magic-byte check for images and videos. Unknown extensions pass.
inline bool media_content_matches(const std::string &filename, const std::string &data)
{
    using detail::has_at;
    using detail::starts_with;
    auto ext = lower_extension(filename);
    if (ext == "jpg" || ext == "jpeg")
        return starts_with(data, "\xFF\xD8\xFF", 3);
    if (ext == "png")
        return starts_with(data, "\x89PNG\r\n\x1A\n", 8);
    if (ext == "gif")
        return starts_with(data, "GIF87a", 6) || starts_with(data, "GIF89a", 6);
    if (ext == "webp")
        return starts_with(data, "RIFF", 4) && has_at(data, 8, "WEBP", 4);
    if (ext == "bmp")
        return starts_with(data, "BM", 2);
    if (ext == "svg")
        return starts_with(data, "<?xml", 5) || starts_with(data, "<svg", 4);
    if (ext == "mp4")
        return starts_with(data, "\x00\x00\x00\x18" "ftypmp42", 12) ||
               starts_with(data, "\x00\x00\x00\x20" "ftypmp42", 12) ||
               starts_with(data, "\x00\x00\x00\x18" "ftypmp41", 12) ||
               starts_with(data, "\x00\x00\x00\x18" "ftypiso5", 12);
    if (ext == "mov" || ext == "m4v")
        return starts_with(data, "\x00\x00\x00\x14" "ftypqt", 10) ||
               starts_with(data, "\x00\x00\x00\x20" "ftypM4V", 11);
    if (ext == "avi")
        return starts_with(data, "RIFF", 4) && has_at(data, 8, "AVI ", 4);
    if (ext == "webm" || ext == "mkv")
        return starts_with(data, "\x1A\x45\xDF\xA3", 4);
    if (ext == "ogg")
        return starts_with(data, "OggS", 4);
    if (ext == "wmv")
        return starts_with(data, "\x30\x26\xB2\x75\x8E\x66\xCF\x11", 8);
    if (ext == "flv")
        return starts_with(data, "FLV\x01", 4);
    return true;
}

inline bool sound_content_matches(const std::string &filename, const std::string &data)
{
    using detail::has_at;
    using detail::starts_with;
    auto ext = lower_extension(filename);
    if (ext == "mp3")
        return starts_with(data, "\xFF\xFB", 2) || starts_with(data, "ID3", 3) ||
               starts_with(data, "\xFF\xF3", 2) || starts_with(data, "\xFF\xF2", 2);
    if (ext == "wav")
        return starts_with(data, "RIFF", 4) && has_at(data, 8, "WAVE", 4);
    if (ext == "ogg")
        return starts_with(data, "OggS", 4);
    if (ext == "flac")
        return starts_with(data, "fLaC", 4);
    if (ext == "m4a")
        return starts_with(data, "\x00\x00\x00\x20" "ftypM4A", 11) ||
               starts_with(data, "\x00\x00\x00\x18" "ftypmp42", 12) ||
               starts_with(data, "\x00\x00\x00\x18" "ftypM4A ", 12);
    return true;
}

inline MediaItem make_media_item(const std::string &filename, uint64_t requested_duration_s, std::string caption)
{
    MediaItem m;
    m.filename = filename;
    m.kind = detect_media_kind(filename);
    m.created_at = std::chrono::system_clock::now();
    m.display_duration_s = (m.kind == MediaKind::Video) ? kFullLengthSeconds : clamp_display_duration(requested_duration_s);
    m.caption = std::move(caption);
    return m;
}

// The file must already be on disk. Returns the stored item (with its upload id).
inline MediaItem publish_media(SlotStore &store, NotificationHub &hub, MediaItem item)
{
    item.upload_id = store.set_media(item);
    Log::info("upload", std::string("new ") + to_string(item.kind) + " " + item.filename);
    hub.publish(media_event());
    if (item.kind == MediaKind::Video)
        hub.publish(video_event(item.filename));
    return item;
}

inline SoundItem publish_sound(SlotStore &store, NotificationHub &hub, const std::string &filename)
{
    SoundItem s;
    s.filename = filename;
    s.created_at = std::chrono::system_clock::now();
    s.upload_id = store.set_sound(s);
    Log::info("upload", "new sound " + filename);
    hub.publish(song_event(filename));
    return s;
}
