/*
 * File: include/common/media.hpp
 * Project: Display Relay
 * Purpose: Slot store: current media/sound items and the per-viewer ledger
 * Notes:
 *  - Reads take a shared lock, mutations an exclusive one
 *  - No filesystem or socket I/O inside a critical section
 *  - Mutations naming a superseded filename are silent no-ops
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>

enum class MediaKind
{
    Image,
    Video,
    Sound
};

enum class Slot
{
    Media,
    Sound
};

inline const char *to_string(MediaKind k)
{
    switch (k)
    {
    case MediaKind::Image:
        return "image";
    case MediaKind::Video:
        return "video";
    case MediaKind::Sound:
        return "sound";
    }
    return "unknown";
}

// Videos play their full length; the display duration is only a hint for images.
constexpr uint64_t kFullLengthSeconds = 999999;

struct MediaItem
{
    std::string filename;
    MediaKind kind{MediaKind::Image};
    std::chrono::system_clock::time_point created_at;
    uint64_t display_duration_s{5};
    std::string caption;
    bool pending_deletion{false};
    uint64_t upload_id{0}; // assigned by SlotStore::set_media
};

struct SoundItem
{
    std::string filename;
    std::chrono::system_clock::time_point created_at;
    bool pending_deletion{false};
    uint64_t upload_id{0};
};

struct StaleCandidate
{
    std::string filename;
    Slot slot{Slot::Media};
    MediaKind kind{MediaKind::Image};
    uint64_t upload_id{0}; // generation listed; updates for any other are no-ops
};

inline nlohmann::json media_to_json(const MediaItem &m)
{
    using nlohmann::json;
    using namespace std::chrono;
    auto ms = time_point_cast<milliseconds>(m.created_at).time_since_epoch().count();
    return json{
        {"filename", m.filename},
        {"kind", to_string(m.kind)},
        {"created_ms", ms},
        {"duration_s", m.display_duration_s},
        {"caption", m.caption},
        {"pending_deletion", m.pending_deletion},
        {"upload_id", m.upload_id}};
}

inline nlohmann::json sound_to_json(const SoundItem &s)
{
    using nlohmann::json;
    using namespace std::chrono;
    auto ms = time_point_cast<milliseconds>(s.created_at).time_since_epoch().count();
    return json{
        {"filename", s.filename},
        {"created_ms", ms},
        {"pending_deletion", s.pending_deletion},
        {"upload_id", s.upload_id}};
}

class SlotStore
{
    // Viewers are recorded against one upload generation of a filename. An entry
    // left over from an earlier upload under the same name does not count.
    struct LedgerEntry
    {
        uint64_t upload_id{0};
        std::unordered_set<std::string> viewers;
    };

    mutable std::shared_mutex m_;
    std::optional<MediaItem> media_;
    std::optional<SoundItem> sound_;
    std::unordered_map<std::string, LedgerEntry> ledger_;
    uint64_t next_upload_id_{1};

    bool viewed_locked(const MediaItem &m, const std::string &viewer) const
    {
        auto it = ledger_.find(m.filename);
        if (it == ledger_.end() || it->second.upload_id != m.upload_id)
            return false;
        return it->second.viewers.count(viewer) != 0;
    }

    bool mark_viewed_locked(const std::string &viewer)
    {
        auto &entry = ledger_[media_->filename];
        if (entry.upload_id != media_->upload_id)
        {
            entry.upload_id = media_->upload_id;
            entry.viewers.clear();
        }
        return entry.viewers.insert(viewer).second;
    }

    template <typename Item>
    static bool occupied_by(const std::optional<Item> &slot, const std::string &filename,
                            std::optional<uint64_t> upload_id)
    {
        return slot && slot->filename == filename && (!upload_id || slot->upload_id == *upload_id);
    }

    bool mark_pending_locked(Slot slot, const std::string &filename, std::optional<uint64_t> upload_id)
    {
        if (slot == Slot::Media && occupied_by(media_, filename, upload_id))
        {
            media_->pending_deletion = true;
            return true;
        }
        if (slot == Slot::Sound && occupied_by(sound_, filename, upload_id))
        {
            sound_->pending_deletion = true;
            return true;
        }
        return false;
    }

    bool remove_locked(Slot slot, const std::string &filename, std::optional<uint64_t> upload_id)
    {
        if (slot == Slot::Media && occupied_by(media_, filename, upload_id))
        {
            media_.reset();
            ledger_.erase(filename);
            return true;
        }
        if (slot == Slot::Sound && occupied_by(sound_, filename, upload_id))
        {
            sound_.reset();
            return true;
        }
        return false;
    }

public:
    // Last write wins. The superseded item keeps its ledger entry and its file.
    uint64_t set_media(MediaItem item)
    {
        std::unique_lock lk(m_);
        item.upload_id = next_upload_id_++;
        item.pending_deletion = false;
        media_ = std::move(item);
        return media_->upload_id;
    }

    uint64_t set_sound(SoundItem item)
    {
        std::unique_lock lk(m_);
        item.upload_id = next_upload_id_++;
        item.pending_deletion = false;
        sound_ = std::move(item);
        return sound_->upload_id;
    }

    std::optional<MediaItem> get_current_for_viewer(const std::string &viewer) const
    {
        std::shared_lock lk(m_);
        if (!media_ || media_->pending_deletion || viewed_locked(*media_, viewer))
            return std::nullopt;
        return media_;
    }

    // True only on the first record of (filename, viewer) for the current occupant.
    bool mark_viewed(const std::string &filename, const std::string &viewer)
    {
        std::unique_lock lk(m_);
        if (!media_ || media_->filename != filename)
            return false;
        return mark_viewed_locked(viewer);
    }

    // Same as above, also rejecting a newer upload that reused the filename.
    bool mark_viewed(const MediaItem &item, const std::string &viewer)
    {
        std::unique_lock lk(m_);
        if (!media_ || media_->filename != item.filename || media_->upload_id != item.upload_id)
            return false;
        return mark_viewed_locked(viewer);
    }

    // Slot-qualified forms used by the sweep: they also require the generation
    // that was listed, so a re-upload under the same name is left alone.
    bool mark_pending_deletion(Slot slot, const std::string &filename, uint64_t upload_id)
    {
        std::unique_lock lk(m_);
        return mark_pending_locked(slot, filename, upload_id);
    }

    bool mark_pending_deletion(const std::string &filename)
    {
        std::unique_lock lk(m_);
        bool a = mark_pending_locked(Slot::Media, filename, std::nullopt);
        bool b = mark_pending_locked(Slot::Sound, filename, std::nullopt);
        return a || b;
    }

    bool remove_if_matches(Slot slot, const std::string &filename, uint64_t upload_id)
    {
        std::unique_lock lk(m_);
        return remove_locked(slot, filename, upload_id);
    }

    bool remove_if_matches(const std::string &filename)
    {
        std::unique_lock lk(m_);
        bool a = remove_locked(Slot::Media, filename, std::nullopt);
        bool b = remove_locked(Slot::Sound, filename, std::nullopt);
        return a || b;
    }

    std::vector<StaleCandidate> list_stale_candidates(
        std::chrono::system_clock::duration threshold,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const
    {
        std::vector<StaleCandidate> out;
        std::shared_lock lk(m_);
        auto stale = [&](std::chrono::system_clock::time_point created)
        { return now > created && now - created > threshold; };
        if (media_ && !media_->pending_deletion && stale(media_->created_at))
            out.push_back({media_->filename, Slot::Media, media_->kind, media_->upload_id});
        if (sound_ && !sound_->pending_deletion && stale(sound_->created_at))
            out.push_back({sound_->filename, Slot::Sound, MediaKind::Sound, sound_->upload_id});
        return out;
    }

    std::vector<StaleCandidate> list_quarantined() const
    {
        std::vector<StaleCandidate> out;
        std::shared_lock lk(m_);
        if (media_ && media_->pending_deletion)
            out.push_back({media_->filename, Slot::Media, media_->kind, media_->upload_id});
        if (sound_ && sound_->pending_deletion)
            out.push_back({sound_->filename, Slot::Sound, MediaKind::Sound, sound_->upload_id});
        return out;
    }

    std::optional<MediaItem> current_media() const
    {
        std::shared_lock lk(m_);
        return media_;
    }

    std::optional<SoundItem> current_sound() const
    {
        std::shared_lock lk(m_);
        return sound_;
    }
};
