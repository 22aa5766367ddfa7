#pragma once
#include "timeline/track.hpp"
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace ek::timeline {

struct PlaybackState {
    bool is_playing = false;
    Seconds current_time = 0.0;
    double volume = 1.0;          // 0..1
    bool muted = false;
    double playback_rate = 1.0;

    bool operator==(const PlaybackState& other) const {
        return is_playing == other.is_playing && current_time == other.current_time &&
               volume == other.volume && muted == other.muted &&
               playback_rate == other.playback_rate;
    }
    bool operator!=(const PlaybackState& other) const { return !(*this == other); }
};

class Timeline {
public:
    // Split points closer than this to a clip edge are rejected
    static constexpr Seconds kSplitMargin = 0.01;
    // Minimum clip length a trim can leave
    static constexpr Seconds kMinTrimLength = 0.05;

    Timeline();
    ~Timeline() = default;

    // Track management
    TrackId add_track(Track::Type type, const std::string& name = "");
    bool remove_track(TrackId track_id);
    Track* get_track(TrackId track_id);
    const Track* get_track(TrackId track_id) const;

    std::vector<Track*> get_tracks_by_type(Track::Type type);
    std::vector<const Track*> get_tracks_by_type(Track::Type type) const;
    const std::vector<std::unique_ptr<Track>>& tracks() const { return tracks_; }

    // Clip management. add_clip assigns an id when clip.id == 0; returns 0 on failure.
    ClipId add_clip(TrackId track_id, Clip clip);
    [[nodiscard]] bool remove_clip(ClipId clip_id);
    Clip* find_clip(ClipId clip_id);
    const Clip* find_clip(ClipId clip_id) const;
    Track* track_of(ClipId clip_id);
    const Track* track_of(ClipId clip_id) const;
    std::vector<ClipId> clip_ids() const;

    // Cuts the clip at an absolute timeline time. The second half gets a new id
    // and its own copy of the effects.
    std::optional<std::pair<ClipId, ClipId>> split_clip(ClipId clip_id, Seconds time);
    // Source-range trim; the start edge moves the placement with it.
    [[nodiscard]] bool trim_clip(ClipId clip_id, std::optional<Seconds> source_start,
                                 std::optional<Seconds> source_end);

    Seconds duration() const;

    // Playback state
    const PlaybackState& playback() const { return playback_; }
    void set_playing(bool playing);
    void set_current_time(Seconds time);
    void set_volume(double volume);
    void set_muted(bool muted);
    [[nodiscard]] bool set_playback_rate(double rate);

    // Selection
    void select_clip(ClipId clip_id) { selected_clip_ = clip_id; }
    ClipId selected_clip() const { return selected_clip_; }
    // Selected clip, else the first clip on the first video track; 0 when none
    ClipId active_clip() const;

    // Versioning & snapshot
    uint64_t version() const { return version_; }
    // Marks structural modification
    void mark_modified() { ++version_; }

    // Ids for applied effects ("fx-1", "fx-2", ...). Never reused, even across restore.
    std::string generate_effect_id();

    struct Snapshot {
        std::vector<Track> tracks; // immutable copies
        PlaybackState playback;

        bool operator==(const Snapshot& other) const {
            return tracks == other.tracks && playback == other.playback;
        }
        bool operator!=(const Snapshot& other) const { return !(*this == other); }
    };
    std::shared_ptr<const Snapshot> snapshot() const; // deep copy of tracks and playback
    void restore(const Snapshot& snap);
    // Drops every track and resets playback; id counters keep running
    void reset();

private:
    std::vector<std::unique_ptr<Track>> tracks_;

    TrackId next_track_id_ = 1;
    ClipId next_clip_id_ = 1;
    uint64_t next_effect_id_ = 1;

    PlaybackState playback_;
    ClipId selected_clip_ = 0;
    uint64_t version_ = 1;

    size_t find_track_index(TrackId track_id) const;
    bool has_clips() const;
};

} // namespace ek::timeline
