#pragma once
// NOTE: Helper track_is_sorted is defined at end of this header; tests rely on it.
#include "timeline/clip.hpp"
#include <string>
#include <vector>

namespace ek::timeline {

// Forward declare helper for translation units that might reference earlier
bool track_is_sorted(const class Track& track);

class Track {
public:
    enum Type { Video, Audio };

    Track(TrackId id, Type type, const std::string& name = "");
    ~Track() = default;

    // Properties
    TrackId id() const { return id_; }
    Type type() const { return type_; }
    const std::string& name() const { return name_; }

    // Video tracks carry video and image clips, audio tracks audio clips
    bool accepts(MediaType type) const;

    // Clip management
    [[nodiscard]] bool add_clip(const Clip& clip);
    [[nodiscard]] bool remove_clip(ClipId clip_id);
    Clip* find_clip(ClipId clip_id);
    const Clip* find_clip(ClipId clip_id) const;

    // Moves the clip's source range and placement; reverts on overlap or invalid range
    [[nodiscard]] bool set_clip_range(ClipId clip_id, Seconds source_start, Seconds source_end,
                                      Seconds timeline_start);

    const std::vector<Clip>& clips() const { return clips_; }
    std::vector<Clip>& clips() { return clips_; }
    bool empty() const { return clips_.empty(); }

    Seconds end_time() const;

    // Public invariant check wrapper (used in tests)
    bool is_non_overlapping() const { return validate_no_overlap(); }

    bool operator==(const Track& other) const;
    bool operator!=(const Track& other) const { return !(*this == other); }

private:
    TrackId id_;
    Type type_;
    std::string name_;

    std::vector<Clip> clips_;  // Always sorted by timeline_start

    void sort_clips();
    bool validate_no_overlap() const;
    bool overlaps_other(const Clip& clip) const;
    size_t find_clip_index(ClipId clip_id) const;
};

// Free helper (used by tests) to verify clips sorted by start time
inline bool track_is_sorted(const Track& track){
    const auto& clips = track.clips();
    for(size_t i=1;i<clips.size();++i){
        if(clips[i-1].timeline_start > clips[i].timeline_start) return false;
    }
    return true;
}

} // namespace ek::timeline
