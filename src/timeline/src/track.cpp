#include "timeline/track.hpp"
#include "core/log.hpp"
#include "core/log_config.hpp"
#include <algorithm>

namespace ek::timeline {

Track::Track(TrackId id, Type type, const std::string& name)
    : id_(id), type_(type), name_(name.empty() ? (type == Video ? "Video" : "Audio") : name) {
}

bool Track::accepts(MediaType type) const {
    if(type_ == Audio) return type == MediaType::Audio;
    return type != MediaType::Audio;
}

bool Track::add_clip(const Clip& clip) {
    EK_TL_DEBUG("[Track::add_clip] incoming clip id=" + std::to_string(clip.id) +
                " start=" + std::to_string(clip.timeline_start) +
                " dur=" + std::to_string(clip.duration()));
    if (!clip.is_valid()) {
        ek::log::warn("Cannot add clip " + std::to_string(clip.id) + ": invalid source range");
        return false;
    }
    if (!accepts(clip.type)) {
        ek::log::warn("Cannot add " + std::string(to_string(clip.type)) + " clip to track '" + name_ + "'");
        return false;
    }
    if (find_clip_index(clip.id) < clips_.size()) {
        ek::log::warn("Cannot add clip: id " + std::to_string(clip.id) + " already on track");
        return false;
    }
    if (overlaps_other(clip)) {
        ek::log::warn("Cannot add clip: overlaps with existing clip");
        return false;
    }

    clips_.push_back(clip);
    sort_clips();
    return true;
}

bool Track::remove_clip(ClipId clip_id) {
    size_t index = find_clip_index(clip_id);
    if (index >= clips_.size()) {
        return false;
    }

    clips_.erase(clips_.begin() + static_cast<std::ptrdiff_t>(index));
    return true;
}

Clip* Track::find_clip(ClipId clip_id) {
    size_t index = find_clip_index(clip_id);
    return index < clips_.size() ? &clips_[index] : nullptr;
}

const Clip* Track::find_clip(ClipId clip_id) const {
    size_t index = find_clip_index(clip_id);
    return index < clips_.size() ? &clips_[index] : nullptr;
}

bool Track::set_clip_range(ClipId clip_id, Seconds source_start, Seconds source_end,
                           Seconds timeline_start) {
    size_t index = find_clip_index(clip_id);
    if (index >= clips_.size()) {
        EK_TL_DEBUG("[Track::set_clip_range] clip not found");
        return false;
    }

    Clip& clip = clips_[index];
    Clip previous = clip;
    clip.source_start = source_start;
    clip.source_end = source_end;
    clip.timeline_start = timeline_start;

    if (!clip.is_valid() || overlaps_other(clip)) {
        // Revert the change
        clip = previous;
        ek::log::warn("Cannot change clip range: invalid range or overlap");
        return false;
    }

    sort_clips();
    return true;
}

Seconds Track::end_time() const {
    Seconds end = 0.0;
    for (const auto& clip : clips_) {
        end = std::max(end, clip.timeline_end());
    }
    return end;
}

bool Track::operator==(const Track& other) const {
    return id_ == other.id_ && type_ == other.type_ && name_ == other.name_ && clips_ == other.clips_;
}

void Track::sort_clips() {
    std::stable_sort(clips_.begin(), clips_.end(),
                     [](const Clip& a, const Clip& b) { return a.timeline_start < b.timeline_start; });
}

bool Track::overlaps_other(const Clip& clip) const {
    for (const auto& existing : clips_) {
        if (existing.id == clip.id) continue;
        // Touching edges are allowed
        if (clip.timeline_start < existing.timeline_end() - kTimeEpsilon &&
            existing.timeline_start < clip.timeline_end() - kTimeEpsilon) {
            return true;
        }
    }
    return false;
}

bool Track::validate_no_overlap() const {
    for (size_t i = 1; i < clips_.size(); ++i) {
        if (clips_[i].timeline_start < clips_[i - 1].timeline_end() - kTimeEpsilon) {
            return false;
        }
    }
    return true;
}

size_t Track::find_clip_index(ClipId clip_id) const {
    for (size_t i = 0; i < clips_.size(); ++i) {
        if (clips_[i].id == clip_id) {
            return i;
        }
    }
    return clips_.size();
}

} // namespace ek::timeline
