#include "timeline/timeline.hpp"
#include "core/log.hpp"
#include "core/log_config.hpp"
#include <algorithm>

namespace ek::timeline {

Timeline::Timeline() {
    ek::log::debug("Created new timeline");
}

std::shared_ptr<const Timeline::Snapshot> Timeline::snapshot() const {
    auto snap = std::make_shared<Snapshot>();
    snap->tracks.reserve(tracks_.size());
    for (const auto& tptr : tracks_) {
        snap->tracks.push_back(*tptr);
    }
    snap->playback = playback_;
    return snap;
}

void Timeline::restore(const Snapshot& snap) {
    tracks_.clear();
    for (const auto& track : snap.tracks) {
        next_track_id_ = std::max(next_track_id_, track.id() + 1);
        for (const auto& clip : track.clips()) {
            next_clip_id_ = std::max(next_clip_id_, clip.id + 1);
        }
        tracks_.push_back(std::make_unique<Track>(track));
    }
    playback_ = snap.playback;
    if (selected_clip_ != 0 && !find_clip(selected_clip_)) {
        selected_clip_ = 0;
    }
    mark_modified();
}

void Timeline::reset() {
    tracks_.clear();
    playback_ = PlaybackState{};
    selected_clip_ = 0;
    ek::log::debug("Timeline reset");
    mark_modified();
}

TrackId Timeline::add_track(Track::Type type, const std::string& name) {
    TrackId id = next_track_id_++;
    std::string track_name = name;

    if (track_name.empty()) {
        int count = static_cast<int>(get_tracks_by_type(type).size()) + 1;
        track_name = (type == Track::Video ? "Video " : "Audio ") + std::to_string(count);
    }

    tracks_.push_back(std::make_unique<Track>(id, type, track_name));

    ek::log::info("Added track: " + track_name + " (ID: " + std::to_string(id) + ")");
    mark_modified();
    return id;
}

bool Timeline::remove_track(TrackId track_id) {
    size_t index = find_track_index(track_id);
    if (index >= tracks_.size()) {
        return false;
    }

    std::string track_name = tracks_[index]->name();
    tracks_.erase(tracks_.begin() + static_cast<std::ptrdiff_t>(index));
    if (selected_clip_ != 0 && !find_clip(selected_clip_)) {
        selected_clip_ = 0;
    }

    ek::log::info("Removed track: " + track_name + " (ID: " + std::to_string(track_id) + ")");
    mark_modified();
    return true;
}

Track* Timeline::get_track(TrackId track_id) {
    size_t index = find_track_index(track_id);
    return index < tracks_.size() ? tracks_[index].get() : nullptr;
}

const Track* Timeline::get_track(TrackId track_id) const {
    size_t index = find_track_index(track_id);
    return index < tracks_.size() ? tracks_[index].get() : nullptr;
}

std::vector<Track*> Timeline::get_tracks_by_type(Track::Type type) {
    std::vector<Track*> result;
    for (auto& track : tracks_) {
        if (track->type() == type) {
            result.push_back(track.get());
        }
    }
    return result;
}

std::vector<const Track*> Timeline::get_tracks_by_type(Track::Type type) const {
    std::vector<const Track*> result;
    for (const auto& track : tracks_) {
        if (track->type() == type) {
            result.push_back(track.get());
        }
    }
    return result;
}

ClipId Timeline::add_clip(TrackId track_id, Clip clip) {
    Track* track = get_track(track_id);
    if (!track) {
        ek::log::warn("add_clip: unknown track " + std::to_string(track_id));
        return 0;
    }

    bool assigned = clip.id == 0;
    if (assigned) {
        clip.id = next_clip_id_;
    } else if (find_clip(clip.id)) {
        ek::log::warn("add_clip: clip id " + std::to_string(clip.id) + " already in use");
        return 0;
    }
    if (clip.name.empty()) {
        clip.name = "Clip " + std::to_string(clip.id);
    }

    if (!track->add_clip(clip)) {
        return 0;
    }
    // Keep next_clip_id_ ahead of any explicitly provided IDs
    next_clip_id_ = std::max(next_clip_id_, clip.id + 1);

    ek::log::info("Added clip: " + clip.name + " (ID: " + std::to_string(clip.id) + ")");
    mark_modified();
    return clip.id;
}

bool Timeline::remove_clip(ClipId clip_id) {
    Track* track = track_of(clip_id);
    if (!track || !track->remove_clip(clip_id)) {
        return false;
    }
    if (selected_clip_ == clip_id) {
        selected_clip_ = 0;
    }
    if (!has_clips()) {
        playback_.is_playing = false;
        playback_.current_time = 0.0;
    }
    ek::log::info("Removed clip ID: " + std::to_string(clip_id));
    mark_modified();
    return true;
}

Clip* Timeline::find_clip(ClipId clip_id) {
    for (auto& track : tracks_) {
        if (auto* clip = track->find_clip(clip_id)) return clip;
    }
    return nullptr;
}

const Clip* Timeline::find_clip(ClipId clip_id) const {
    for (const auto& track : tracks_) {
        if (const auto* clip = track->find_clip(clip_id)) return clip;
    }
    return nullptr;
}

Track* Timeline::track_of(ClipId clip_id) {
    for (auto& track : tracks_) {
        if (track->find_clip(clip_id)) return track.get();
    }
    return nullptr;
}

const Track* Timeline::track_of(ClipId clip_id) const {
    for (const auto& track : tracks_) {
        if (track->find_clip(clip_id)) return track.get();
    }
    return nullptr;
}

std::vector<ClipId> Timeline::clip_ids() const {
    std::vector<ClipId> ids;
    for (const auto& track : tracks_) {
        for (const auto& clip : track->clips()) ids.push_back(clip.id);
    }
    return ids;
}

std::optional<std::pair<ClipId, ClipId>> Timeline::split_clip(ClipId clip_id, Seconds time) {
    Track* track = track_of(clip_id);
    if (!track) return std::nullopt;
    Clip* clip = track->find_clip(clip_id);

    if (time <= clip->timeline_start + kSplitMargin || time >= clip->timeline_end() - kSplitMargin) {
        ek::log::warn("split_clip: time " + format_timecode(time) + " outside clip " + std::to_string(clip_id));
        return std::nullopt;
    }

    Seconds split_source = clip->source_start + (time - clip->timeline_start);

    Clip second = *clip;
    second.id = next_clip_id_++;
    second.source_start = split_source;
    second.timeline_start = time;

    if (!track->set_clip_range(clip_id, clip->source_start, split_source, clip->timeline_start)) {
        return std::nullopt;
    }
    if (!track->add_clip(second)) {
        // Undo the truncation so the track is left as it was
        Clip* first = track->find_clip(clip_id);
        if (!track->set_clip_range(clip_id, first->source_start, second.source_end, first->timeline_start)) {
            ek::log::error("split_clip: failed to restore clip " + std::to_string(clip_id));
        }
        return std::nullopt;
    }

    EK_TL_DEBUG("[Timeline::split_clip] " + std::to_string(clip_id) + " -> " + std::to_string(second.id));
    mark_modified();
    return std::make_pair(clip_id, second.id);
}

bool Timeline::trim_clip(ClipId clip_id, std::optional<Seconds> source_start,
                         std::optional<Seconds> source_end) {
    Track* track = track_of(clip_id);
    if (!track) return false;
    const Clip& clip = *track->find_clip(clip_id);

    Seconds new_start = clip.source_start;
    Seconds new_end = clip.source_end;
    Seconds new_timeline_start = clip.timeline_start;

    if (source_start) {
        new_start = clamp_time(*source_start, 0.0, clip.source_end - kMinTrimLength);
        new_timeline_start = std::max(0.0, clip.timeline_start + (new_start - clip.source_start));
    }
    if (source_end) {
        Seconds max_end = clip.media_duration > 0.0 ? clip.media_duration : clip.source_end;
        new_end = std::min(max_end, std::max(*source_end, new_start + kMinTrimLength));
    }

    if (!track->set_clip_range(clip_id, new_start, new_end, new_timeline_start)) {
        return false;
    }
    mark_modified();
    return true;
}

Seconds Timeline::duration() const {
    Seconds end = 0.0;
    for (const auto& track : tracks_) {
        end = std::max(end, track->end_time());
    }
    return end;
}

void Timeline::set_playing(bool playing) {
    playback_.is_playing = playing;
}

void Timeline::set_current_time(Seconds time) {
    playback_.current_time = std::max(0.0, time);
}

void Timeline::set_volume(double volume) {
    playback_.volume = std::min(1.0, std::max(0.0, volume));
}

void Timeline::set_muted(bool muted) {
    playback_.muted = muted;
}

bool Timeline::set_playback_rate(double rate) {
    if (!(rate > 0.0)) {
        ek::log::warn("Rejected playback rate " + std::to_string(rate));
        return false;
    }
    playback_.playback_rate = rate;
    return true;
}

ClipId Timeline::active_clip() const {
    if (selected_clip_ != 0 && find_clip(selected_clip_)) {
        return selected_clip_;
    }
    for (const auto& track : tracks_) {
        if (track->type() == Track::Video && !track->empty()) {
            return track->clips().front().id;
        }
    }
    return 0;
}

std::string Timeline::generate_effect_id() {
    return "fx-" + std::to_string(next_effect_id_++);
}

size_t Timeline::find_track_index(TrackId track_id) const {
    for (size_t i = 0; i < tracks_.size(); ++i) {
        if (tracks_[i]->id() == track_id) {
            return i;
        }
    }
    return tracks_.size();
}

bool Timeline::has_clips() const {
    return std::any_of(tracks_.begin(), tracks_.end(),
                       [](const auto& t) { return !t->empty(); });
}

} // namespace ek::timeline
