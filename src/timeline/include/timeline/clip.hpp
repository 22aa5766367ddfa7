#pragma once
#include "core/time.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ek::timeline {

using ClipId = uint64_t;
using TrackId = uint64_t;

enum class MediaType { Video, Audio, Image };

const char* to_string(MediaType type) noexcept;

enum class Interpolation { Linear, Bezier, Hold, EaseIn, EaseOut };

const char* to_string(Interpolation interp) noexcept;
// Accepts "linear", "bezier", "hold", "ease-in"/"ease_in"/"easeIn", ... case-insensitive
std::optional<Interpolation> interpolation_from_string(const std::string& name);

struct Keyframe {
    std::string parameter;   // parameter this keyframe drives
    Seconds time = 0.0;      // absolute, seconds from project origin
    double value = 0.0;
    Interpolation interpolation = Interpolation::Linear;

    bool operator==(const Keyframe& other) const {
        return parameter == other.parameter && time == other.time &&
               value == other.value && interpolation == other.interpolation;
    }
    bool operator!=(const Keyframe& other) const { return !(*this == other); }
};

// Evaluates an ordered keyframe list at `time`. The left keyframe's curve
// shapes the segment; before the first / after the last the value holds.
double evaluate_keyframes(const std::vector<Keyframe>& keys, Seconds time);

struct FilterState {
    double blur = 0.0;
    double brightness = 1.0;   // multiplier around 1.0
    double contrast = 1.0;
    double saturate = 1.0;
    double grayscale = 0.0;
    double sepia = 0.0;
    double hue_rotate = 0.0;   // degrees

    bool operator==(const FilterState& other) const;
    bool operator!=(const FilterState& other) const { return !(*this == other); }
};

struct Transform {
    double scale = 100.0;      // percent
    double position_x = 0.0;   // pixels
    double position_y = 0.0;
    double rotation = 0.0;     // degrees
    double opacity = 100.0;    // percent
    FilterState filters;

    bool operator==(const Transform& other) const;
    bool operator!=(const Transform& other) const { return !(*this == other); }
};

// Applied effect ids starting with this prefix are the reserved entries
// mirrored from a clip's Transform.
inline constexpr const char* kBuiltinPrefix = "builtin-";

struct AppliedEffect {
    std::string id;
    std::string effect_id;
    std::map<std::string, double> parameters;
    std::vector<Keyframe> keyframes;   // sorted by time
    bool enabled = true;

    bool is_builtin() const;
    bool is_animated() const { return !keyframes.empty(); }
    bool has_keyframes(const std::string& parameter) const;

    std::vector<Keyframe> keyframes_for(const std::string& parameter) const;
    // Inserts keeping order; a keyframe at an existing time replaces it.
    void insert_keyframe(const Keyframe& key);
    // Returns false when no keyframe sits at `time`.
    [[nodiscard]] bool set_interpolation(const std::string& parameter, Seconds time, Interpolation interp);
    void clear_keyframes(const std::string& parameter);

    double static_value(const std::string& parameter, double fallback = 0.0) const;
    double value_at(const std::string& parameter, Seconds time, double fallback = 0.0) const;
    // Last keyframe value when animated, otherwise the static value
    double resting_value(const std::string& parameter, double fallback = 0.0) const;

    bool operator==(const AppliedEffect& other) const;
    bool operator!=(const AppliedEffect& other) const { return !(*this == other); }
};

struct Clip {
    ClipId id = 0;
    MediaType type = MediaType::Video;
    std::string name;

    Seconds source_start = 0.0;     // in-point into the media
    Seconds source_end = 0.0;       // out-point (exclusive)
    Seconds timeline_start = 0.0;   // placement on the track
    Seconds media_duration = 0.0;   // 0 when unknown

    Transform transform;
    std::vector<AppliedEffect> effects;

    Seconds duration() const { return source_end - source_start; }
    Seconds timeline_end() const { return timeline_start + duration(); }
    bool is_valid() const { return source_start < source_end && timeline_start >= 0.0; }
    bool is_visual() const { return type != MediaType::Audio; }

    AppliedEffect* find_effect(const std::string& applied_id);
    const AppliedEffect* find_effect(const std::string& applied_id) const;

    bool operator==(const Clip& other) const;
    bool operator!=(const Clip& other) const { return !(*this == other); }
};

} // namespace ek::timeline
