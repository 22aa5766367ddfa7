#include "timeline/clip.hpp"
#include <algorithm>
#include <cctype>

namespace ek::timeline {

const char* to_string(MediaType type) noexcept {
    switch(type) {
        case MediaType::Video: return "video";
        case MediaType::Audio: return "audio";
        case MediaType::Image: return "image";
    }
    return "unknown";
}

const char* to_string(Interpolation interp) noexcept {
    switch(interp) {
        case Interpolation::Linear: return "linear";
        case Interpolation::Bezier: return "bezier";
        case Interpolation::Hold: return "hold";
        case Interpolation::EaseIn: return "ease-in";
        case Interpolation::EaseOut: return "ease-out";
    }
    return "linear";
}

std::optional<Interpolation> interpolation_from_string(const std::string& name) {
    std::string key;
    key.reserve(name.size());
    for(char c : name) {
        if(c == '-' || c == '_' || c == ' ') continue;
        key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if(key == "linear") return Interpolation::Linear;
    if(key == "bezier") return Interpolation::Bezier;
    if(key == "hold") return Interpolation::Hold;
    if(key == "easein") return Interpolation::EaseIn;
    if(key == "easeout") return Interpolation::EaseOut;
    return std::nullopt;
}

static double shape(Interpolation interp, double t) {
    switch(interp) {
        case Interpolation::Linear: return t;
        case Interpolation::Bezier: return t * t * (3.0 - 2.0 * t);
        case Interpolation::Hold: return 0.0;
        case Interpolation::EaseIn: return t * t;
        case Interpolation::EaseOut: return 1.0 - (1.0 - t) * (1.0 - t);
    }
    return t;
}

double evaluate_keyframes(const std::vector<Keyframe>& keys, Seconds time) {
    if(keys.empty()) return 0.0;
    if(time <= keys.front().time) return keys.front().value;
    if(time >= keys.back().time) return keys.back().value;
    for(size_t i = 1; i < keys.size(); ++i) {
        const auto& a = keys[i - 1];
        const auto& b = keys[i];
        if(time > b.time) continue;
        double span = b.time - a.time;
        if(span <= kTimeEpsilon) return b.value;
        double t = (time - a.time) / span;
        return a.value + (b.value - a.value) * shape(a.interpolation, t);
    }
    return keys.back().value;
}

bool FilterState::operator==(const FilterState& o) const {
    return blur == o.blur && brightness == o.brightness && contrast == o.contrast &&
           saturate == o.saturate && grayscale == o.grayscale && sepia == o.sepia &&
           hue_rotate == o.hue_rotate;
}

bool Transform::operator==(const Transform& o) const {
    return scale == o.scale && position_x == o.position_x && position_y == o.position_y &&
           rotation == o.rotation && opacity == o.opacity && filters == o.filters;
}

bool AppliedEffect::is_builtin() const {
    return id.rfind(kBuiltinPrefix, 0) == 0;
}

bool AppliedEffect::has_keyframes(const std::string& parameter) const {
    return std::any_of(keyframes.begin(), keyframes.end(),
                       [&](const Keyframe& k){ return k.parameter == parameter; });
}

std::vector<Keyframe> AppliedEffect::keyframes_for(const std::string& parameter) const {
    std::vector<Keyframe> out;
    for(const auto& k : keyframes) {
        if(k.parameter == parameter) out.push_back(k);
    }
    return out;
}

void AppliedEffect::insert_keyframe(const Keyframe& key) {
    for(auto& existing : keyframes) {
        if(existing.parameter == key.parameter && same_time(existing.time, key.time)) {
            existing = key;
            return;
        }
    }
    auto pos = std::upper_bound(keyframes.begin(), keyframes.end(), key.time,
                                [](Seconds t, const Keyframe& k){ return t < k.time; });
    keyframes.insert(pos, key);
}

bool AppliedEffect::set_interpolation(const std::string& parameter, Seconds time, Interpolation interp) {
    for(auto& k : keyframes) {
        if(k.parameter == parameter && same_time(k.time, time)) {
            k.interpolation = interp;
            return true;
        }
    }
    return false;
}

void AppliedEffect::clear_keyframes(const std::string& parameter) {
    keyframes.erase(std::remove_if(keyframes.begin(), keyframes.end(),
                                   [&](const Keyframe& k){ return k.parameter == parameter; }),
                    keyframes.end());
}

double AppliedEffect::static_value(const std::string& parameter, double fallback) const {
    auto it = parameters.find(parameter);
    return it != parameters.end() ? it->second : fallback;
}

double AppliedEffect::value_at(const std::string& parameter, Seconds time, double fallback) const {
    auto keys = keyframes_for(parameter);
    if(keys.empty()) return static_value(parameter, fallback);
    return evaluate_keyframes(keys, time);
}

double AppliedEffect::resting_value(const std::string& parameter, double fallback) const {
    auto keys = keyframes_for(parameter);
    if(keys.empty()) return static_value(parameter, fallback);
    return keys.back().value;
}

bool AppliedEffect::operator==(const AppliedEffect& o) const {
    return id == o.id && effect_id == o.effect_id && parameters == o.parameters &&
           keyframes == o.keyframes && enabled == o.enabled;
}

AppliedEffect* Clip::find_effect(const std::string& applied_id) {
    auto it = std::find_if(effects.begin(), effects.end(),
                           [&](const AppliedEffect& e){ return e.id == applied_id; });
    return it != effects.end() ? &*it : nullptr;
}

const AppliedEffect* Clip::find_effect(const std::string& applied_id) const {
    auto it = std::find_if(effects.begin(), effects.end(),
                           [&](const AppliedEffect& e){ return e.id == applied_id; });
    return it != effects.end() ? &*it : nullptr;
}

bool Clip::operator==(const Clip& o) const {
    return id == o.id && type == o.type && name == o.name &&
           source_start == o.source_start && source_end == o.source_end &&
           timeline_start == o.timeline_start && media_duration == o.media_duration &&
           transform == o.transform && effects == o.effects;
}

} // namespace ek::timeline
