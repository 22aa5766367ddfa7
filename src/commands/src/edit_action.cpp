#include "commands/edit_action.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <cstdio>

namespace ek::commands {

using core::ValidationError;

std::optional<double> ParamValue::number() const {
    if (auto* v = std::get_if<double>(&value_)) return *v;
    return std::nullopt;
}

std::optional<bool> ParamValue::flag() const {
    if (auto* v = std::get_if<bool>(&value_)) return *v;
    return std::nullopt;
}

std::optional<std::string> ParamValue::text() const {
    if (auto* v = std::get_if<std::string>(&value_)) return *v;
    return std::nullopt;
}

std::optional<NumberMap> ParamValue::numbers() const {
    if (auto* v = std::get_if<NumberMap>(&value_)) return *v;
    return std::nullopt;
}

std::optional<ParameterEdits> ParamValue::edits() const {
    if (auto* v = std::get_if<ParameterEdits>(&value_)) return *v;
    return std::nullopt;
}

const char* to_string(ParamValue::Kind kind) noexcept {
    switch (kind) {
        case ParamValue::Kind::Number: return "number";
        case ParamValue::Kind::Flag: return "boolean";
        case ParamValue::Kind::Text: return "string";
        case ParamValue::Kind::Numbers: return "object";
        case ParamValue::Kind::Edits: return "list";
    }
    return "unknown";
}

// ---- ActionParams ---------------------------------------------------------

namespace {

[[noreturn]] void wrong_kind(const std::string& key, ParamValue::Kind expected, ParamValue::Kind actual) {
    throw ValidationError("Parameter '" + key + "' must be a " + to_string(expected) + ", got " +
                          to_string(actual));
}

[[noreturn]] void missing(const std::string& key) {
    throw ValidationError("Missing required parameter '" + key + "'");
}

} // namespace

ActionParams& ActionParams::set(const std::string& key, ParamValue value) {
    auto it = values_.find(key);
    if (it != values_.end()) {
        it->second = std::move(value);
    } else {
        values_.emplace(key, std::move(value));
    }
    return *this;
}

const ParamValue* ActionParams::find(const std::string& key) const {
    auto it = values_.find(key);
    return it == values_.end() ? nullptr : &it->second;
}

std::optional<double> ActionParams::number(const std::string& key) const {
    const ParamValue* v = find(key);
    if (!v) return std::nullopt;
    if (!v->is_number()) wrong_kind(key, ParamValue::Kind::Number, v->kind());
    double n = *v->number();
    if (!std::isfinite(n)) {
        throw ValidationError("Parameter '" + key + "' must be a finite number");
    }
    return n;
}

std::optional<bool> ActionParams::flag(const std::string& key) const {
    const ParamValue* v = find(key);
    if (!v) return std::nullopt;
    if (!v->is_flag()) wrong_kind(key, ParamValue::Kind::Flag, v->kind());
    return v->flag();
}

std::optional<std::string> ActionParams::text(const std::string& key) const {
    const ParamValue* v = find(key);
    if (!v) return std::nullopt;
    if (!v->is_text()) wrong_kind(key, ParamValue::Kind::Text, v->kind());
    return v->text();
}

std::optional<NumberMap> ActionParams::numbers(const std::string& key) const {
    const ParamValue* v = find(key);
    if (!v) return std::nullopt;
    if (!v->is_numbers()) wrong_kind(key, ParamValue::Kind::Numbers, v->kind());
    return v->numbers();
}

std::optional<ParameterEdits> ActionParams::edits(const std::string& key) const {
    const ParamValue* v = find(key);
    if (!v) return std::nullopt;
    if (!v->is_edits()) wrong_kind(key, ParamValue::Kind::Edits, v->kind());
    return v->edits();
}

double ActionParams::require_number(const std::string& key) const {
    auto v = number(key);
    if (!v) missing(key);
    return *v;
}

bool ActionParams::require_flag(const std::string& key) const {
    auto v = flag(key);
    if (!v) missing(key);
    return *v;
}

std::string ActionParams::require_text(const std::string& key) const {
    auto v = text(key);
    if (!v || v->empty()) missing(key);
    return *v;
}

NumberMap ActionParams::require_numbers(const std::string& key) const {
    auto v = numbers(key);
    if (!v) missing(key);
    return *v;
}

std::optional<ClipId> ActionParams::clip_id() const {
    auto id = number("clipId");
    if (!id) return std::nullopt;
    if (*id < 1.0 || std::floor(*id) != *id) {
        throw ValidationError("Parameter 'clipId' must be a positive integer");
    }
    // Largest integer a double holds exactly
    if (*id > 9007199254740992.0) {
        throw ValidationError("Parameter 'clipId' is out of range");
    }
    return static_cast<ClipId>(*id);
}

std::optional<Interpolation> ActionParams::interpolation() const {
    auto name = text("interpolation");
    if (!name) return std::nullopt;
    auto interp = timeline::interpolation_from_string(*name);
    if (!interp) {
        throw ValidationError("Unknown interpolation '" + *name + "'");
    }
    return interp;
}

std::string format_number(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", value);
    std::string s(buf);
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    if (s == "-0") s = "0";
    return s;
}

// ---- Typed actions --------------------------------------------------------

AnimationFields AnimationFields::parse(const ActionParams& params, bool animated_default) {
    AnimationFields f;
    f.animated = params.flag_or("animated", animated_default);
    f.duration = params.number("duration");
    if (f.duration && !(*f.duration > 0.0)) {
        throw ValidationError("Parameter 'duration' must be positive");
    }
    f.start_time = params.number_or("startTime", 0.0);
    if (f.start_time < 0.0) {
        throw ValidationError("Parameter 'startTime' must not be negative");
    }
    f.interpolation = params.interpolation();
    return f;
}

ZoomAction ZoomAction::parse(const ActionParams& params) {
    ZoomAction a;
    a.scale = params.require_number("scale");
    a.start_scale = params.number("startScale");
    a.animation = AnimationFields::parse(params);
    if (a.scale <= 0.0 || (a.start_scale && *a.start_scale <= 0.0)) {
        throw ValidationError("Zoom scale must be positive");
    }
    return a;
}

ZoomRampAction ZoomRampAction::parse(const ActionParams& params) {
    ZoomRampAction a;
    a.start_scale = params.number("startScale");
    a.end_scale = params.number("endScale");
    a.animation = AnimationFields::parse(params, true);
    if ((a.start_scale && *a.start_scale <= 0.0) || (a.end_scale && *a.end_scale <= 0.0)) {
        throw ValidationError("Zoom scale must be positive");
    }
    return a;
}

PositionAction PositionAction::parse(const ActionParams& params) {
    PositionAction a;
    a.x = params.require_number("x");
    a.y = params.require_number("y");
    a.animation = AnimationFields::parse(params);
    return a;
}

OpacityAction OpacityAction::parse(const ActionParams& params) {
    OpacityAction a;
    a.value = params.require_number("value");
    a.animation = AnimationFields::parse(params);
    if (a.value < 0.0 || a.value > 100.0) {
        throw ValidationError("Opacity must be between 0 and 100");
    }
    return a;
}

RotationAction RotationAction::parse(const ActionParams& params) {
    RotationAction a;
    a.degrees = params.require_number("degrees");
    a.animation = AnimationFields::parse(params);
    return a;
}

FilterAction FilterAction::parse(const ActionParams& params) {
    FilterAction a;
    a.filter = params.require_text("filter");
    a.value = params.require_number("value");
    a.animation = AnimationFields::parse(params);
    return a;
}

VolumeAction VolumeAction::parse(const ActionParams& params) {
    VolumeAction a;
    a.value = params.require_number("value");
    if (a.value < 0.0 || a.value > 1.0) {
        throw ValidationError("Volume must be between 0 and 1");
    }
    return a;
}

PlaybackRateAction PlaybackRateAction::parse(const ActionParams& params) {
    PlaybackRateAction a;
    a.value = params.require_number("value");
    if (!(a.value > 0.0)) {
        throw ValidationError("Playback rate must be positive");
    }
    return a;
}

CutAction CutAction::parse(const ActionParams& params) {
    CutAction a;
    a.time = params.require_number("time");
    if (a.time < 0.0) {
        throw ValidationError("Cut time must not be negative");
    }
    return a;
}

TrimAction TrimAction::parse(const ActionParams& params) {
    TrimAction a;
    a.start = params.number("start");
    a.end = params.number("end");
    if (!a.start && !a.end) {
        throw ValidationError("Trim needs 'start' or 'end'");
    }
    return a;
}

DeleteClipAction DeleteClipAction::parse(const ActionParams&) {
    return {};
}

ApplyEffectAction ApplyEffectAction::parse(const ActionParams& params) {
    ApplyEffectAction a;
    a.effect_id = params.require_text("effectId");
    a.parameters = params.numbers("parameters").value_or(NumberMap{});
    return a;
}

RemoveEffectAction RemoveEffectAction::parse(const ActionParams& params) {
    RemoveEffectAction a;
    a.applied_effect_id = params.require_text("appliedEffectId");
    return a;
}

UpdateEffectAction UpdateEffectAction::parse(const ActionParams& params) {
    UpdateEffectAction a;
    a.applied_effect_id = params.require_text("appliedEffectId");
    a.parameters = params.require_numbers("parameters");
    return a;
}

ToggleEffectAction ToggleEffectAction::parse(const ActionParams& params) {
    ToggleEffectAction a;
    a.applied_effect_id = params.require_text("appliedEffectId");
    a.enabled = params.require_flag("enabled");
    return a;
}

ApplyTransitionAction ApplyTransitionAction::parse(const ActionParams& params) {
    ApplyTransitionAction a;
    a.transition = params.require_text("transitionName");
    a.duration = params.number_or("duration", 1.0);
    a.apply_to_start = params.flag_or("applyToStart", true);
    if (!(a.duration > 0.0)) {
        throw ValidationError("Transition duration must be positive");
    }
    return a;
}

ModifyParameterAction ModifyParameterAction::parse(const ActionParams& params) {
    ModifyParameterAction a;
    if (auto list = params.edits("modifications")) {
        if (list->empty()) {
            throw ValidationError("Parameter 'modifications' must not be empty");
        }
        for (const auto& edit : *list) {
            if (edit.parameter.empty()) {
                throw ValidationError("Every modification needs a parameterName");
            }
            if (!std::isfinite(edit.value) || (edit.start_value && !std::isfinite(*edit.start_value))) {
                throw ValidationError("Modification of '" + edit.parameter + "' must use finite numbers");
            }
        }
        a.edits = std::move(*list);
    } else {
        ParameterEdit edit;
        edit.parameter = params.require_text("parameterName");
        edit.value = params.require_number("value");
        edit.component = params.text("componentName").value_or("");
        edit.start_value = params.number("startValue");
        a.edits.push_back(std::move(edit));
    }
    a.exclude_builtin = params.flag_or("excludeBuiltIn", true);
    a.animation = AnimationFields::parse(params);
    return a;
}

GetParametersAction GetParametersAction::parse(const ActionParams& params) {
    GetParametersAction a;
    a.include_builtin = !params.flag_or("excludeBuiltIn", false);
    return a;
}

AdjustVolumeAction AdjustVolumeAction::parse(const ActionParams& params) {
    AdjustVolumeAction a;
    a.volume_db = params.require_number("volumeDb");
    if (a.volume_db < -96.0 || a.volume_db > 24.0) {
        throw ValidationError("Volume must be between -96 dB and 24 dB");
    }
    return a;
}

} // namespace ek::commands
