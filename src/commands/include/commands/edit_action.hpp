#pragma once
#include "timeline/clip.hpp"
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace ek::commands {

using timeline::ClipId;
using timeline::Interpolation;
using NumberMap = std::map<std::string, double>;

// One entry of a batched parameter change
struct ParameterEdit {
    std::string parameter;
    std::string component;              // empty: search the clip's components
    double value = 0.0;
    std::optional<double> start_value;  // animated edits start here instead of the current value

    bool operator==(const ParameterEdit& other) const {
        return parameter == other.parameter && component == other.component && value == other.value &&
               start_value == other.start_value;
    }
};
using ParameterEdits = std::vector<ParameterEdit>;

/**
 * @brief One field of an edit action: number, flag, text, name->number map or edit list
 */
class ParamValue {
public:
    enum class Kind { Number, Flag, Text, Numbers, Edits };

    template<typename T, typename = std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>>>
    ParamValue(T number) : value_(static_cast<double>(number)) {}
    ParamValue(bool flag) : value_(flag) {}
    ParamValue(const char* text) : value_(std::string(text)) {}
    ParamValue(std::string text) : value_(std::move(text)) {}
    ParamValue(NumberMap numbers) : value_(std::move(numbers)) {}
    ParamValue(ParameterEdits edits) : value_(std::move(edits)) {}

    Kind kind() const { return static_cast<Kind>(value_.index()); }
    bool is_number() const { return kind() == Kind::Number; }
    bool is_flag() const { return kind() == Kind::Flag; }
    bool is_text() const { return kind() == Kind::Text; }
    bool is_numbers() const { return kind() == Kind::Numbers; }
    bool is_edits() const { return kind() == Kind::Edits; }

    // nullopt when the value has another kind
    std::optional<double> number() const;
    std::optional<bool> flag() const;
    std::optional<std::string> text() const;
    std::optional<NumberMap> numbers() const;
    std::optional<ParameterEdits> edits() const;

    bool operator==(const ParamValue& other) const { return value_ == other.value_; }
    bool operator!=(const ParamValue& other) const { return !(*this == other); }

private:
    std::variant<double, bool, std::string, NumberMap, ParameterEdits> value_;
};

const char* to_string(ParamValue::Kind kind) noexcept;

/**
 * @brief Named fields of an edit action
 *
 * Typed getters return std::nullopt for an absent key and throw
 * core::ValidationError for a key holding the wrong kind. require_* also
 * throws when the key is absent.
 */
class ActionParams {
public:
    ActionParams() = default;
    ActionParams(std::initializer_list<std::pair<const std::string, ParamValue>> init) : values_(init) {}

    ActionParams& set(const std::string& key, ParamValue value);
    void erase(const std::string& key) { values_.erase(key); }
    bool has(const std::string& key) const { return values_.count(key) > 0; }
    bool empty() const { return values_.empty(); }
    const std::map<std::string, ParamValue>& values() const { return values_; }

    std::optional<double> number(const std::string& key) const;
    std::optional<bool> flag(const std::string& key) const;
    std::optional<std::string> text(const std::string& key) const;
    std::optional<NumberMap> numbers(const std::string& key) const;
    std::optional<ParameterEdits> edits(const std::string& key) const;

    double require_number(const std::string& key) const;
    bool require_flag(const std::string& key) const;
    std::string require_text(const std::string& key) const;
    NumberMap require_numbers(const std::string& key) const;

    double number_or(const std::string& key, double fallback) const { return number(key).value_or(fallback); }
    bool flag_or(const std::string& key, bool fallback) const { return flag(key).value_or(fallback); }

    // "clipId": explicit target that overrides the caller's target list
    std::optional<ClipId> clip_id() const;
    // "interpolation": curve name; ValidationError for an unknown curve
    std::optional<Interpolation> interpolation() const;

    bool operator==(const ActionParams& other) const { return values_ == other.values_; }

private:
    std::map<std::string, ParamValue> values_;
    const ParamValue* find(const std::string& key) const;
};

// A structured edit as produced by the interpretation layer.
struct EditAction {
    std::string tag;
    ActionParams params;
    std::string message;   // free text for display, not interpreted
};

// Compact decimal rendering for descriptions ("150", "1.5", "-0.25")
std::string format_number(double value);

// ---- Typed views of the action tags ---------------------------------------
// parse() throws core::ValidationError on a missing or malformed field.

struct AnimationFields {
    bool animated = false;
    std::optional<Seconds> duration;
    Seconds start_time = 0.0;
    std::optional<Interpolation> interpolation;

    static AnimationFields parse(const ActionParams& params, bool animated_default = false);
};

struct ZoomAction {
    double scale = 100.0;
    std::optional<double> start_scale;
    AnimationFields animation;

    static std::vector<std::string> required() { return {"scale"}; }
    static ZoomAction parse(const ActionParams& params);
};

// zoomIn / zoomOut: both ends optional, animated unless told otherwise
struct ZoomRampAction {
    std::optional<double> start_scale;
    std::optional<double> end_scale;
    AnimationFields animation;

    static std::vector<std::string> required() { return {}; }
    static ZoomRampAction parse(const ActionParams& params);
};

struct PositionAction {
    double x = 0.0;
    double y = 0.0;
    AnimationFields animation;

    static std::vector<std::string> required() { return {"x", "y"}; }
    static PositionAction parse(const ActionParams& params);
};

struct OpacityAction {
    double value = 100.0;   // percent
    AnimationFields animation;

    static std::vector<std::string> required() { return {"value"}; }
    static OpacityAction parse(const ActionParams& params);
};

struct RotationAction {
    double degrees = 0.0;
    AnimationFields animation;

    static std::vector<std::string> required() { return {"degrees"}; }
    static RotationAction parse(const ActionParams& params);
};

struct FilterAction {
    std::string filter;     // blur, brightness, contrast, saturate, grayscale, sepia, hueRotate
    double value = 0.0;     // transform units
    AnimationFields animation;

    static std::vector<std::string> required() { return {"filter", "value"}; }
    static FilterAction parse(const ActionParams& params);
};

struct VolumeAction {
    double value = 1.0;     // 0..1

    static std::vector<std::string> required() { return {"value"}; }
    static VolumeAction parse(const ActionParams& params);
};

struct PlaybackRateAction {
    double value = 1.0;

    static std::vector<std::string> required() { return {"value"}; }
    static PlaybackRateAction parse(const ActionParams& params);
};

struct CutAction {
    Seconds time = 0.0;     // absolute timeline time

    static std::vector<std::string> required() { return {"time"}; }
    static CutAction parse(const ActionParams& params);
};

// At least one of start/end is required
struct TrimAction {
    std::optional<Seconds> start;   // new source in-point
    std::optional<Seconds> end;     // new source out-point

    static std::vector<std::string> required() { return {}; }
    static TrimAction parse(const ActionParams& params);
};

struct DeleteClipAction {
    static std::vector<std::string> required() { return {}; }
    static DeleteClipAction parse(const ActionParams& params);
};

struct ApplyEffectAction {
    std::string effect_id;
    NumberMap parameters;

    static std::vector<std::string> required() { return {"effectId"}; }
    static ApplyEffectAction parse(const ActionParams& params);
};

struct RemoveEffectAction {
    std::string applied_effect_id;

    static std::vector<std::string> required() { return {"appliedEffectId"}; }
    static RemoveEffectAction parse(const ActionParams& params);
};

struct UpdateEffectAction {
    std::string applied_effect_id;
    NumberMap parameters;

    static std::vector<std::string> required() { return {"appliedEffectId", "parameters"}; }
    static UpdateEffectAction parse(const ActionParams& params);
};

struct ToggleEffectAction {
    std::string applied_effect_id;
    bool enabled = true;

    static std::vector<std::string> required() { return {"appliedEffectId", "enabled"}; }
    static ToggleEffectAction parse(const ActionParams& params);
};

struct ApplyTransitionAction {
    std::string transition;        // cross_dissolve, fade_in, fade_out
    Seconds duration = 1.0;
    bool apply_to_start = true;

    static std::vector<std::string> required() { return {"transitionName"}; }
    static ApplyTransitionAction parse(const ActionParams& params);
};

// Either parameterName + value (+ componentName, startValue) or a
// `modifications` list; the list wins when both are present.
struct ModifyParameterAction {
    ParameterEdits edits;
    bool exclude_builtin = true;
    AnimationFields animation;

    static std::vector<std::string> required() { return {}; }
    static ModifyParameterAction parse(const ActionParams& params);
};

// Read-only: lists the components of each clip with their parameter values
struct GetParametersAction {
    bool include_builtin = true;

    static std::vector<std::string> required() { return {}; }
    static GetParametersAction parse(const ActionParams& params);
};

struct AdjustVolumeAction {
    double volume_db = 0.0;

    static std::vector<std::string> required() { return {"volumeDb"}; }
    static AdjustVolumeAction parse(const ActionParams& params);
};

} // namespace ek::commands
