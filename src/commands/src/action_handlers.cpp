#include "commands/action_handlers.hpp"
#include "commands/dispatcher.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "core/log_config.hpp"
#include "effects/transform_sync.hpp"
#include <algorithm>
#include <cctype>

namespace ek::commands {

using animation::ParameterChange;
using animation::ParameterTarget;
using core::ValidationError;

namespace {

const ParameterTarget kScale{"builtin-scale", "scale", true};
const ParameterTarget kPositionX{"builtin-position", "positionX", true};
const ParameterTarget kPositionY{"builtin-position", "positionY", true};
const ParameterTarget kOpacity{"builtin-opacity", "opacity", true};
const ParameterTarget kRotation{"builtin-rotation", "degrees", true};
const ParameterTarget kAudioGain{"audio_gain", "gain_db", false};

std::string clip_label(ClipId clip) {
    return "Clip " + std::to_string(clip);
}

// Resting value of a parameter as the host sees it; `fallback` when it cannot be read.
double current_value(host::HostSurface& host, ClipId clip, const ParameterTarget& target, double fallback) {
    auto ref = host.resolve_parameter(clip, target.component, target.parameter, target.include_builtin).get();
    if (ref.is_error()) return fallback;
    auto state = host.read_parameter(ref.value()).get();
    if (state.is_error()) return fallback;
    const auto& s = state.value();
    return s.keyframes.empty() ? s.static_value : s.keyframes.back().value;
}

ParameterChange make_change(const ParameterTarget& target, double from, double to,
                            const AnimationFields& animation, Interpolation fallback) {
    if (!animation.animated) {
        return ParameterChange::fixed(target, to);
    }
    auto change = ParameterChange::ramp(target, from, to, animation.duration,
                                        animation.interpolation.value_or(fallback));
    change.start_time = animation.start_time;
    return change;
}

std::optional<host::TransactionReceipt> commit(host::HostSurface& host, ClipId clip, const host::Transaction& tx) {
    auto receipt = host.run_transaction(tx).get();
    if (receipt.is_error()) {
        ek::log::warn(clip_label(clip) + ": " + tx.label() + " failed: " + receipt.message());
        return std::nullopt;
    }
    return std::move(receipt.value());
}

bool run_transaction(host::HostSurface& host, ClipId clip, const host::Transaction& tx) {
    return commit(host, clip, tx).has_value();
}

std::optional<host::ComponentInfo> find_component(host::HostSurface& host, ClipId clip,
                                                  const std::string& component_id) {
    auto components = host.list_components(clip).get();
    if (components.is_error()) {
        ek::log::warn(clip_label(clip) + ": " + components.message());
        return std::nullopt;
    }
    for (const auto& c : components.value()) {
        if (c.id == component_id) return c;
    }
    return std::nullopt;
}

void check_range(const effects::EffectRegistry& registry, const std::string& effect_id,
                 const std::string& parameter, double value, const std::string& what) {
    if (!registry.in_range(effect_id, parameter, value)) {
        throw ValidationError(what + " " + format_number(value) + " is out of range");
    }
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// ---- Transform fields -----------------------------------------------------

class ZoomHandler : public TypedActionHandler<ZoomAction> {
public:
    ZoomHandler() : TypedActionHandler("zoom") {}

protected:
    void check(const ZoomAction& a, const effects::EffectRegistry& registry) const override {
        check_range(registry, "scale", "scale", a.scale, "Scale");
        if (a.start_scale) check_range(registry, "scale", "scale", *a.start_scale, "Start scale");
    }

    bool apply_typed(ActionContext& ctx, ClipId clip, const ZoomAction& a) override {
        double from = a.start_scale ? *a.start_scale : current_value(ctx.host, clip, kScale, 100.0);
        return ctx.resolver.apply(clip, make_change(kScale, from, a.scale, a.animation, ctx.default_interpolation));
    }

    std::string describe_typed(const ZoomAction& a) const override {
        return std::string(a.animation.animated ? "Animate zoom to " : "Zoom to ") + format_number(a.scale) + "%";
    }

    UndoPlan undo_typed(const ActionContext&, ClipId, const ZoomAction&) const override {
        return {{kScale}, std::nullopt};
    }
};

// zoomIn / zoomOut with their stock end points
class ZoomRampHandler : public TypedActionHandler<ZoomRampAction> {
public:
    explicit ZoomRampHandler(bool zoom_in)
        : TypedActionHandler(zoom_in ? "zoomIn" : "zoomOut"), zoom_in_(zoom_in) {}

protected:
    void check(const ZoomRampAction& a, const effects::EffectRegistry& registry) const override {
        check_range(registry, "scale", "scale", from(a), "Start scale");
        check_range(registry, "scale", "scale", to(a), "End scale");
    }

    bool apply_typed(ActionContext& ctx, ClipId clip, const ZoomRampAction& a) override {
        return ctx.resolver.apply(clip, make_change(kScale, from(a), to(a), a.animation, ctx.default_interpolation));
    }

    std::string describe_typed(const ZoomRampAction& a) const override {
        return std::string(zoom_in_ ? "Zoom in to " : "Zoom out to ") + format_number(to(a)) + "%";
    }

    UndoPlan undo_typed(const ActionContext&, ClipId, const ZoomRampAction&) const override {
        return {{kScale}, std::nullopt};
    }

private:
    bool zoom_in_;

    double from(const ZoomRampAction& a) const { return a.start_scale.value_or(zoom_in_ ? 100.0 : 150.0); }
    double to(const ZoomRampAction& a) const { return a.end_scale.value_or(zoom_in_ ? 150.0 : 100.0); }
};

class PositionHandler : public TypedActionHandler<PositionAction> {
public:
    PositionHandler() : TypedActionHandler("position") {}

protected:
    void check(const PositionAction& a, const effects::EffectRegistry& registry) const override {
        check_range(registry, "position", "positionX", a.x, "Position x");
        check_range(registry, "position", "positionY", a.y, "Position y");
    }

    bool apply_typed(ActionContext& ctx, ClipId clip, const PositionAction& a) override {
        double x0 = current_value(ctx.host, clip, kPositionX, 0.0);
        double y0 = current_value(ctx.host, clip, kPositionY, 0.0);
        return ctx.resolver.apply_all(clip,
            {make_change(kPositionX, x0, a.x, a.animation, ctx.default_interpolation),
             make_change(kPositionY, y0, a.y, a.animation, ctx.default_interpolation)},
            "position");
    }

    std::string describe_typed(const PositionAction& a) const override {
        return "Move to (" + format_number(a.x) + ", " + format_number(a.y) + ")";
    }

    UndoPlan undo_typed(const ActionContext&, ClipId, const PositionAction&) const override {
        return {{kPositionX, kPositionY}, std::nullopt};
    }
};

class OpacityHandler : public TypedActionHandler<OpacityAction> {
public:
    OpacityHandler() : TypedActionHandler("opacity") {}

protected:
    bool apply_typed(ActionContext& ctx, ClipId clip, const OpacityAction& a) override {
        double from = current_value(ctx.host, clip, kOpacity, 100.0);
        return ctx.resolver.apply(clip, make_change(kOpacity, from, a.value, a.animation, ctx.default_interpolation));
    }

    std::string describe_typed(const OpacityAction& a) const override {
        return "Set opacity to " + format_number(a.value) + "%";
    }

    UndoPlan undo_typed(const ActionContext&, ClipId, const OpacityAction&) const override {
        return {{kOpacity}, std::nullopt};
    }
};

class RotationHandler : public TypedActionHandler<RotationAction> {
public:
    RotationHandler() : TypedActionHandler("rotation") {}

protected:
    void check(const RotationAction& a, const effects::EffectRegistry& registry) const override {
        check_range(registry, "rotation", "degrees", a.degrees, "Rotation");
    }

    bool apply_typed(ActionContext& ctx, ClipId clip, const RotationAction& a) override {
        double from = current_value(ctx.host, clip, kRotation, 0.0);
        return ctx.resolver.apply(clip, make_change(kRotation, from, a.degrees, a.animation,
                                                    ctx.default_interpolation));
    }

    std::string describe_typed(const RotationAction& a) const override {
        return "Rotate to " + format_number(a.degrees) + " degrees";
    }

    UndoPlan undo_typed(const ActionContext&, ClipId, const RotationAction&) const override {
        return {{kRotation}, std::nullopt};
    }
};

class FilterHandler : public TypedActionHandler<FilterAction> {
public:
    FilterHandler() : TypedActionHandler("filter") {}

protected:
    void check(const FilterAction& a, const effects::EffectRegistry& registry) const override {
        const effects::FieldBinding* field = nullptr;
        const effects::BuiltinBinding* binding = lookup(a.filter, &field);
        check_range(registry, binding->effect_id, field->parameter, field->to_param(a.value), a.filter);
    }

    bool apply_typed(ActionContext& ctx, ClipId clip, const FilterAction& a) override {
        const effects::FieldBinding* field = nullptr;
        const effects::BuiltinBinding* binding = lookup(a.filter, &field);
        ParameterTarget target{binding->applied_id, field->parameter, true};
        double from = current_value(ctx.host, clip, target, field->to_param(field->field_default));
        return ctx.resolver.apply(clip, make_change(target, from, field->to_param(a.value), a.animation,
                                                    ctx.default_interpolation));
    }

    std::string describe_typed(const FilterAction& a) const override {
        return "Set " + a.filter + " to " + format_number(a.value);
    }

    UndoPlan undo_typed(const ActionContext&, ClipId, const FilterAction& a) const override {
        const effects::FieldBinding* field = nullptr;
        const effects::BuiltinBinding* binding = lookup(a.filter, &field);
        return {{ParameterTarget{binding->applied_id, field->parameter, true}}, std::nullopt};
    }

private:
    static const effects::BuiltinBinding* lookup(const std::string& name, const effects::FieldBinding** field) {
        const effects::BuiltinBinding* binding = effects::binding_for_field(name, field);
        if (!binding || binding->transform_group || !*field) {
            throw ValidationError("Unknown filter '" + name + "'");
        }
        return binding;
    }
};

// ---- Project settings -----------------------------------------------------

class VolumeHandler : public TypedActionHandler<VolumeAction> {
public:
    VolumeHandler() : TypedActionHandler("volume", HandlerScope::Project) {}

protected:
    bool apply_typed(ActionContext& ctx, ClipId, const VolumeAction& a) override {
        ctx.timeline.set_volume(a.value);
        return true;
    }

    std::string describe_typed(const VolumeAction& a) const override {
        return "Set volume to " + format_number(a.value * 100.0) + "%";
    }
};

class PlaybackRateHandler : public TypedActionHandler<PlaybackRateAction> {
public:
    PlaybackRateHandler() : TypedActionHandler("playbackRate", HandlerScope::Project) {}

protected:
    bool apply_typed(ActionContext& ctx, ClipId, const PlaybackRateAction& a) override {
        return ctx.timeline.set_playback_rate(a.value);
    }

    std::string describe_typed(const PlaybackRateAction& a) const override {
        return "Set playback speed to " + format_number(a.value) + "x";
    }
};

// ---- Structure ------------------------------------------------------------

class CutHandler : public TypedActionHandler<CutAction> {
public:
    CutHandler() : TypedActionHandler("cut") {}

protected:
    bool apply_typed(ActionContext& ctx, ClipId clip, const CutAction& a) override {
        auto halves = ctx.timeline.split_clip(clip, a.time);
        if (!halves) {
            ek::log::warn(clip_label(clip) + ": cannot cut at " + format_timecode(a.time));
            return false;
        }
        EK_DISPATCH_LOG(clip_label(clip) + " split, second half is clip " + std::to_string(halves->second));
        return true;
    }

    std::string describe_typed(const CutAction& a) const override {
        return "Cut at " + format_number(a.time) + "s";
    }
};

class TrimHandler : public TypedActionHandler<TrimAction> {
public:
    TrimHandler() : TypedActionHandler("trim") {}

protected:
    bool apply_typed(ActionContext& ctx, ClipId clip, const TrimAction& a) override {
        if (!ctx.timeline.trim_clip(clip, a.start, a.end)) {
            ek::log::warn(clip_label(clip) + ": trim rejected");
            return false;
        }
        return true;
    }

    std::string describe_typed(const TrimAction& a) const override {
        if (a.start && a.end) {
            return "Trim to " + format_number(*a.start) + "s - " + format_number(*a.end) + "s";
        }
        return a.start ? "Trim start to " + format_number(*a.start) + "s"
                       : "Trim end to " + format_number(*a.end) + "s";
    }
};

class DeleteClipHandler : public TypedActionHandler<DeleteClipAction> {
public:
    DeleteClipHandler() : TypedActionHandler("deleteClip") {}

protected:
    bool apply_typed(ActionContext& ctx, ClipId clip, const DeleteClipAction&) override {
        if (!ctx.timeline.remove_clip(clip)) {
            ek::log::warn(clip_label(clip) + ": not found");
            return false;
        }
        return true;
    }

    std::string describe_typed(const DeleteClipAction&) const override { return "Delete clip"; }
};

// ---- Effects --------------------------------------------------------------

class ApplyEffectHandler : public TypedActionHandler<ApplyEffectAction> {
public:
    ApplyEffectHandler() : TypedActionHandler("applyEffect") {}

protected:
    void check(const ApplyEffectAction& a, const effects::EffectRegistry& registry) const override {
        const effects::EffectDescriptor* descriptor = registry.describe(a.effect_id);
        if (!descriptor) {
            throw ValidationError("Unknown effect '" + a.effect_id + "'");
        }
        for (const auto& [name, value] : a.parameters) {
            if (descriptor->find_parameter(name)) {
                check_range(registry, a.effect_id, name, value, a.effect_id + "." + name);
            }
        }
    }

    bool apply_typed(ActionContext& ctx, ClipId clip, const ApplyEffectAction& a) override {
        host::Transaction tx("apply " + a.effect_id);
        tx.append_component(clip, a.effect_id, a.parameters);
        auto receipt = commit(ctx.host, clip, tx);
        if (!receipt) return false;
        if (!receipt->changed) {
            ek::log::warn(clip_label(clip) + ": " + a.effect_id + " at these values leaves the clip unchanged");
            return false;
        }
        for (const auto& created : receipt->created) {
            ek::log::debug(clip_label(clip) + ": " + a.effect_id + " applied as " + created.component_id);
        }
        return true;
    }

    std::string describe_typed(const ApplyEffectAction& a) const override {
        return "Apply " + a.effect_id;
    }

    UndoPlan undo_typed(const ActionContext&, ClipId, const ApplyEffectAction& a) const override {
        UndoPlan plan;
        plan.presence_effect = a.effect_id;
        if (const auto* binding = effects::binding_for_effect(a.effect_id)) {
            for (const auto& field : binding->fields) {
                plan.parameters.push_back({binding->applied_id, field.parameter, true});
            }
        }
        return plan;
    }
};

class RemoveEffectHandler : public TypedActionHandler<RemoveEffectAction> {
public:
    RemoveEffectHandler() : TypedActionHandler("removeEffect") {}

protected:
    bool apply_typed(ActionContext& ctx, ClipId clip, const RemoveEffectAction& a) override {
        auto component = find_component(ctx.host, clip, a.applied_effect_id);
        if (!component) {
            ek::log::warn(clip_label(clip) + ": no effect " + a.applied_effect_id);
            return false;
        }
        host::Transaction tx("remove " + a.applied_effect_id);
        tx.remove_component({clip, component->id, component->effect_id});
        return run_transaction(ctx.host, clip, tx);
    }

    std::string describe_typed(const RemoveEffectAction& a) const override {
        return "Remove effect " + a.applied_effect_id;
    }
};

class UpdateEffectHandler : public TypedActionHandler<UpdateEffectAction> {
public:
    UpdateEffectHandler() : TypedActionHandler("updateEffect") {}

protected:
    void check(const UpdateEffectAction& a, const effects::EffectRegistry&) const override {
        if (a.parameters.empty()) {
            throw ValidationError("Parameter 'parameters' must not be empty");
        }
    }

    bool apply_typed(ActionContext& ctx, ClipId clip, const UpdateEffectAction& a) override {
        auto component = find_component(ctx.host, clip, a.applied_effect_id);
        if (!component) {
            ek::log::warn(clip_label(clip) + ": no effect " + a.applied_effect_id);
            return false;
        }
        std::vector<ParameterChange> changes;
        for (const auto& [name, value] : a.parameters) {
            if (!ctx.registry.in_range(component->effect_id, name, value)) {
                ek::log::warn(clip_label(clip) + ": " + component->effect_id + "." + name + " = " +
                              format_number(value) + " is out of range");
                return false;
            }
            changes.push_back(ParameterChange::fixed({a.applied_effect_id, name, true}, value));
        }
        return ctx.resolver.apply_all(clip, changes, "update " + a.applied_effect_id);
    }

    std::string describe_typed(const UpdateEffectAction& a) const override {
        return "Update effect " + a.applied_effect_id;
    }

    UndoPlan undo_typed(const ActionContext&, ClipId, const UpdateEffectAction& a) const override {
        UndoPlan plan;
        for (const auto& [name, value] : a.parameters) {
            plan.parameters.push_back({a.applied_effect_id, name, true});
        }
        return plan;
    }
};

class ToggleEffectHandler : public TypedActionHandler<ToggleEffectAction> {
public:
    ToggleEffectHandler() : TypedActionHandler("toggleEffect") {}

protected:
    bool apply_typed(ActionContext& ctx, ClipId clip, const ToggleEffectAction& a) override {
        auto component = find_component(ctx.host, clip, a.applied_effect_id);
        if (!component) {
            ek::log::warn(clip_label(clip) + ": no effect " + a.applied_effect_id);
            return false;
        }
        host::Transaction tx(std::string(a.enabled ? "enable " : "disable ") + a.applied_effect_id);
        tx.set_component_enabled({clip, component->id, component->effect_id}, a.enabled);
        return run_transaction(ctx.host, clip, tx);
    }

    std::string describe_typed(const ToggleEffectAction& a) const override {
        return std::string(a.enabled ? "Enable" : "Disable") + " effect " + a.applied_effect_id;
    }
};

class ApplyTransitionHandler : public TypedActionHandler<ApplyTransitionAction> {
public:
    ApplyTransitionHandler() : TypedActionHandler("applyTransition") {}

protected:
    void check(const ApplyTransitionAction& a, const effects::EffectRegistry& registry) const override {
        lookup(registry, a.transition);
    }

    bool apply_typed(ActionContext& ctx, ClipId clip, const ApplyTransitionAction& a) override {
        const effects::EffectDescriptor& descriptor = lookup(ctx.registry, a.transition);
        auto info = ctx.host.clip_info(clip).get();
        if (info.is_error()) {
            ek::log::warn(clip_label(clip) + ": " + info.message());
            return false;
        }
        Seconds length = info.value().duration;
        Seconds d = std::min(a.duration, length);
        if (const auto* p = descriptor.find_parameter("duration")) d = std::min(p->clamp(d), length);

        std::map<std::string, double> parameters{{"duration", d}};
        if (descriptor.id == "cross_dissolve") {
            parameters["offset"] = a.apply_to_start ? 0.0 : length - d;
        } else if (descriptor.id == "fade_out") {
            parameters["start"] = length - d;
        }

        host::Transaction tx("transition " + descriptor.id);
        tx.append_component(clip, descriptor.id, parameters);
        return run_transaction(ctx.host, clip, tx);
    }

    std::string describe_typed(const ApplyTransitionAction& a) const override {
        return "Add " + a.transition + " transition (" + format_number(a.duration) + "s)";
    }

    UndoPlan undo_typed(const ActionContext& ctx, ClipId, const ApplyTransitionAction& a) const override {
        return {{}, lookup(ctx.registry, a.transition).id};
    }

private:
    static const effects::EffectDescriptor& lookup(const effects::EffectRegistry& registry, const std::string& name) {
        const std::string wanted = lower(name);
        for (const auto* descriptor : registry.by_category(effects::Category::Transition)) {
            if (lower(descriptor->id) == wanted || lower(descriptor->name) == wanted) return *descriptor;
        }
        throw ValidationError("Unknown transition '" + name + "'");
    }
};

class ModifyParameterHandler : public TypedActionHandler<ModifyParameterAction> {
public:
    ModifyParameterHandler() : TypedActionHandler("modifyParameter") {}

protected:
    // Every edit goes out in one transaction: the clip gets all of them or none
    bool apply_typed(ActionContext& ctx, ClipId clip, const ModifyParameterAction& a) override {
        std::vector<ParameterChange> changes;
        changes.reserve(a.edits.size());
        for (const auto& edit : a.edits) {
            ParameterTarget target = target_of(a, edit);
            double from = edit.start_value ? *edit.start_value : current_value(ctx.host, clip, target, edit.value);
            changes.push_back(make_change(target, from, edit.value, a.animation, ctx.default_interpolation));
        }
        return ctx.resolver.apply_all(clip, changes, "modify parameters");
    }

    std::string describe_typed(const ModifyParameterAction& a) const override {
        std::string text = a.animation.animated ? "Animate " : "Set ";
        for (size_t i = 0; i < a.edits.size(); ++i) {
            const auto& edit = a.edits[i];
            if (i > 0) text += ", ";
            text += (edit.component.empty() ? edit.parameter : edit.component + "." + edit.parameter) + " to " +
                    format_number(edit.value);
        }
        return text;
    }

    UndoPlan undo_typed(const ActionContext&, ClipId, const ModifyParameterAction& a) const override {
        UndoPlan plan;
        for (const auto& edit : a.edits) plan.parameters.push_back(target_of(a, edit));
        return plan;
    }

private:
    static ParameterTarget target_of(const ModifyParameterAction& a, const ParameterEdit& edit) {
        return {edit.component, edit.parameter, !a.exclude_builtin};
    }
};

class AdjustVolumeHandler : public TypedActionHandler<AdjustVolumeAction> {
public:
    AdjustVolumeHandler() : TypedActionHandler("adjustVolume") {}

protected:
    bool apply_typed(ActionContext& ctx, ClipId clip, const AdjustVolumeAction& a) override {
        auto info = ctx.host.clip_info(clip).get();
        if (info.is_error()) {
            ek::log::warn(clip_label(clip) + ": " + info.message());
            return false;
        }
        if (info.value().type != timeline::MediaType::Audio) {
            ek::log::warn(clip_label(clip) + ": volume applies to audio clips only");
            return false;
        }
        auto ref = ctx.host.resolve_parameter(clip, kAudioGain.component, kAudioGain.parameter, false).get();
        if (ref.is_ok()) {
            return ctx.resolver.apply(clip, ParameterChange::fixed(kAudioGain, a.volume_db));
        }
        host::Transaction tx("volume");
        tx.append_component(clip, kAudioGain.component, {{kAudioGain.parameter, a.volume_db}});
        return run_transaction(ctx.host, clip, tx);
    }

    std::string describe_typed(const AdjustVolumeAction& a) const override {
        return "Set clip volume to " + format_number(a.volume_db) + " dB";
    }

    UndoPlan undo_typed(const ActionContext&, ClipId, const AdjustVolumeAction&) const override {
        return {{kAudioGain}, kAudioGain.component};
    }
};

class GetParametersHandler : public TypedActionHandler<GetParametersAction> {
public:
    GetParametersHandler() : TypedActionHandler("getParameters") {}

    bool read_only() const override { return true; }

protected:
    bool apply_typed(ActionContext& ctx, ClipId clip, const GetParametersAction& a) override {
        auto components = ctx.host.list_components(clip).get();
        if (components.is_error()) {
            ek::log::warn(clip_label(clip) + ": " + components.message());
            return false;
        }
        ClipParameters reading;
        reading.clip = clip;
        for (auto& component : components.value()) {
            if (component.builtin && !a.include_builtin) continue;
            reading.components.push_back(std::move(component));
        }
        ctx.readings.push_back(std::move(reading));
        return true;
    }

    std::string describe_typed(const GetParametersAction&) const override {
        return "Read parameters";
    }
};

} // namespace

void register_builtin_handlers(Dispatcher& dispatcher) {
    dispatcher.register_handler(std::make_unique<ZoomHandler>());
    dispatcher.register_handler(std::make_unique<ZoomRampHandler>(true));
    dispatcher.register_handler(std::make_unique<ZoomRampHandler>(false));
    dispatcher.register_handler(std::make_unique<PositionHandler>());
    dispatcher.register_handler(std::make_unique<OpacityHandler>());
    dispatcher.register_handler(std::make_unique<RotationHandler>());
    dispatcher.register_handler(std::make_unique<FilterHandler>());
    dispatcher.register_handler(std::make_unique<VolumeHandler>());
    dispatcher.register_handler(std::make_unique<PlaybackRateHandler>());
    dispatcher.register_handler(std::make_unique<CutHandler>());
    dispatcher.register_handler(std::make_unique<TrimHandler>());
    dispatcher.register_handler(std::make_unique<DeleteClipHandler>());
    dispatcher.register_handler(std::make_unique<ApplyEffectHandler>());
    dispatcher.register_handler(std::make_unique<RemoveEffectHandler>());
    dispatcher.register_handler(std::make_unique<UpdateEffectHandler>());
    dispatcher.register_handler(std::make_unique<ToggleEffectHandler>());
    dispatcher.register_handler(std::make_unique<ApplyTransitionHandler>());
    dispatcher.register_handler(std::make_unique<ModifyParameterHandler>());
    dispatcher.register_handler(std::make_unique<AdjustVolumeHandler>());
    dispatcher.register_handler(std::make_unique<GetParametersHandler>());
}

} // namespace ek::commands
