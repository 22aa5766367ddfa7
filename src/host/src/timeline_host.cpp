#include "host/timeline_host.hpp"
#include "effects/transform_sync.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <cmath>

namespace ek::host {

using core::ErrorCode;
using timeline::AppliedEffect;
using timeline::Clip;

namespace {

ClipId step_clip(const HostOp& step) {
    if (auto* s = std::get_if<op::SetTimeVarying>(&step)) return s->param.clip();
    if (auto* s = std::get_if<op::AddKeyframe>(&step)) return s->param.clip();
    if (auto* s = std::get_if<op::SetInterpolation>(&step)) return s->param.clip();
    if (auto* s = std::get_if<op::ClearKeyframes>(&step)) return s->param.clip();
    if (auto* s = std::get_if<op::SetStaticValue>(&step)) return s->param.clip();
    if (auto* s = std::get_if<op::AppendComponent>(&step)) return s->clip;
    if (auto* s = std::get_if<op::RemoveComponent>(&step)) return s->component.clip;
    if (auto* s = std::get_if<op::SetComponentEnabled>(&step)) return s->component.clip;
    return 0;
}

bool binding_has_field(const effects::BuiltinBinding& binding, const std::string& parameter) {
    return std::any_of(binding.fields.begin(), binding.fields.end(),
                       [&](const effects::FieldBinding& f) { return parameter == f.parameter; });
}

} // namespace

TimelineHost::TimelineHost(timeline::Timeline& timeline, const effects::EffectRegistry& registry)
    : timeline_(timeline), registry_(registry) {
}

std::future<core::Result<ClipInfo>> TimelineHost::clip_info(ClipId clip) {
    const Clip* c = timeline_.find_clip(clip);
    if (!c) {
        return make_ready_future(core::Fail<ClipInfo>(ErrorCode::NotFound, "Clip " + std::to_string(clip) + " not found"));
    }
    ClipInfo info;
    info.id = c->id;
    info.type = c->type;
    info.start = c->timeline_start;
    info.duration = c->duration();
    return make_ready_future(core::Result<ClipInfo>(info));
}

std::future<core::Result<ParamRef>> TimelineHost::resolve_parameter(ClipId clip, const std::string& component,
                                                                    const std::string& parameter,
                                                                    bool include_builtin) {
    return make_ready_future(resolve(clip, component, parameter, include_builtin));
}

std::future<core::Result<ParameterState>> TimelineHost::read_parameter(const ParamRef& param) {
    return make_ready_future(read(param));
}

std::future<core::Result<std::vector<ComponentInfo>>> TimelineHost::list_components(ClipId clip) {
    const Clip* c = timeline_.find_clip(clip);
    if (!c) {
        return make_ready_future(core::Fail<std::vector<ComponentInfo>>(
            ErrorCode::NotFound, "Clip " + std::to_string(clip) + " not found"));
    }
    std::vector<ComponentInfo> out;
    out.reserve(c->effects.size());
    for (const auto& e : c->effects) {
        out.push_back(ComponentInfo{e.id, e.effect_id, e.enabled, e.is_builtin(), e.parameters});
    }
    return make_ready_future(core::Result<std::vector<ComponentInfo>>(std::move(out)));
}

std::future<core::Result<KeyframeSpec>> TimelineHost::create_keyframe(double value, Seconds time,
                                                                      Interpolation interp) {
    if (!std::isfinite(value) || !std::isfinite(time) || time < 0.0) {
        return make_ready_future(core::Fail<KeyframeSpec>(ErrorCode::HostOperation, "Invalid keyframe"));
    }
    return make_ready_future(core::Result<KeyframeSpec>(KeyframeSpec{time, value, interp}));
}

std::future<core::Result<TransactionReceipt>> TimelineHost::run_transaction(const Transaction& tx) {
    return make_ready_future(apply(tx));
}

bool TimelineHost::has_parameter(const AppliedEffect& entry, const std::string& parameter) const {
    if (entry.is_builtin()) {
        if (const auto* binding = effects::binding_for_applied_id(entry.id)) {
            return binding_has_field(*binding, parameter);
        }
    }
    if (const auto* d = registry_.describe(entry.effect_id)) {
        return d->find_parameter(parameter) != nullptr;
    }
    return entry.parameters.count(parameter) > 0;
}

double TimelineHost::default_for(const std::string& component_id, const std::string& effect_id,
                                 const std::string& parameter) const {
    if (const auto* binding = effects::binding_for_applied_id(component_id)) {
        for (const auto& f : binding->fields) {
            if (parameter == f.parameter) return f.to_param(f.field_default);
        }
    }
    if (const auto* d = registry_.describe(effect_id)) {
        if (const auto* p = d->find_parameter(parameter)) return p->default_value;
    }
    return 0.0;
}

core::Result<ParamRef> TimelineHost::resolve(ClipId clip, const std::string& component,
                                             const std::string& parameter, bool include_builtin) const {
    const Clip* c = timeline_.find_clip(clip);
    if (!c) {
        return core::Fail<ParamRef>(ErrorCode::NotFound, "Clip " + std::to_string(clip) + " not found");
    }
    auto found = [&](const std::string& id, const std::string& effect_id) {
        return core::Result<ParamRef>(ParamRef{ComponentRef{clip, id, effect_id}, parameter});
    };

    if (!component.empty()) {
        // 1. applied id
        if (const auto* entry = c->find_effect(component)) {
            if (has_parameter(*entry, parameter)) return found(entry->id, entry->effect_id);
            return core::Fail<ParamRef>(ErrorCode::NotFound,
                "Component '" + component + "' has no parameter '" + parameter + "'");
        }
        // 2. reserved entry, by its id or by effect id; materialized on first write
        const auto* binding = effects::binding_for_applied_id(component);
        if (!binding) binding = effects::binding_for_effect(component);
        if (binding && c->is_visual() && binding_has_field(*binding, parameter)) {
            if (include_builtin || component == binding->applied_id) {
                return found(binding->applied_id, binding->effect_id);
            }
        }
        // 3. first applied instance of that effect
        for (const auto& e : c->effects) {
            if (e.is_builtin() || e.effect_id != component) continue;
            if (has_parameter(e, parameter)) return found(e.id, e.effect_id);
        }
        return core::Fail<ParamRef>(ErrorCode::NotFound,
            "Parameter '" + parameter + "' not found on component '" + component + "'");
    }

    for (const auto& e : c->effects) {
        if (e.is_builtin() && !include_builtin) continue;
        if (has_parameter(e, parameter)) return found(e.id, e.effect_id);
    }
    if (include_builtin && c->is_visual()) {
        for (const auto& binding : effects::builtin_bindings()) {
            if (binding_has_field(binding, parameter)) return found(binding.applied_id, binding.effect_id);
        }
    }
    return core::Fail<ParamRef>(ErrorCode::NotFound, "Parameter '" + parameter + "' not found on clip " +
                                                     std::to_string(clip));
}

core::Result<ParameterState> TimelineHost::read(const ParamRef& param) const {
    const Clip* c = timeline_.find_clip(param.clip());
    if (!c) {
        return core::Fail<ParameterState>(ErrorCode::NotFound, "Clip " + std::to_string(param.clip()) + " not found");
    }
    const auto& id = param.component.component_id;
    double fallback = default_for(id, param.component.effect_id, param.parameter);

    ParameterState state;
    if (const auto* entry = c->find_effect(id)) {
        state.keyframes = entry->keyframes_for(param.parameter);
        state.static_value = entry->static_value(param.parameter, fallback);
        return state;
    }
    if (effects::binding_for_applied_id(id) && c->is_visual()) {
        // Reserved entry not materialized: parameter sits at its default
        state.static_value = fallback;
        return state;
    }
    return core::Fail<ParameterState>(ErrorCode::NotFound, "Component '" + id + "' not found");
}

AppliedEffect* TimelineHost::entry_for(Clip& clip, const ComponentRef& ref, bool create) {
    if (auto* entry = clip.find_effect(ref.component_id)) return entry;
    if (!create || !clip.is_visual()) return nullptr;
    if (const auto* binding = effects::binding_for_applied_id(ref.component_id)) {
        return &effects::upsert_builtin(clip.effects, *binding);
    }
    return nullptr;
}

core::Result<TransactionReceipt> TimelineHost::apply(const Transaction& tx) {
    TransactionReceipt receipt;
    if (tx.empty()) {
        receipt.changed = false;
        return receipt;
    }

    ClipId clip_id = step_clip(tx.steps().front());
    Clip* clip = timeline_.find_clip(clip_id);
    if (!clip) {
        return core::Fail<TransactionReceipt>(ErrorCode::NotFound, "Clip " + std::to_string(clip_id) + " not found");
    }

    Clip working = *clip;
    for (const auto& step : tx.steps()) {
        if (step_clip(step) != clip_id) {
            return core::Fail<TransactionReceipt>(ErrorCode::HostOperation,
                "Transaction '" + tx.label() + "' spans more than one clip");
        }
        auto r = apply_step(working, step, receipt);
        if (r.is_error()) {
            ek::log::warn("Transaction '" + tx.label() + "' rejected at " + op_name(step) + ": " + r.message());
            return core::Fail<TransactionReceipt>(ErrorCode::HostOperation, r.message());
        }
        ++receipt.steps_applied;
    }

    effects::normalize(working);
    // A built-in entry appended at its defaults is dropped again by normalize
    receipt.created.erase(std::remove_if(receipt.created.begin(), receipt.created.end(),
                                         [&](const ComponentRef& ref) { return !working.find_effect(ref.component_id); }),
                          receipt.created.end());
    receipt.changed = working.effects != clip->effects || working.transform != clip->transform;
    if (!receipt.changed) {
        ek::log::debug("Transaction '" + tx.label() + "' left clip " + std::to_string(clip_id) + " unchanged");
        return receipt;
    }

    clip->effects = std::move(working.effects);
    clip->transform = working.transform;
    timeline_.mark_modified();
    ek::log::debug("Committed transaction '" + tx.label() + "' (" + std::to_string(receipt.steps_applied) +
                   " steps) on clip " + std::to_string(clip_id));
    return receipt;
}

core::VoidResult TimelineHost::apply_step(Clip& working, const HostOp& step, TransactionReceipt& receipt) {
    auto missing = [](const ComponentRef& ref) {
        return core::Fail(ErrorCode::NotFound, "Component '" + ref.component_id + "' not found");
    };

    if (auto* s = std::get_if<op::SetTimeVarying>(&step)) {
        auto* entry = entry_for(working, s->param.component, true);
        if (!entry) return missing(s->param.component);
        if (!s->enabled) entry->clear_keyframes(s->param.parameter);
        return core::Ok();
    }
    if (auto* s = std::get_if<op::AddKeyframe>(&step)) {
        auto* entry = entry_for(working, s->param.component, true);
        if (!entry) return missing(s->param.component);
        if (s->keyframe.time < 0.0) return core::Fail(ErrorCode::HostOperation, "Keyframe before project origin");
        const auto& p = s->param.parameter;
        if (entry->parameters.find(p) == entry->parameters.end()) {
            entry->parameters[p] = default_for(entry->id, entry->effect_id, p);
        }
        entry->insert_keyframe(timeline::Keyframe{p, s->keyframe.time, s->keyframe.value, s->keyframe.interpolation});
        return core::Ok();
    }
    if (auto* s = std::get_if<op::SetInterpolation>(&step)) {
        auto* entry = entry_for(working, s->param.component, false);
        if (!entry) return missing(s->param.component);
        if (!entry->set_interpolation(s->param.parameter, s->time, s->interpolation)) {
            return core::Fail(ErrorCode::HostOperation, "No keyframe for '" + s->param.parameter + "' at " +
                                                        format_timecode(s->time));
        }
        return core::Ok();
    }
    if (auto* s = std::get_if<op::ClearKeyframes>(&step)) {
        auto* entry = entry_for(working, s->param.component, true);
        if (!entry) return missing(s->param.component);
        entry->clear_keyframes(s->param.parameter);
        return core::Ok();
    }
    if (auto* s = std::get_if<op::SetStaticValue>(&step)) {
        if (!std::isfinite(s->value)) return core::Fail(ErrorCode::HostOperation, "Non-finite value");
        auto* entry = entry_for(working, s->param.component, true);
        if (!entry) return missing(s->param.component);
        entry->parameters[s->param.parameter] = s->value;
        return core::Ok();
    }
    if (auto* s = std::get_if<op::AppendComponent>(&step)) {
        return append_component(working, *s, receipt);
    }
    if (auto* s = std::get_if<op::RemoveComponent>(&step)) {
        auto it = std::find_if(working.effects.begin(), working.effects.end(),
                               [&](const AppliedEffect& e) { return e.id == s->component.component_id; });
        if (it == working.effects.end()) return missing(s->component);
        working.effects.erase(it);
        return core::Ok();
    }
    if (auto* s = std::get_if<op::SetComponentEnabled>(&step)) {
        auto* entry = entry_for(working, s->component, false);
        if (!entry) return missing(s->component);
        entry->enabled = s->enabled;
        return core::Ok();
    }
    return core::Fail(ErrorCode::HostOperation, "Unsupported step");
}

core::VoidResult TimelineHost::append_component(Clip& working, const op::AppendComponent& step,
                                                TransactionReceipt& receipt) {
    const auto* descriptor = registry_.describe(step.effect_id);
    if (!descriptor) {
        return core::Fail(ErrorCode::NotFound, "Unknown effect: " + step.effect_id);
    }
    bool audio_effect = descriptor->category == effects::Category::Audio;
    if (audio_effect == working.is_visual()) {
        return core::Fail(ErrorCode::HostOperation, descriptor->name + " cannot be applied to a " +
                                                    timeline::to_string(working.type) + " clip");
    }

    // Effects mirrored by the transform merge into their reserved entry
    if (const auto* binding = effects::binding_for_effect(step.effect_id)) {
        AppliedEffect& entry = effects::upsert_builtin(working.effects, *binding);
        entry.enabled = true;
        for (const auto& f : binding->fields) {
            auto it = step.parameters.find(f.parameter);
            if (it != step.parameters.end()) {
                entry.parameters[f.parameter] = it->second;
            } else if (const auto* p = descriptor->find_parameter(f.parameter)) {
                entry.parameters[f.parameter] = p->default_value;
            }
        }
        receipt.created.push_back(ComponentRef{working.id, entry.id, entry.effect_id});
        return core::Ok();
    }

    AppliedEffect entry;
    entry.id = timeline_.generate_effect_id();
    entry.effect_id = step.effect_id;
    entry.parameters = *registry_.resolve_parameters(step.effect_id, step.parameters);
    working.effects.push_back(entry);
    receipt.created.push_back(ComponentRef{working.id, entry.id, entry.effect_id});
    return core::Ok();
}

} // namespace ek::host
