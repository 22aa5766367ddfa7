#include "animation/state_capture.hpp"
#include "core/log.hpp"

namespace ek::animation {

using core::ErrorCode;

bool CapturedPresence::contains(const std::string& component_id) const {
    for (const auto& c : components) {
        if (c.id == component_id) return true;
    }
    return false;
}

StateCapture::StateCapture(host::HostSurface& host) : host_(host) {}

core::Result<CapturedParameter> StateCapture::capture_parameter(ClipId clip, const ParameterTarget& target) {
    auto ref = host_.resolve_parameter(clip, target.component, target.parameter, target.include_builtin).get();
    if (ref.is_error()) return ref.error();

    auto state = host_.read_parameter(ref.value()).get();
    if (state.is_error()) return state.error();

    CapturedParameter captured;
    captured.clip = clip;
    captured.target = target;
    captured.ref = ref.value();
    captured.keyframes = state.value().keyframes;
    captured.static_value = state.value().static_value;
    return captured;
}

core::Result<CapturedPresence> StateCapture::capture_presence(ClipId clip, const std::string& effect_id) {
    auto components = host_.list_components(clip).get();
    if (components.is_error()) return components.error();

    CapturedPresence captured;
    captured.clip = clip;
    captured.effect_id = effect_id;
    for (const auto& c : components.value()) {
        if (c.effect_id == effect_id) captured.components.push_back(c);
    }
    return captured;
}

ClipCapture StateCapture::capture(ClipId clip, const std::vector<ParameterTarget>& targets,
                                  const std::optional<std::string>& presence_effect) {
    ClipCapture out;
    out.clip = clip;
    for (const auto& target : targets) {
        auto captured = capture_parameter(clip, target);
        if (captured.is_error()) {
            ek::log::debug("Clip " + std::to_string(clip) + ": nothing captured for " + target.parameter +
                           " (" + captured.message() + ")");
            continue;
        }
        out.parameters.push_back(std::move(captured.value()));
    }
    if (presence_effect) {
        auto presence = capture_presence(clip, *presence_effect);
        if (presence.is_ok()) {
            out.presence = std::move(presence.value());
        } else {
            ek::log::debug("Clip " + std::to_string(clip) + ": " + presence.message());
        }
    }
    return out;
}

void StateCapture::append_restore(host::Transaction& tx, const CapturedParameter& captured) {
    const auto& ref = captured.ref;
    tx.clear_keyframes(ref).set_static_value(ref, captured.static_value);
    if (captured.was_static()) {
        tx.set_time_varying(ref, false);
        return;
    }
    tx.set_time_varying(ref, true);
    for (const auto& k : captured.keyframes) {
        tx.add_keyframe(ref, host::KeyframeSpec{k.time, k.value, k.interpolation});
    }
    for (const auto& k : captured.keyframes) {
        tx.set_interpolation(ref, k.time, k.interpolation);
    }
}

core::VoidResult StateCapture::revert_presence(const CapturedPresence& before) {
    auto components = host_.list_components(before.clip).get();
    if (components.is_error()) {
        return core::Fail(ErrorCode::UndoUnavailable, components.message());
    }

    host::Transaction tx("revert " + before.effect_id);
    for (const auto& c : components.value()) {
        if (c.effect_id != before.effect_id || before.contains(c.id)) continue;
        tx.remove_component(host::ComponentRef{before.clip, c.id, c.effect_id});
    }
    if (tx.empty()) return core::Ok();

    auto receipt = host_.run_transaction(tx).get();
    if (receipt.is_error()) return receipt.error();
    return core::Ok();
}

core::VoidResult StateCapture::reapply_presence(const CapturedPresence& before, const CapturedPresence& after) {
    auto components = host_.list_components(after.clip).get();
    if (components.is_error()) {
        return core::Fail(ErrorCode::UndoUnavailable, components.message());
    }
    auto present = [&](const std::string& id) {
        for (const auto& c : components.value()) {
            if (c.id == id) return true;
        }
        return false;
    };

    host::Transaction tx("reapply " + after.effect_id);
    for (const auto& c : after.components) {
        if (before.contains(c.id) || present(c.id)) continue;
        tx.append_component(after.clip, c.effect_id, c.parameters);
    }
    if (tx.empty()) return core::Ok();

    auto receipt = host_.run_transaction(tx).get();
    if (receipt.is_error()) return receipt.error();
    return core::Ok();
}

core::VoidResult StateCapture::restore(const ClipCapture& capture) {
    if (capture.presence) {
        auto r = revert_presence(*capture.presence);
        if (r.is_error()) return r;
    }
    if (capture.parameters.empty()) return core::Ok();

    host::Transaction tx("restore clip " + std::to_string(capture.clip));
    for (const auto& p : capture.parameters) {
        append_restore(tx, p);
    }
    auto receipt = host_.run_transaction(tx).get();
    if (receipt.is_error()) return receipt.error();
    return core::Ok();
}

core::VoidResult StateCapture::replay(const ClipCapture& before, const ClipCapture& after) {
    if (before.presence && after.presence) {
        auto r = reapply_presence(*before.presence, *after.presence);
        if (r.is_error()) return r;
    }
    if (after.parameters.empty()) return core::Ok();

    host::Transaction tx("replay clip " + std::to_string(after.clip));
    for (const auto& p : after.parameters) {
        append_restore(tx, p);
    }
    auto receipt = host_.run_transaction(tx).get();
    if (receipt.is_error()) return receipt.error();
    return core::Ok();
}

} // namespace ek::animation
