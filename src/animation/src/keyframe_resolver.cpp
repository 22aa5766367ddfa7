#include "animation/keyframe_resolver.hpp"
#include "core/log.hpp"
#include <cmath>

namespace ek::animation {

using core::ErrorCode;

ParameterChange ParameterChange::fixed(ParameterTarget target, double value) {
    ParameterChange c;
    c.target = std::move(target);
    c.start_value = value;
    c.end_value = value;
    c.animated = false;
    return c;
}

ParameterChange ParameterChange::ramp(ParameterTarget target, double from, double to,
                                      std::optional<Seconds> duration, Interpolation interp) {
    ParameterChange c;
    c.target = std::move(target);
    c.start_value = from;
    c.end_value = to;
    c.animated = true;
    c.duration = duration;
    c.interpolation = interp;
    return c;
}

KeyframeResolver::KeyframeResolver(host::HostSurface& host) : host_(host) {}

bool KeyframeResolver::apply(ClipId clip, const ParameterChange& change) {
    return apply_all(clip, {change}, change.target.component + "." + change.target.parameter);
}

bool KeyframeResolver::apply_all(ClipId clip, const std::vector<ParameterChange>& changes,
                                 const std::string& label) {
    auto tx = plan(clip, changes, label);
    if (tx.is_error()) {
        ek::log::warn("Clip " + std::to_string(clip) + ": " + tx.message());
        return false;
    }
    auto receipt = host_.run_transaction(tx.value()).get();
    if (receipt.is_error()) {
        ek::log::warn("Clip " + std::to_string(clip) + ": " + label + " failed: " + receipt.message());
        return false;
    }
    return true;
}

core::Result<host::Transaction> KeyframeResolver::plan(ClipId clip, const std::vector<ParameterChange>& changes,
                                                       const std::string& label) {
    auto info = host_.clip_info(clip).get();
    if (info.is_error()) {
        return info.error();
    }
    host::Transaction tx(label);
    for (const auto& change : changes) {
        auto r = plan_change(clip, info.value(), change, tx);
        if (r.is_error()) return r.error();
    }
    return tx;
}

core::VoidResult KeyframeResolver::plan_change(ClipId clip, const host::ClipInfo& info,
                                               const ParameterChange& change, host::Transaction& tx) {
    const auto& target = change.target;
    auto ref = host_.resolve_parameter(clip, target.component, target.parameter, target.include_builtin).get();
    if (ref.is_error()) {
        return core::Fail(ErrorCode::NotFound, ref.message());
    }
    const host::ParamRef& param = ref.value();

    if (!change.animated) {
        auto state = host_.read_parameter(param).get();
        if (state.is_error()) {
            return core::Fail(ErrorCode::HostOperation, state.message());
        }
        if (state.value().time_varying()) {
            tx.clear_keyframes(param).set_time_varying(param, false);
        }
        tx.set_static_value(param, change.end_value);
        ek::log::debug("Clip " + std::to_string(clip) + ": " + target.parameter + " = " +
                       std::to_string(change.end_value));
        return core::Ok();
    }

    if (change.start_time < 0.0 || change.start_time >= info.duration) {
        return core::Fail(ErrorCode::Validation, "Start time " + format_timecode(change.start_time) +
                                                 " is outside the clip");
    }
    Seconds duration = change.duration.value_or(info.duration - change.start_time);
    if (!(duration > 0.0) || !std::isfinite(duration)) {
        return core::Fail(ErrorCode::Validation, "Animation duration must be positive");
    }

    Seconds t0 = info.start + change.start_time;
    Seconds t1 = t0 + duration;
    auto k0 = host_.create_keyframe(change.start_value, t0, change.interpolation).get();
    if (k0.is_error()) return core::Fail(ErrorCode::HostOperation, k0.message());
    auto k1 = host_.create_keyframe(change.end_value, t1, change.interpolation).get();
    if (k1.is_error()) return core::Fail(ErrorCode::HostOperation, k1.message());

    tx.set_time_varying(param, true)
      .add_keyframe(param, k0.value())
      .add_keyframe(param, k1.value())
      .set_interpolation(param, t0, change.interpolation)
      .set_interpolation(param, t1, change.interpolation);

    ek::log::debug("Clip " + std::to_string(clip) + ": " + target.parameter + " " +
                   std::to_string(change.start_value) + " -> " + std::to_string(change.end_value) +
                   " over [" + format_timecode(t0) + ", " + format_timecode(t1) + "] " +
                   timeline::to_string(change.interpolation));
    return core::Ok();
}

} // namespace ek::animation
