#include "host/host_surface.hpp"

namespace ek::host {

namespace {
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
} // namespace

const char* op_name(const HostOp& step) noexcept {
    return std::visit(overloaded{
        [](const op::SetTimeVarying&) { return "set_time_varying"; },
        [](const op::AddKeyframe&) { return "add_keyframe"; },
        [](const op::SetInterpolation&) { return "set_interpolation"; },
        [](const op::ClearKeyframes&) { return "clear_keyframes"; },
        [](const op::SetStaticValue&) { return "set_static_value"; },
        [](const op::AppendComponent&) { return "append_component"; },
        [](const op::RemoveComponent&) { return "remove_component"; },
        [](const op::SetComponentEnabled&) { return "set_component_enabled"; },
    }, step);
}

Transaction& Transaction::set_time_varying(const ParamRef& param, bool enabled) {
    steps_.emplace_back(op::SetTimeVarying{param, enabled});
    return *this;
}

Transaction& Transaction::add_keyframe(const ParamRef& param, const KeyframeSpec& keyframe) {
    steps_.emplace_back(op::AddKeyframe{param, keyframe});
    return *this;
}

Transaction& Transaction::set_interpolation(const ParamRef& param, Seconds time, Interpolation interp) {
    steps_.emplace_back(op::SetInterpolation{param, time, interp});
    return *this;
}

Transaction& Transaction::clear_keyframes(const ParamRef& param) {
    steps_.emplace_back(op::ClearKeyframes{param});
    return *this;
}

Transaction& Transaction::set_static_value(const ParamRef& param, double value) {
    steps_.emplace_back(op::SetStaticValue{param, value});
    return *this;
}

Transaction& Transaction::append_component(ClipId clip, const std::string& effect_id,
                                           const std::map<std::string, double>& parameters) {
    steps_.emplace_back(op::AppendComponent{clip, effect_id, parameters});
    return *this;
}

Transaction& Transaction::remove_component(const ComponentRef& component) {
    steps_.emplace_back(op::RemoveComponent{component});
    return *this;
}

Transaction& Transaction::set_component_enabled(const ComponentRef& component, bool enabled) {
    steps_.emplace_back(op::SetComponentEnabled{component, enabled});
    return *this;
}

} // namespace ek::host
