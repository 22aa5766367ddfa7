#pragma once
#include "core/result.hpp"
#include "timeline/clip.hpp"
#include <future>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace ek::host {

using timeline::ClipId;
using timeline::Interpolation;

// Handle to one effect component on a clip, as the host names it.
struct ComponentRef {
    ClipId clip = 0;
    std::string component_id;
    std::string effect_id;

    bool operator==(const ComponentRef& other) const {
        return clip == other.clip && component_id == other.component_id && effect_id == other.effect_id;
    }
};

struct ParamRef {
    ComponentRef component;
    std::string parameter;

    ClipId clip() const { return component.clip; }
};

struct ParameterState {
    std::vector<timeline::Keyframe> keyframes;   // empty when static
    double static_value = 0.0;

    bool time_varying() const { return !keyframes.empty(); }
};

struct ComponentInfo {
    std::string id;
    std::string effect_id;
    bool enabled = true;
    bool builtin = false;
    std::map<std::string, double> parameters;
};

struct ClipInfo {
    ClipId id = 0;
    timeline::MediaType type = timeline::MediaType::Video;
    Seconds start = 0.0;      // timeline placement
    Seconds duration = 0.0;
};

// Value object produced by create_keyframe and consumed by AddKeyframe.
struct KeyframeSpec {
    Seconds time = 0.0;
    double value = 0.0;
    Interpolation interpolation = Interpolation::Linear;
};

namespace op {
struct SetTimeVarying { ParamRef param; bool enabled = false; };
struct AddKeyframe { ParamRef param; KeyframeSpec keyframe; };
struct SetInterpolation { ParamRef param; Seconds time = 0.0; Interpolation interpolation = Interpolation::Linear; };
struct ClearKeyframes { ParamRef param; };
struct SetStaticValue { ParamRef param; double value = 0.0; };
struct AppendComponent { ClipId clip = 0; std::string effect_id; std::map<std::string, double> parameters; };
struct RemoveComponent { ComponentRef component; };
struct SetComponentEnabled { ComponentRef component; bool enabled = true; };
} // namespace op

using HostOp = std::variant<op::SetTimeVarying, op::AddKeyframe, op::SetInterpolation, op::ClearKeyframes,
                            op::SetStaticValue, op::AppendComponent, op::RemoveComponent,
                            op::SetComponentEnabled>;

const char* op_name(const HostOp& step) noexcept;

/**
 * @brief Ordered list of host steps applied all-or-nothing
 */
class Transaction {
public:
    explicit Transaction(std::string label = {}) : label_(std::move(label)) {}

    Transaction& set_time_varying(const ParamRef& param, bool enabled);
    Transaction& add_keyframe(const ParamRef& param, const KeyframeSpec& keyframe);
    Transaction& set_interpolation(const ParamRef& param, Seconds time, Interpolation interp);
    Transaction& clear_keyframes(const ParamRef& param);
    Transaction& set_static_value(const ParamRef& param, double value);
    Transaction& append_component(ClipId clip, const std::string& effect_id,
                                  const std::map<std::string, double>& parameters);
    Transaction& remove_component(const ComponentRef& component);
    Transaction& set_component_enabled(const ComponentRef& component, bool enabled);

    const std::string& label() const { return label_; }
    const std::vector<HostOp>& steps() const { return steps_; }
    bool empty() const { return steps_.empty(); }
    size_t size() const { return steps_.size(); }

private:
    std::string label_;
    std::vector<HostOp> steps_;
};

struct TransactionReceipt {
    size_t steps_applied = 0;
    std::vector<ComponentRef> created;   // components added by AppendComponent steps and still present
    bool changed = true;                 // false when the commit left the clip as it was
};

/**
 * @brief Capability interface of the editing surface
 *
 * Every call returns a future and may fail independently, either with an error
 * result or by storing a core::HostOperationError in the future. Callers wait on
 * each call before issuing the next one for the same clip.
 */
class HostSurface {
public:
    virtual ~HostSurface() = default;

    virtual std::future<core::Result<ClipInfo>> clip_info(ClipId clip) = 0;

    // An empty `component` searches every component for `parameter`;
    // reserved components are skipped unless `include_builtin` is set.
    virtual std::future<core::Result<ParamRef>> resolve_parameter(ClipId clip, const std::string& component,
                                                                  const std::string& parameter,
                                                                  bool include_builtin) = 0;

    virtual std::future<core::Result<ParameterState>> read_parameter(const ParamRef& param) = 0;

    virtual std::future<core::Result<std::vector<ComponentInfo>>> list_components(ClipId clip) = 0;

    virtual std::future<core::Result<KeyframeSpec>> create_keyframe(double value, Seconds time,
                                                                    Interpolation interp) = 0;

    virtual std::future<core::Result<TransactionReceipt>> run_transaction(const Transaction& tx) = 0;
};

// Helper for implementations that complete synchronously.
template<typename T>
std::future<T> make_ready_future(T value) {
    std::promise<T> p;
    p.set_value(std::move(value));
    return p.get_future();
}

} // namespace ek::host
