#pragma once
#include "host/host_surface.hpp"
#include "effects/effect_registry.hpp"
#include "timeline/timeline.hpp"

namespace ek::host {

/**
 * @brief In-process host backed by the timeline model
 *
 * Components are the clip's AppliedEffect entries. Reserved entries resolve even
 * before they exist and are created on first write. A transaction edits a copy
 * of one clip's effect list and commits it (followed by a transform/effects
 * normalize) only when every step succeeds. All futures are ready on return.
 */
class TimelineHost : public HostSurface {
public:
    TimelineHost(timeline::Timeline& timeline, const effects::EffectRegistry& registry);

    std::future<core::Result<ClipInfo>> clip_info(ClipId clip) override;
    std::future<core::Result<ParamRef>> resolve_parameter(ClipId clip, const std::string& component,
                                                          const std::string& parameter,
                                                          bool include_builtin) override;
    std::future<core::Result<ParameterState>> read_parameter(const ParamRef& param) override;
    std::future<core::Result<std::vector<ComponentInfo>>> list_components(ClipId clip) override;
    std::future<core::Result<KeyframeSpec>> create_keyframe(double value, Seconds time,
                                                            Interpolation interp) override;
    std::future<core::Result<TransactionReceipt>> run_transaction(const Transaction& tx) override;

    // Synchronous forms used by the futures above
    core::Result<ParamRef> resolve(ClipId clip, const std::string& component, const std::string& parameter,
                                   bool include_builtin) const;
    core::Result<ParameterState> read(const ParamRef& param) const;
    core::Result<TransactionReceipt> apply(const Transaction& tx);

private:
    timeline::Timeline& timeline_;
    const effects::EffectRegistry& registry_;

    bool has_parameter(const timeline::AppliedEffect& entry, const std::string& parameter) const;
    double default_for(const std::string& component_id, const std::string& effect_id,
                       const std::string& parameter) const;
    timeline::AppliedEffect* entry_for(timeline::Clip& clip, const ComponentRef& ref, bool create);
    core::VoidResult apply_step(timeline::Clip& working, const HostOp& step, TransactionReceipt& receipt);
    core::VoidResult append_component(timeline::Clip& working, const op::AppendComponent& step,
                                      TransactionReceipt& receipt);
};

} // namespace ek::host
