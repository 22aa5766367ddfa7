#pragma once
#include "animation/keyframe_resolver.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ek::animation {

// Prior state of one numeric parameter. Empty keyframes means it was static.
struct CapturedParameter {
    ClipId clip = 0;
    ParameterTarget target;
    host::ParamRef ref;
    std::vector<timeline::Keyframe> keyframes;
    double static_value = 0.0;

    bool was_static() const { return keyframes.empty(); }
};

// Components of one effect present on a clip at capture time.
struct CapturedPresence {
    ClipId clip = 0;
    std::string effect_id;
    std::vector<host::ComponentInfo> components;

    bool contains(const std::string& component_id) const;
};

// Everything captured for one clip ahead of an edit.
struct ClipCapture {
    ClipId clip = 0;
    std::vector<CapturedParameter> parameters;
    std::optional<CapturedPresence> presence;

    bool empty() const { return parameters.empty() && !presence; }
};

/**
 * @brief Snapshots and restores host parameter state for undo
 *
 * Restore issues one transaction per clip: clear keyframes, set the exact
 * static value, then either re-add the recorded keyframes with their curves or
 * switch time-varying off. Reverting an applied effect removes the components
 * of that effect that were not there before. Removed effects are not
 * re-created at host level on undo.
 */
class StateCapture {
public:
    explicit StateCapture(host::HostSurface& host);

    core::Result<CapturedParameter> capture_parameter(ClipId clip, const ParameterTarget& target);
    core::Result<CapturedPresence> capture_presence(ClipId clip, const std::string& effect_id);

    // Captures what it can; targets the host cannot resolve are skipped
    ClipCapture capture(ClipId clip, const std::vector<ParameterTarget>& targets,
                        const std::optional<std::string>& presence_effect);

    // Removes components of the effect that are not in `before`
    core::VoidResult revert_presence(const CapturedPresence& before);
    // Re-appends components recorded in `after` but missing now and absent from `before`
    core::VoidResult reapply_presence(const CapturedPresence& before, const CapturedPresence& after);

    // Undo direction: revert presence, then restore parameters
    core::VoidResult restore(const ClipCapture& capture);
    // Redo direction: `after` was captured once the edit had run
    core::VoidResult replay(const ClipCapture& before, const ClipCapture& after);

private:
    host::HostSurface& host_;

    void append_restore(host::Transaction& tx, const CapturedParameter& captured);
};

} // namespace ek::animation
