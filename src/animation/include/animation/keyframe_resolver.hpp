#pragma once
#include "host/host_surface.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ek::animation {

using timeline::ClipId;
using timeline::Interpolation;

// Names a parameter the way the host resolves it: a component (applied id,
// reserved id or effect id; empty = search) and a parameter on it.
struct ParameterTarget {
    std::string component;
    std::string parameter;
    bool include_builtin = true;

    bool operator==(const ParameterTarget& other) const {
        return component == other.component && parameter == other.parameter &&
               include_builtin == other.include_builtin;
    }
};

struct ParameterChange {
    ParameterTarget target;
    double start_value = 0.0;
    double end_value = 0.0;
    bool animated = false;
    Seconds start_time = 0.0;            // relative to clip start
    std::optional<Seconds> duration;     // default: rest of the clip
    Interpolation interpolation = Interpolation::Bezier;

    static ParameterChange fixed(ParameterTarget target, double value);
    static ParameterChange ramp(ParameterTarget target, double from, double to,
                                std::optional<Seconds> duration = std::nullopt,
                                Interpolation interp = Interpolation::Bezier);
};

/**
 * @brief Realizes parameter changes as host keyframe operations
 *
 * Static changes clear any keyframes and set one value. Animated changes place
 * a start and an end keyframe with the requested curve. Every change for one
 * clip goes out as a single host transaction so a clip is never half-applied.
 * A false return is a per-clip failure; host exceptions propagate.
 */
class KeyframeResolver {
public:
    explicit KeyframeResolver(host::HostSurface& host);

    [[nodiscard]] bool apply(ClipId clip, const ParameterChange& change);
    [[nodiscard]] bool apply_all(ClipId clip, const std::vector<ParameterChange>& changes,
                                 const std::string& label);

    // Builds the transaction without running it
    core::Result<host::Transaction> plan(ClipId clip, const std::vector<ParameterChange>& changes,
                                         const std::string& label);

private:
    host::HostSurface& host_;

    core::VoidResult plan_change(ClipId clip, const host::ClipInfo& info, const ParameterChange& change,
                                 host::Transaction& tx);
};

} // namespace ek::animation
