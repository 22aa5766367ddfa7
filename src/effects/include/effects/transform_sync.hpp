#pragma once
#include "timeline/clip.hpp"
#include <string>
#include <vector>

namespace ek::effects {

// One transform field mirrored into a parameter of a reserved effect entry.
struct FieldBinding {
    const char* parameter;                        // parameter name on the entry
    double (*get)(const timeline::Transform&);
    void (*set)(timeline::Transform&, double);
    double field_default;                         // transform units
    double (*to_param)(double field);
    double (*to_field)(double param);
};

struct BuiltinBinding {
    const char* applied_id;   // reserved AppliedEffect id, e.g. "builtin-scale"
    const char* effect_id;    // registry effect id
    bool transform_group;     // scale/position/rotation/opacity; kept at the front in this order
    std::vector<FieldBinding> fields;
};

// Canonical order: scale, position, rotation, opacity, then the named filters.
const std::vector<BuiltinBinding>& builtin_bindings();
const BuiltinBinding* binding_for_applied_id(const std::string& applied_id);
const BuiltinBinding* binding_for_effect(const std::string& effect_id);
// Binding and field for a transform field / filter name ("scale", "blur", "hueRotate", ...)
const BuiltinBinding* binding_for_field(const std::string& field_name, const FieldBinding** field = nullptr);

// Transform -> effects. Creates a reserved entry when its field first leaves the
// default, updates it in place, removes it once back at default (unless it carries
// keyframes or is disabled). Non-reserved entries pass through untouched.
void sync_effects_from_transform(const timeline::Transform& transform,
                                 std::vector<timeline::AppliedEffect>& effects);

// Effects -> transform. Only enabled reserved entries contribute; animated
// parameters contribute their resting value.
timeline::Transform effects_to_transform(const std::vector<timeline::AppliedEffect>& effects);

// Runs both directions. Idempotent.
void normalize(timeline::Clip& clip);

// Replaces the clip transform and syncs the reserved entries.
void update_transform(timeline::Clip& clip, const timeline::Transform& transform);

// Reserved entry for `binding`, appended in canonical position when missing.
timeline::AppliedEffect& upsert_builtin(std::vector<timeline::AppliedEffect>& effects,
                                        const BuiltinBinding& binding);

} // namespace ek::effects
