#include "effects/transform_sync.hpp"
#include <algorithm>
#include <cmath>

namespace ek::effects {

using timeline::AppliedEffect;
using timeline::Transform;

namespace {

constexpr double kFieldEpsilon = 1e-9;

double identity(double v) { return v; }

bool same_value(double a, double b) { return std::fabs(a - b) <= kFieldEpsilon; }

std::vector<BuiltinBinding> make_bindings() {
    std::vector<BuiltinBinding> b;
    b.push_back({"builtin-scale", "scale", true, {
        {"scale", [](const Transform& t) { return t.scale; },
                  [](Transform& t, double v) { t.scale = v; }, 100.0, identity, identity}}});
    b.push_back({"builtin-position", "position", true, {
        {"positionX", [](const Transform& t) { return t.position_x; },
                      [](Transform& t, double v) { t.position_x = v; }, 0.0, identity, identity},
        {"positionY", [](const Transform& t) { return t.position_y; },
                      [](Transform& t, double v) { t.position_y = v; }, 0.0, identity, identity}}});
    b.push_back({"builtin-rotation", "rotation", true, {
        {"degrees", [](const Transform& t) { return t.rotation; },
                    [](Transform& t, double v) { t.rotation = v; }, 0.0, identity, identity}}});
    b.push_back({"builtin-opacity", "opacity", true, {
        {"opacity", [](const Transform& t) { return t.opacity; },
                    [](Transform& t, double v) { t.opacity = v; }, 100.0, identity, identity}}});

    b.push_back({"builtin-blur", "gaussian_blur", false, {
        {"sigma", [](const Transform& t) { return t.filters.blur; },
                  [](Transform& t, double v) { t.filters.blur = v; }, 0.0, identity, identity}}});
    // CSS-style multiplier around 1.0 on the transform, offset around 0 on the effect
    b.push_back({"builtin-brightness", "brightness", false, {
        {"brightness", [](const Transform& t) { return t.filters.brightness; },
                       [](Transform& t, double v) { t.filters.brightness = v; }, 1.0,
                       [](double f) { return f - 1.0; }, [](double p) { return p + 1.0; }}}});
    b.push_back({"builtin-contrast", "contrast", false, {
        {"contrast", [](const Transform& t) { return t.filters.contrast; },
                     [](Transform& t, double v) { t.filters.contrast = v; }, 1.0, identity, identity}}});
    b.push_back({"builtin-saturate", "saturation", false, {
        {"saturation", [](const Transform& t) { return t.filters.saturate; },
                       [](Transform& t, double v) { t.filters.saturate = v; }, 1.0, identity, identity}}});
    b.push_back({"builtin-grayscale", "grayscale", false, {
        {"amount", [](const Transform& t) { return t.filters.grayscale; },
                   [](Transform& t, double v) { t.filters.grayscale = v; }, 0.0, identity, identity}}});
    b.push_back({"builtin-sepia", "sepia", false, {
        {"amount", [](const Transform& t) { return t.filters.sepia; },
                   [](Transform& t, double v) { t.filters.sepia = v; }, 0.0, identity, identity}}});
    b.push_back({"builtin-hue-rotate", "hue_rotate", false, {
        {"degrees", [](const Transform& t) { return t.filters.hue_rotate; },
                    [](Transform& t, double v) { t.filters.hue_rotate = v; }, 0.0, identity, identity}}});
    return b;
}

size_t binding_order(const BuiltinBinding& binding) {
    const auto& all = builtin_bindings();
    for (size_t i = 0; i < all.size(); ++i) {
        if (&all[i] == &binding) return i;
    }
    return all.size();
}

bool deviates(const BuiltinBinding& binding, const Transform& t) {
    return std::any_of(binding.fields.begin(), binding.fields.end(),
                       [&](const FieldBinding& f) { return !same_value(f.get(t), f.field_default); });
}

AppliedEffect make_entry(const BuiltinBinding& binding, const Transform& t) {
    AppliedEffect e;
    e.id = binding.applied_id;
    e.effect_id = binding.effect_id;
    for (const auto& f : binding.fields) {
        e.parameters[f.parameter] = f.to_param(f.get(t));
    }
    return e;
}

} // namespace

const std::vector<BuiltinBinding>& builtin_bindings() {
    static const std::vector<BuiltinBinding> bindings = make_bindings();
    return bindings;
}

const BuiltinBinding* binding_for_applied_id(const std::string& applied_id) {
    for (const auto& b : builtin_bindings()) {
        if (applied_id == b.applied_id) return &b;
    }
    return nullptr;
}

const BuiltinBinding* binding_for_effect(const std::string& effect_id) {
    for (const auto& b : builtin_bindings()) {
        if (effect_id == b.effect_id) return &b;
    }
    return nullptr;
}

const BuiltinBinding* binding_for_field(const std::string& field_name, const FieldBinding** field) {
    static const struct { const char* name; const char* applied_id; const char* parameter; } kFields[] = {
        {"scale", "builtin-scale", "scale"},
        {"positionX", "builtin-position", "positionX"},
        {"positionY", "builtin-position", "positionY"},
        {"rotation", "builtin-rotation", "degrees"},
        {"opacity", "builtin-opacity", "opacity"},
        {"blur", "builtin-blur", "sigma"},
        {"brightness", "builtin-brightness", "brightness"},
        {"contrast", "builtin-contrast", "contrast"},
        {"saturate", "builtin-saturate", "saturation"},
        {"grayscale", "builtin-grayscale", "amount"},
        {"sepia", "builtin-sepia", "amount"},
        {"hueRotate", "builtin-hue-rotate", "degrees"},
    };
    for (const auto& entry : kFields) {
        if (field_name != entry.name) continue;
        const auto* binding = binding_for_applied_id(entry.applied_id);
        if (field && binding) {
            *field = nullptr;
            for (const auto& f : binding->fields) {
                if (std::string(f.parameter) == entry.parameter) *field = &f;
            }
        }
        return binding;
    }
    return nullptr;
}

AppliedEffect& upsert_builtin(std::vector<AppliedEffect>& effects, const BuiltinBinding& binding) {
    auto it = std::find_if(effects.begin(), effects.end(),
                           [&](const AppliedEffect& e) { return e.id == binding.applied_id; });
    if (it != effects.end()) return *it;

    AppliedEffect entry = make_entry(binding, Transform{});
    if (!binding.transform_group) {
        effects.push_back(std::move(entry));
        return effects.back();
    }
    size_t order = binding_order(binding);
    size_t idx = 0;
    while (idx < effects.size()) {
        const auto* other = binding_for_applied_id(effects[idx].id);
        if (!other || !other->transform_group || binding_order(*other) > order) break;
        ++idx;
    }
    auto pos = effects.insert(effects.begin() + static_cast<std::ptrdiff_t>(idx), std::move(entry));
    return *pos;
}

void sync_effects_from_transform(const Transform& transform, std::vector<AppliedEffect>& effects) {
    for (const auto& binding : builtin_bindings()) {
        auto it = std::find_if(effects.begin(), effects.end(),
                               [&](const AppliedEffect& e) { return e.id == binding.applied_id; });
        bool non_default = deviates(binding, transform);

        if (it == effects.end()) {
            if (non_default) {
                AppliedEffect& entry = upsert_builtin(effects, binding);
                entry = make_entry(binding, transform);
            }
            continue;
        }

        AppliedEffect& entry = *it;
        if (!non_default) {
            // Back at default: a plain enabled entry is redundant
            if (entry.enabled && !entry.is_animated()) {
                effects.erase(it);
            }
            continue;
        }

        entry.enabled = true;
        for (const auto& f : binding.fields) {
            if (entry.has_keyframes(f.parameter)) continue;
            double field_value = f.get(transform);
            auto p = entry.parameters.find(f.parameter);
            if (p != entry.parameters.end() && same_value(f.to_field(p->second), field_value)) continue;
            entry.parameters[f.parameter] = f.to_param(field_value);
        }
    }
}

Transform effects_to_transform(const std::vector<AppliedEffect>& effects) {
    Transform t;
    for (const auto& e : effects) {
        if (!e.enabled || !e.is_builtin()) continue;
        const auto* binding = binding_for_applied_id(e.id);
        if (!binding) continue;
        for (const auto& f : binding->fields) {
            double param = e.resting_value(f.parameter, f.to_param(f.field_default));
            f.set(t, f.to_field(param));
        }
    }
    return t;
}

void normalize(timeline::Clip& clip) {
    clip.transform = effects_to_transform(clip.effects);
    sync_effects_from_transform(clip.transform, clip.effects);
}

void update_transform(timeline::Clip& clip, const Transform& transform) {
    sync_effects_from_transform(transform, clip.effects);
    clip.transform = effects_to_transform(clip.effects);
}

} // namespace ek::effects
