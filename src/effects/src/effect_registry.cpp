#include "effects/effect_registry.hpp"
#include "core/log.hpp"
#include <algorithm>

namespace ek::effects {

const char* to_string(Category category) noexcept {
    switch(category) {
        case Category::Transform: return "transform";
        case Category::Color: return "color";
        case Category::Blur: return "blur";
        case Category::Style: return "style";
        case Category::Transition: return "transition";
        case Category::Speed: return "speed";
        case Category::Audio: return "audio";
    }
    return "unknown";
}

bool ParameterDescriptor::in_range(double value) const {
    if (min && value < *min) return false;
    if (max && value > *max) return false;
    return true;
}

double ParameterDescriptor::clamp(double value) const {
    if (min) value = std::max(value, *min);
    if (max) value = std::min(value, *max);
    return value;
}

const ParameterDescriptor* EffectDescriptor::find_parameter(const std::string& parameter_id) const {
    for (const auto& p : parameters) {
        if (p.id == parameter_id) return &p;
    }
    return nullptr;
}

namespace {

ParameterDescriptor param(const char* id, const char* name, double def, double lo, double hi, double step) {
    ParameterDescriptor p;
    p.id = id;
    p.name = name;
    p.default_value = def;
    p.min = lo;
    p.max = hi;
    p.step = step;
    return p;
}

EffectDescriptor effect(const char* id, const char* name, Category category, bool builtin,
                        std::vector<ParameterDescriptor> params) {
    EffectDescriptor d;
    d.id = id;
    d.name = name;
    d.category = category;
    d.builtin = builtin;
    d.parameters = std::move(params);
    return d;
}

} // namespace

EffectRegistry EffectRegistry::with_defaults() {
    EffectRegistry r;

    // Transform (scale and opacity in percent)
    r.register_effect(effect("scale", "Scale / Zoom", Category::Transform, true,
        {param("scale", "Scale", 100.0, 10.0, 1000.0, 1.0)}));
    r.register_effect(effect("position", "Position / Pan", Category::Transform, true,
        {param("positionX", "Position X", 0.0, -3840.0, 3840.0, 1.0),
         param("positionY", "Position Y", 0.0, -2160.0, 2160.0, 1.0)}));
    r.register_effect(effect("rotation", "Rotation", Category::Transform, true,
        {param("degrees", "Rotation", 0.0, -360.0, 360.0, 0.1)}));
    r.register_effect(effect("opacity", "Opacity", Category::Transform, true,
        {param("opacity", "Opacity", 100.0, 0.0, 100.0, 1.0)}));
    r.register_effect(effect("crop", "Crop", Category::Transform, false,
        {param("width", "Width", 1920.0, 1.0, 7680.0, 1.0),
         param("height", "Height", 1080.0, 1.0, 4320.0, 1.0),
         param("x", "X Offset", 0.0, 0.0, 7680.0, 1.0),
         param("y", "Y Offset", 0.0, 0.0, 4320.0, 1.0)}));

    // Color
    r.register_effect(effect("brightness", "Brightness", Category::Color, false,
        {param("brightness", "Brightness", 0.0, -1.0, 1.0, 0.01)}));
    r.register_effect(effect("contrast", "Contrast", Category::Color, false,
        {param("contrast", "Contrast", 1.0, 0.0, 3.0, 0.01)}));
    r.register_effect(effect("saturation", "Saturation", Category::Color, false,
        {param("saturation", "Saturation", 1.0, 0.0, 3.0, 0.01)}));
    r.register_effect(effect("exposure", "Exposure", Category::Color, false,
        {param("exposure", "Exposure", 0.0, -3.0, 3.0, 0.01)}));
    r.register_effect(effect("color_temperature", "Color Temperature", Category::Color, false,
        {param("temperature", "Temperature", 6500.0, 1000.0, 12000.0, 100.0)}));
    r.register_effect(effect("hue_rotate", "Hue Rotate", Category::Color, false,
        {param("degrees", "Hue", 0.0, -180.0, 180.0, 1.0)}));
    r.register_effect(effect("grayscale", "Grayscale", Category::Color, false,
        {param("amount", "Amount", 1.0, 0.0, 1.0, 0.01)}));

    // Blur / sharpen
    r.register_effect(effect("gaussian_blur", "Gaussian Blur", Category::Blur, false,
        {param("sigma", "Blur Amount", 5.0, 0.0, 100.0, 0.1)}));
    r.register_effect(effect("sharpen", "Sharpen", Category::Blur, false,
        {param("amount", "Amount", 1.5, 0.0, 10.0, 0.1)}));

    // Style
    r.register_effect(effect("sepia", "Sepia", Category::Style, false,
        {param("amount", "Amount", 1.0, 0.0, 1.0, 0.01)}));
    r.register_effect(effect("vignette", "Vignette", Category::Style, false,
        {param("angle", "Angle", 0.5, 0.0, 1.5, 0.01)}));

    // Transitions
    r.register_effect(effect("cross_dissolve", "Cross Dissolve", Category::Transition, false,
        {param("duration", "Duration", 1.0, 0.1, 5.0, 0.1),
         param("offset", "Offset", 0.0, 0.0, 3600.0, 0.1)}));
    r.register_effect(effect("fade_out", "Fade Out", Category::Transition, false,
        {param("start", "Start", 0.0, 0.0, 3600.0, 0.1),
         param("duration", "Duration", 1.0, 0.1, 10.0, 0.1)}));
    r.register_effect(effect("fade_in", "Fade In", Category::Transition, false,
        {param("duration", "Duration", 1.0, 0.1, 10.0, 0.1)}));

    // Speed
    r.register_effect(effect("playback_speed", "Playback Speed", Category::Speed, false,
        {param("rate", "Rate", 1.0, 0.1, 16.0, 0.1)}));

    // Audio
    r.register_effect(effect("audio_gain", "Volume", Category::Audio, false,
        {param("gain_db", "Gain (dB)", 0.0, -96.0, 24.0, 0.1)}));
    r.register_effect(effect("reverb", "Reverb", Category::Audio, false,
        {param("room_size", "Room Size", 0.5, 0.0, 1.0, 0.01),
         param("mix", "Mix", 0.3, 0.0, 1.0, 0.01)}));
    r.register_effect(effect("denoise", "DeNoise", Category::Audio, false,
        {param("strength", "Strength", 0.5, 0.0, 1.0, 0.01)}));
    r.register_effect(effect("highpass", "High Pass", Category::Audio, false,
        {param("frequency", "Cutoff (Hz)", 80.0, 20.0, 20000.0, 1.0)}));

    return r;
}

void EffectRegistry::register_effect(EffectDescriptor descriptor) {
    std::string id = descriptor.id;
    if (descriptors_.find(id) == descriptors_.end()) {
        order_.push_back(id);
    } else {
        ek::log::debug("Replacing effect descriptor: " + id);
    }
    descriptors_[id] = std::move(descriptor);
}

bool EffectRegistry::contains(const std::string& effect_id) const {
    return descriptors_.find(effect_id) != descriptors_.end();
}

const EffectDescriptor* EffectRegistry::describe(const std::string& effect_id) const {
    auto it = descriptors_.find(effect_id);
    return it != descriptors_.end() ? &it->second : nullptr;
}

std::vector<const EffectDescriptor*> EffectRegistry::by_category(Category category) const {
    std::vector<const EffectDescriptor*> result;
    for (const auto& id : order_) {
        const auto& d = descriptors_.at(id);
        if (d.category == category) result.push_back(&d);
    }
    return result;
}

std::vector<const EffectDescriptor*> EffectRegistry::builtin_effects() const {
    std::vector<const EffectDescriptor*> result;
    for (const auto& id : order_) {
        const auto& d = descriptors_.at(id);
        if (d.builtin) result.push_back(&d);
    }
    return result;
}

std::vector<std::string> EffectRegistry::effect_ids() const {
    return order_;
}

std::optional<std::map<std::string, double>> EffectRegistry::resolve_parameters(
    const std::string& effect_id, const std::map<std::string, double>& provided) const {
    const auto* d = describe(effect_id);
    if (!d) return std::nullopt;

    std::map<std::string, double> out;
    for (const auto& p : d->parameters) {
        auto it = provided.find(p.id);
        out[p.id] = it != provided.end() ? it->second : p.default_value;
    }
    return out;
}

bool EffectRegistry::in_range(const std::string& effect_id, const std::string& parameter_id, double value) const {
    const auto* d = describe(effect_id);
    if (!d) return false;
    const auto* p = d->find_parameter(parameter_id);
    return p && p->in_range(value);
}

} // namespace ek::effects
