#pragma once
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ek::effects {

enum class Category { Transform, Color, Blur, Style, Transition, Speed, Audio };

const char* to_string(Category category) noexcept;

struct ParameterDescriptor {
    std::string id;
    std::string name;
    double default_value = 0.0;
    std::optional<double> min;
    std::optional<double> max;
    double step = 0.01;

    bool in_range(double value) const;
    double clamp(double value) const;
};

struct EffectDescriptor {
    std::string id;
    std::string name;
    Category category = Category::Color;
    bool builtin = false;   // always present on visual clips (transform group)
    std::vector<ParameterDescriptor> parameters;

    const ParameterDescriptor* find_parameter(const std::string& parameter_id) const;
};

/**
 * @brief Catalog of effect types known to the engine
 *
 * Lookups are pure. New effect types are added with register_effect(); the
 * dispatcher and the synchronizer only consult descriptors, so nothing else
 * changes when the catalog grows.
 */
class EffectRegistry {
public:
    EffectRegistry() = default;

    // Registry pre-filled with the stock transform, color, blur, style,
    // transition, speed and audio effects
    static EffectRegistry with_defaults();

    // Replaces an existing descriptor with the same id
    void register_effect(EffectDescriptor descriptor);
    bool contains(const std::string& effect_id) const;

    // nullptr for an unknown effect
    const EffectDescriptor* describe(const std::string& effect_id) const;

    std::vector<const EffectDescriptor*> by_category(Category category) const;
    std::vector<const EffectDescriptor*> builtin_effects() const;
    std::vector<std::string> effect_ids() const;   // registration order
    size_t size() const { return order_.size(); }

    // Descriptor defaults overlaid with the provided values. Unknown parameter
    // names are dropped. std::nullopt for an unknown effect.
    std::optional<std::map<std::string, double>> resolve_parameters(
        const std::string& effect_id, const std::map<std::string, double>& provided) const;

    // Parameter range check; unknown effects or parameters are out of range
    bool in_range(const std::string& effect_id, const std::string& parameter_id, double value) const;

private:
    std::unordered_map<std::string, EffectDescriptor> descriptors_;
    std::vector<std::string> order_;
};

} // namespace ek::effects
