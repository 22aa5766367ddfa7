#pragma once
#include "animation/keyframe_resolver.hpp"
#include "commands/edit_action.hpp"
#include "effects/effect_registry.hpp"
#include "timeline/timeline.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ek::commands {

class Dispatcher;

enum class HandlerScope {
    Clip,      // runs once per target clip
    Project    // runs once per dispatch, targets ignored
};

// Components of one clip as a read-only action found them.
struct ClipParameters {
    ClipId clip = 0;
    std::vector<host::ComponentInfo> components;
};

// Collaborators a handler may touch while applying an action.
struct ActionContext {
    timeline::Timeline& timeline;
    const effects::EffectRegistry& registry;
    host::HostSurface& host;
    animation::KeyframeResolver& resolver;
    Interpolation default_interpolation = Interpolation::Bezier;
    std::vector<ClipParameters> readings;   // filled by read-only actions, reset per dispatch
};

// What to capture on a clip before the action runs so the host can be reverted.
struct UndoPlan {
    std::vector<animation::ParameterTarget> parameters;
    std::optional<std::string> presence_effect;

    bool empty() const { return parameters.empty() && !presence_effect; }
};

/**
 * @brief Uniform contract of one action tag
 *
 * validate() throws core::ValidationError and must not touch any clip.
 * apply() returns false for a per-clip failure; a thrown exception is also
 * treated as a failure of that clip by the dispatcher.
 */
class ActionHandler {
public:
    virtual ~ActionHandler() = default;

    virtual const std::string& tag() const = 0;
    virtual HandlerScope scope() const = 0;
    virtual std::vector<std::string> required_parameters() const = 0;

    virtual void validate(const ActionParams& params, const effects::EffectRegistry& registry) const = 0;
    virtual bool apply(ActionContext& ctx, ClipId clip, const ActionParams& params) = 0;
    virtual std::string describe(const ActionParams& params) const = 0;
    virtual UndoPlan undo_plan(const ActionContext& ctx, ClipId clip, const ActionParams& params) const = 0;

    // Read-only actions never change the project and are not recorded
    virtual bool read_only() const { return false; }
};

/**
 * @brief Handler over a typed action view
 *
 * Parses the raw parameters with Action::parse() and forwards to the typed
 * hooks. check() adds registry-dependent validation on top of parsing.
 */
template<typename Action>
class TypedActionHandler : public ActionHandler {
public:
    explicit TypedActionHandler(std::string tag, HandlerScope scope = HandlerScope::Clip)
        : tag_(std::move(tag)), scope_(scope) {}

    const std::string& tag() const override { return tag_; }
    HandlerScope scope() const override { return scope_; }
    std::vector<std::string> required_parameters() const override { return Action::required(); }

    void validate(const ActionParams& params, const effects::EffectRegistry& registry) const override {
        check(Action::parse(params), registry);
    }

    bool apply(ActionContext& ctx, ClipId clip, const ActionParams& params) override {
        return apply_typed(ctx, clip, Action::parse(params));
    }

    std::string describe(const ActionParams& params) const override {
        return describe_typed(Action::parse(params));
    }

    UndoPlan undo_plan(const ActionContext& ctx, ClipId clip, const ActionParams& params) const override {
        return undo_typed(ctx, clip, Action::parse(params));
    }

protected:
    virtual void check(const Action& /*action*/, const effects::EffectRegistry& /*registry*/) const {}
    virtual bool apply_typed(ActionContext& ctx, ClipId clip, const Action& action) = 0;
    virtual std::string describe_typed(const Action& action) const = 0;
    virtual UndoPlan undo_typed(const ActionContext& /*ctx*/, ClipId /*clip*/, const Action& /*action*/) const {
        return {};
    }

private:
    std::string tag_;
    HandlerScope scope_;
};

// Registers the stock handlers: zoom, zoomIn, zoomOut, position, opacity,
// rotation, filter, volume, playbackRate, cut, trim, deleteClip, applyEffect,
// removeEffect, updateEffect, toggleEffect, applyTransition, modifyParameter,
// adjustVolume and the read-only getParameters.
void register_builtin_handlers(Dispatcher& dispatcher);

} // namespace ek::commands
