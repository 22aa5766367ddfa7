#include "engine/edit_engine.hpp"
#include "core/errors.hpp"
#include "host/timeline_host.hpp"
#include <optional>

namespace ek::engine {

// ---- EditCommand ----------------------------------------------------------

EditCommand::EditCommand(std::string description, SnapshotPtr previous, SnapshotPtr next,
                         animation::StateCapture& capture, std::vector<CapturePair> captures)
    : SnapshotCommand(std::move(description), std::move(previous), std::move(next)),
      capture_(capture), captures_(std::move(captures)) {}

bool EditCommand::undo(timeline::Timeline& timeline) {
    for (auto it = captures_.rbegin(); it != captures_.rend(); ++it) {
        try {
            auto r = capture_.restore(it->before);
            if (r.is_error()) {
                ek::log::warn("Undo: clip " + std::to_string(it->before.clip) + " host state not restored: " +
                              r.message());
            }
        } catch (const std::exception& e) {
            ek::log::warn("Undo: clip " + std::to_string(it->before.clip) + " host error: " + e.what());
        }
    }
    return SnapshotCommand::undo(timeline);
}

bool EditCommand::execute(timeline::Timeline& timeline) {
    for (const auto& pair : captures_) {
        try {
            auto r = capture_.replay(pair.before, pair.after);
            if (r.is_error()) {
                ek::log::warn("Redo: clip " + std::to_string(pair.after.clip) + " host state not replayed: " +
                              r.message());
            }
        } catch (const std::exception& e) {
            ek::log::warn("Redo: clip " + std::to_string(pair.after.clip) + " host error: " + e.what());
        }
    }
    return SnapshotCommand::execute(timeline);
}

// ---- Capture observer -----------------------------------------------------

// Records host state around every clip an action touches.
class EditEngine::CaptureObserver : public commands::DispatchObserver {
public:
    explicit CaptureObserver(animation::StateCapture& capture) : capture_(capture) {}

    void before_action(const commands::ActionHandler& handler, const commands::ActionContext& ctx, ClipId clip,
                       const commands::ActionParams& params) override {
        pending_.reset();
        if (handler.scope() == commands::HandlerScope::Project) return;
        commands::UndoPlan plan = handler.undo_plan(ctx, clip, params);
        if (plan.empty()) return;
        animation::ClipCapture before = capture_.capture(clip, plan.parameters, plan.presence_effect);
        pending_ = Pending{std::move(plan), std::move(before)};
    }

    void after_action(const commands::ActionHandler&, const commands::ActionContext&, ClipId clip,
                      const commands::ActionParams&, bool succeeded) override {
        if (!pending_) return;
        if (!succeeded) {
            pending_.reset();
            return;
        }
        Pending done = std::move(*pending_);
        pending_.reset();

        CapturePair pair;
        pair.before = std::move(done.before);
        pair.after.clip = clip;
        try {
            pair.after = capture_.capture(clip, done.plan.parameters, done.plan.presence_effect);
        } catch (const std::exception& e) {
            // Undo can still revert to `before`; redo falls back to the snapshot
            ek::log::warn("Clip " + std::to_string(clip) + ": state after the edit not captured: " + e.what());
        }
        if (!pair.before.empty() || !pair.after.empty()) {
            captures_.push_back(std::move(pair));
        }
    }

    std::vector<CapturePair> take() { return std::move(captures_); }

private:
    struct Pending {
        commands::UndoPlan plan;
        animation::ClipCapture before;
    };

    animation::StateCapture& capture_;
    std::optional<Pending> pending_;
    std::vector<CapturePair> captures_;
};

// ---- EditEngine -----------------------------------------------------------

EditEngine::EditEngine(EngineConfig config, HostFactory host_factory)
    : config_(config),
      registry_(effects::EffectRegistry::with_defaults()),
      history_(config.max_history) {
    ek::log::set_json_mode(config_.log_json);
    ek::log::set_level(config_.log_level);

    if (!host_factory) {
        host_factory = [](timeline::Timeline& timeline, const effects::EffectRegistry& registry) {
            return std::make_unique<host::TimelineHost>(timeline, registry);
        };
    }
    host_ = host_factory(timeline_, registry_);
    if (!host_) {
        throw core::EditError(core::ErrorCode::InvalidState, "Host factory returned no host");
    }
    resolver_ = std::make_unique<animation::KeyframeResolver>(*host_);
    capture_ = std::make_unique<animation::StateCapture>(*host_);
    dispatcher_ = std::make_unique<commands::Dispatcher>(timeline_, registry_, *host_, *resolver_,
                                                         config_.default_interpolation);
    commands::register_builtin_handlers(*dispatcher_);

    ek::log::debug("Edit engine ready with " + std::to_string(dispatcher_->available_actions().size()) +
                   " actions and " + std::to_string(registry_.size()) + " effects");
}

EditEngine::~EditEngine() = default;

ExecuteResult EditEngine::execute(const commands::EditAction& action, const std::vector<ClipId>& targets) {
    return execute(action.tag, action.params, targets);
}

ExecuteResult EditEngine::execute(const std::string& tag, const commands::ActionParams& params,
                                  const std::vector<ClipId>& targets) {
    dispatcher_->validate(tag, params);
    const commands::ActionHandler& handler = *dispatcher_->handler(tag);

    ExecuteResult out;
    if (handler.read_only()) {
        out.result = dispatcher_->dispatch(tag, params, targets);
        out.description = handler.describe(params);
        out.readings = dispatcher_->readings();
        return out;
    }

    auto previous = timeline_.snapshot();
    CaptureObserver observer(*capture_);

    out.result = dispatcher_->dispatch(tag, params, targets, &observer);
    out.description = handler.describe(params);
    out.recorded = record(out.description, std::move(previous), observer.take());
    return out;
}

ExecuteManyResult EditEngine::execute_many(const std::vector<commands::EditAction>& actions,
                                           const std::vector<ClipId>& targets) {
    auto previous = timeline_.snapshot();
    CaptureObserver observer(*capture_);

    ExecuteManyResult out;
    out.summary = dispatcher_->dispatch_many(actions, targets, &observer);

    std::string description;
    size_t applied = 0;
    for (const auto& outcome : out.summary.outcomes) {
        if (outcome.error || outcome.result.successful == 0) continue;
        if (dispatcher_->handler(outcome.tag)->read_only()) continue;
        if (applied++ > 0) description += ", ";
        description += outcome.description;
    }
    if (applied == 0) description = "No changes";

    out.recorded = record(description, std::move(previous), observer.take());
    return out;
}

bool EditEngine::record(const std::string& description, commands::SnapshotCommand::SnapshotPtr previous,
                        std::vector<CapturePair> captures) {
    auto command = std::make_unique<EditCommand>(description, std::move(previous), timeline_.snapshot(),
                                                 *capture_, std::move(captures));
    if (!command->changes_state()) {
        ek::log::debug("Nothing changed, not recording: " + description);
        return false;
    }
    return history_.push(std::move(command));
}

core::Result<std::string> EditEngine::undo() {
    return history_.undo(timeline_);
}

core::Result<std::string> EditEngine::redo() {
    return history_.redo(timeline_);
}

void EditEngine::load(const timeline::Timeline::Snapshot& snapshot) {
    timeline_.restore(snapshot);
    history_.clear();
    ek::log::info("Project loaded");
}

void EditEngine::reset() {
    timeline_.reset();
    history_.clear();
    ek::log::info("Project reset");
}

} // namespace ek::engine
