#include "commands/dispatcher.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "core/log_config.hpp"
#include <algorithm>

namespace ek::commands {

Dispatcher::Dispatcher(timeline::Timeline& timeline, const effects::EffectRegistry& registry,
                       host::HostSurface& host, animation::KeyframeResolver& resolver,
                       Interpolation default_interpolation)
    : ctx_{timeline, registry, host, resolver, default_interpolation} {}

void Dispatcher::register_handler(std::unique_ptr<ActionHandler> handler) {
    if (!handler) {
        ek::log::warn("Attempted to register null action handler");
        return;
    }
    std::string tag = handler->tag();
    handlers_[tag] = std::move(handler);
    EK_DISPATCH_LOG("Registered action handler: " + tag);
}

bool Dispatcher::has_action(const std::string& tag) const {
    return handlers_.count(tag) > 0;
}

std::vector<std::string> Dispatcher::available_actions() const {
    std::vector<std::string> tags;
    tags.reserve(handlers_.size());
    for (const auto& [tag, handler] : handlers_) tags.push_back(tag);
    return tags;
}

const ActionHandler* Dispatcher::handler(const std::string& tag) const {
    auto it = handlers_.find(tag);
    return it == handlers_.end() ? nullptr : it->second.get();
}

ActionHandler& Dispatcher::require(const std::string& tag) const {
    auto it = handlers_.find(tag);
    if (it == handlers_.end()) {
        throw core::UnknownActionError(tag);
    }
    return *it->second;
}

void Dispatcher::validate(const std::string& tag, const ActionParams& params) const {
    const ActionHandler& h = require(tag);
    for (const auto& key : h.required_parameters()) {
        if (!params.has(key)) {
            throw core::ValidationError(tag + ": missing required parameter '" + key + "'");
        }
    }
    h.validate(params, ctx_.registry);
}

std::vector<ClipId> Dispatcher::resolve_targets(const ActionParams& params, const std::vector<ClipId>& targets) const {
    if (auto explicit_clip = params.clip_id()) {
        return {*explicit_clip};
    }
    if (!targets.empty()) {
        return targets;
    }
    ClipId active = ctx_.timeline.active_clip();
    if (active == 0) return {};
    return {active};
}

bool Dispatcher::run_one(ActionHandler& handler, ClipId clip, const ActionParams& params,
                         DispatchObserver* observer) {
    bool ok = false;
    try {
        if (observer) observer->before_action(handler, ctx_, clip, params);
        ok = handler.apply(ctx_, clip, params);
    } catch (const std::exception& e) {
        ek::log::warn(handler.tag() + " failed on clip " + std::to_string(clip) + ": " + e.what());
        return false;
    }

    // The edit has landed by now; an observer error cannot turn it into a failure
    if (observer) {
        try {
            observer->after_action(handler, ctx_, clip, params, ok);
        } catch (const std::exception& e) {
            ek::log::warn(handler.tag() + " on clip " + std::to_string(clip) + ": observer failed after the edit: " +
                          e.what());
        }
    }
    return ok;
}

BatchResult Dispatcher::dispatch(const std::string& tag, const ActionParams& params,
                                 const std::vector<ClipId>& targets, DispatchObserver* observer) {
    validate(tag, params);
    ActionHandler& h = require(tag);
    BatchResult result;
    ctx_.readings.clear();

    if (h.scope() == HandlerScope::Project) {
        if (run_one(h, 0, params, observer)) ++result.successful;
        else ++result.failed;
        ek::log::debug("Dispatched " + tag + " (project)");
        return result;
    }

    std::vector<ClipId> clips = resolve_targets(params, targets);
    if (clips.empty()) {
        ek::log::warn(tag + ": no clip selected");
        result.failed = 1;
        return result;
    }

    ek::log::debug("Dispatching " + tag + " to " + std::to_string(clips.size()) + " clip(s)");
    for (ClipId clip : clips) {
        if (run_one(h, clip, params, observer)) {
            ++result.successful;
            EK_DISPATCH_LOG(tag + " applied to clip " + std::to_string(clip));
        } else {
            ++result.failed;
        }
    }

    if (result.failed > 0) {
        ek::log::warn(tag + ": " + describe(result));
    } else {
        ek::log::info(tag + ": " + describe(result));
    }
    return result;
}

DispatchSummary Dispatcher::dispatch_many(const std::vector<EditAction>& actions,
                                          const std::vector<ClipId>& targets, DispatchObserver* observer) {
    DispatchSummary summary;
    for (const auto& action : actions) {
        ActionOutcome outcome;
        outcome.tag = action.tag;
        try {
            outcome.result = dispatch(action, targets, observer);
            outcome.description = require(action.tag).describe(action.params);
            outcome.readings = ctx_.readings;
        } catch (const core::EditError& e) {
            outcome.error = core::Error{e.code(), e.what()};
            outcome.result = BatchResult{0, std::max<size_t>(targets.size(), 1)};
            ek::log::warn("Action " + action.tag + " skipped: " + e.what());
        }
        summary.aggregate += outcome.result;
        summary.outcomes.push_back(std::move(outcome));
    }
    return summary;
}

std::string describe(const BatchResult& result) {
    return "applied to " + std::to_string(result.successful) + " of " + std::to_string(result.total()) +
           (result.total() == 1 ? " clip" : " clips");
}

std::string format_outcome(const ActionOutcome& outcome) {
    if (outcome.error) {
        return outcome.tag + ": " + outcome.error->message;
    }
    std::string head = outcome.description.empty() ? outcome.tag : outcome.description;
    return head + ": " + describe(outcome.result);
}

} // namespace ek::commands
