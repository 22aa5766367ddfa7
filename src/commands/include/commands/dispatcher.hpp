#pragma once
#include "commands/action_handlers.hpp"
#include "core/result.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ek::commands {

struct BatchResult {
    size_t successful = 0;
    size_t failed = 0;

    size_t total() const { return successful + failed; }

    BatchResult& operator+=(const BatchResult& other) {
        successful += other.successful;
        failed += other.failed;
        return *this;
    }
    bool operator==(const BatchResult& other) const {
        return successful == other.successful && failed == other.failed;
    }
    bool operator!=(const BatchResult& other) const { return !(*this == other); }
};

struct ActionOutcome {
    std::string tag;
    BatchResult result;
    std::optional<core::Error> error;   // validation / unknown-action error, nothing applied
    std::string description;
    std::vector<ClipParameters> readings;
};

struct DispatchSummary {
    std::vector<ActionOutcome> outcomes;
    BatchResult aggregate;
};

// Per-clip hooks around a handler. An exception from before_action counts as a
// failure of that clip; one from after_action is logged and the outcome stands.
class DispatchObserver {
public:
    virtual ~DispatchObserver() = default;
    virtual void before_action(const ActionHandler& handler, const ActionContext& ctx, ClipId clip,
                               const ActionParams& params) = 0;
    virtual void after_action(const ActionHandler& handler, const ActionContext& ctx, ClipId clip,
                              const ActionParams& params, bool succeeded) = 0;
};

/**
 * @brief Routes edit actions to their handlers
 *
 * Parameters are validated before any clip is touched. Clip-scoped handlers run
 * sequentially over the targets; a failure on one clip is counted and the loop
 * moves on. Project-scoped handlers run once.
 */
class Dispatcher {
public:
    Dispatcher(timeline::Timeline& timeline, const effects::EffectRegistry& registry,
               host::HostSurface& host, animation::KeyframeResolver& resolver,
               Interpolation default_interpolation = Interpolation::Bezier);

    // Replaces a handler registered under the same tag
    void register_handler(std::unique_ptr<ActionHandler> handler);
    bool has_action(const std::string& tag) const;
    std::vector<std::string> available_actions() const;
    // nullptr for an unknown tag
    const ActionHandler* handler(const std::string& tag) const;

    // Throws UnknownActionError or ValidationError
    void validate(const std::string& tag, const ActionParams& params) const;
    void validate(const EditAction& action) const { validate(action.tag, action.params); }

    // Explicit clipId wins, then the given targets, then the active clip. Empty when none.
    std::vector<ClipId> resolve_targets(const ActionParams& params, const std::vector<ClipId>& targets) const;

    BatchResult dispatch(const std::string& tag, const ActionParams& params,
                         const std::vector<ClipId>& targets = {}, DispatchObserver* observer = nullptr);
    BatchResult dispatch(const EditAction& action, const std::vector<ClipId>& targets = {},
                         DispatchObserver* observer = nullptr) {
        return dispatch(action.tag, action.params, targets, observer);
    }

    // Runs every action in order. Invalid or unknown actions are recorded and
    // counted as failed for every target; later actions still run.
    DispatchSummary dispatch_many(const std::vector<EditAction>& actions, const std::vector<ClipId>& targets = {},
                                  DispatchObserver* observer = nullptr);

    // What the last dispatch read; empty unless it ran a read-only action
    const std::vector<ClipParameters>& readings() const { return ctx_.readings; }

private:
    ActionContext ctx_;
    std::map<std::string, std::unique_ptr<ActionHandler>> handlers_;

    ActionHandler& require(const std::string& tag) const;
    bool run_one(ActionHandler& handler, ClipId clip, const ActionParams& params, DispatchObserver* observer);
};

// "applied to 3 of 4 clips"
std::string describe(const BatchResult& result);
// "Zoom to 150%: applied to 3 of 4 clips", or the error message
std::string format_outcome(const ActionOutcome& outcome);

} // namespace ek::commands
