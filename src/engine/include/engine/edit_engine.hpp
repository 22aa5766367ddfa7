#pragma once
#include "animation/keyframe_resolver.hpp"
#include "animation/state_capture.hpp"
#include "commands/command.hpp"
#include "commands/dispatcher.hpp"
#include "core/log.hpp"
#include "effects/effect_registry.hpp"
#include "timeline/timeline.hpp"
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ek::engine {

using timeline::ClipId;

struct EngineConfig {
    size_t max_history = 200;
    timeline::Interpolation default_interpolation = timeline::Interpolation::Bezier;
    bool log_json = false;
    log::Level log_level = log::Level::Info;
};

// Builds the host surface the engine edits through. The default is a
// host::TimelineHost over the engine's own timeline.
using HostFactory = std::function<std::unique_ptr<host::HostSurface>(timeline::Timeline&,
                                                                     const effects::EffectRegistry&)>;

// Host-level state of one clip around an edit.
struct CapturePair {
    animation::ClipCapture before;
    animation::ClipCapture after;
};

/**
 * @brief History entry for one executeAction call
 *
 * Undo reverts the host captures (last clip first) and then restores the
 * previous snapshot. Redo replays the captures and restores the next
 * snapshot. A host revert that fails is logged; the snapshot still applies.
 */
class EditCommand : public commands::SnapshotCommand {
public:
    EditCommand(std::string description, SnapshotPtr previous, SnapshotPtr next,
                animation::StateCapture& capture, std::vector<CapturePair> captures);

    bool execute(timeline::Timeline& timeline) override;
    bool undo(timeline::Timeline& timeline) override;

    const std::vector<CapturePair>& captures() const { return captures_; }

private:
    animation::StateCapture& capture_;
    std::vector<CapturePair> captures_;
};

struct ExecuteResult {
    commands::BatchResult result;
    std::string description;
    bool recorded = false;   // a history entry was pushed
    std::vector<commands::ClipParameters> readings;   // from read-only actions
};

struct ExecuteManyResult {
    commands::DispatchSummary summary;
    bool recorded = false;
};

/**
 * @brief Owns the project timeline, the dispatcher and the history
 *
 * Every execute call is one history entry, pushed only when the project state
 * actually changed. Validation and unknown-action errors propagate; host
 * failures are counted per clip.
 */
class EditEngine {
public:
    explicit EditEngine(EngineConfig config = {}, HostFactory host_factory = {});
    ~EditEngine();

    EditEngine(const EditEngine&) = delete;
    EditEngine& operator=(const EditEngine&) = delete;

    ExecuteResult execute(const commands::EditAction& action, const std::vector<ClipId>& targets = {});
    ExecuteResult execute(const std::string& tag, const commands::ActionParams& params,
                          const std::vector<ClipId>& targets = {});
    ExecuteManyResult execute_many(const std::vector<commands::EditAction>& actions,
                                   const std::vector<ClipId>& targets = {});

    core::Result<std::string> undo();
    core::Result<std::string> redo();
    bool can_undo() const { return history_.can_undo(); }
    bool can_redo() const { return history_.can_redo(); }
    std::string undo_description() const { return history_.undo_description(); }
    std::string redo_description() const { return history_.redo_description(); }

    // Replace the project; both history stacks are cleared
    void load(const timeline::Timeline::Snapshot& snapshot);
    void reset();

    timeline::Timeline& timeline() { return timeline_; }
    const timeline::Timeline& timeline() const { return timeline_; }
    effects::EffectRegistry& registry() { return registry_; }
    host::HostSurface& host() { return *host_; }
    commands::Dispatcher& dispatcher() { return *dispatcher_; }
    const commands::CommandHistory& history() const { return history_; }
    const EngineConfig& config() const { return config_; }

private:
    class CaptureObserver;

    EngineConfig config_;
    timeline::Timeline timeline_;
    effects::EffectRegistry registry_;
    std::unique_ptr<host::HostSurface> host_;
    std::unique_ptr<animation::KeyframeResolver> resolver_;
    std::unique_ptr<animation::StateCapture> capture_;
    std::unique_ptr<commands::Dispatcher> dispatcher_;
    commands::CommandHistory history_;

    bool record(const std::string& description, commands::SnapshotCommand::SnapshotPtr previous,
                std::vector<CapturePair> captures);
};

} // namespace ek::engine
