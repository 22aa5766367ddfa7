#pragma once
#include "core/result.hpp"
#include "timeline/timeline.hpp"
#include <memory>
#include <string>
#include <vector>

namespace ek::commands {

/**
 * @brief Base class for all recorded edits
 *
 * Implements the Command pattern for undo/redo functionality.
 * All timeline modifications should go through the command system.
 */
class Command {
public:
    virtual ~Command() = default;

    /**
     * @brief Apply (or re-apply) the command
     * @param timeline The timeline to execute the command on
     * @return true if successful, false otherwise
     */
    virtual bool execute(timeline::Timeline& timeline) = 0;

    /**
     * @brief Undo the command
     * @param timeline The timeline to undo the command on
     * @return true if successful, false otherwise
     */
    virtual bool undo(timeline::Timeline& timeline) = 0;

    /**
     * @brief Get a human-readable description of the command
     * @return Command description for UI display
     */
    virtual std::string description() const = 0;
};

/**
 * @brief Command holding the project state before and after an edit
 *
 * Undo restores the previous snapshot, execute the next one.
 */
class SnapshotCommand : public Command {
public:
    using SnapshotPtr = std::shared_ptr<const timeline::Timeline::Snapshot>;

    SnapshotCommand(std::string description, SnapshotPtr previous, SnapshotPtr next);

    bool execute(timeline::Timeline& timeline) override;
    bool undo(timeline::Timeline& timeline) override;
    std::string description() const override { return description_; }

    const SnapshotPtr& previous_state() const { return previous_; }
    const SnapshotPtr& next_state() const { return next_; }
    // Structural comparison of the two snapshots
    bool changes_state() const;

private:
    std::string description_;
    SnapshotPtr previous_;
    SnapshotPtr next_;
};

/**
 * @brief Manages command history and provides undo/redo functionality
 *
 * Commands before undo_count() form the undo stack, the ones after it the
 * redo stack. Recording a new command drops the redo branch.
 */
class CommandHistory {
public:
    explicit CommandHistory(size_t max_history = 200);

    /**
     * @brief Execute a command and add it to history
     * @param command The command to execute
     * @param timeline The timeline to execute on
     * @return true if successful
     */
    bool execute(std::unique_ptr<Command> command, timeline::Timeline& timeline);

    /**
     * @brief Record an already applied command
     * @return false when the command is null
     */
    bool push(std::unique_ptr<Command> command);

    /**
     * @brief Record an edit given its before/after snapshots
     * @return false (nothing recorded) when the snapshots are structurally equal
     */
    bool push_undo(const std::string& description, SnapshotCommand::SnapshotPtr previous,
                   SnapshotCommand::SnapshotPtr next);

    /**
     * @brief Undo the last command
     * @return Description of the undone command, or UndoUnavailable
     */
    core::Result<std::string> undo(timeline::Timeline& timeline);

    /**
     * @brief Redo the next command
     * @return Description of the redone command, or UndoUnavailable
     */
    core::Result<std::string> redo(timeline::Timeline& timeline);

    bool can_undo() const { return current_index_ > 0; }
    bool can_redo() const { return current_index_ < commands_.size(); }

    /**
     * @brief Get the description of the command that would be undone
     */
    std::string undo_description() const;

    /**
     * @brief Get the description of the command that would be redone
     */
    std::string redo_description() const;

    /**
     * @brief Clear both stacks
     */
    void clear();

    const std::vector<std::unique_ptr<Command>>& commands() const { return commands_; }
    size_t undo_count() const { return current_index_; }
    size_t redo_count() const { return commands_.size() - current_index_; }

    size_t max_history() const { return max_history_; }
    void set_max_history(size_t max_history);

private:
    std::vector<std::unique_ptr<Command>> commands_;
    size_t current_index_{0};
    size_t max_history_;

    /**
     * @brief Remove old commands when history exceeds maximum
     */
    void trim_history();
};

} // namespace ek::commands
