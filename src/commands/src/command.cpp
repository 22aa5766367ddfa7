#include "commands/command.hpp"
#include "config/debug.hpp"
#include "core/log.hpp"

namespace ek::commands {

SnapshotCommand::SnapshotCommand(std::string description, SnapshotPtr previous, SnapshotPtr next)
    : description_(std::move(description)), previous_(std::move(previous)), next_(std::move(next)) {}

bool SnapshotCommand::execute(timeline::Timeline& timeline) {
    if (!next_) return false;
    timeline.restore(*next_);
    return true;
}

bool SnapshotCommand::undo(timeline::Timeline& timeline) {
    if (!previous_) return false;
    timeline.restore(*previous_);
    return true;
}

bool SnapshotCommand::changes_state() const {
    if (!previous_ || !next_) return false;
    return *previous_ != *next_;
}

CommandHistory::CommandHistory(size_t max_history)
    : max_history_(max_history) {
    ek::log::debug("Created command history with max size: " + std::to_string(max_history));
}

bool CommandHistory::execute(std::unique_ptr<Command> command, timeline::Timeline& timeline) {
    if (!command) {
        ek::log::warn("Attempted to execute null command");
        return false;
    }

    bool success = command->execute(timeline);
    if (!success) {
        ek::log::warn("Command execution failed: " + command->description());
        return false;
    }

    return push(std::move(command));
}

bool CommandHistory::push(std::unique_ptr<Command> command) {
    if (!command) {
        ek::log::warn("Attempted to record null command");
        return false;
    }

    // Remove any commands after the current position (for redo branch pruning)
    if (current_index_ < commands_.size()) {
        commands_.erase(commands_.begin() + static_cast<std::ptrdiff_t>(current_index_), commands_.end());
    }

    ek::log::info("Recorded: " + command->description());
    commands_.push_back(std::move(command));
    current_index_ = commands_.size();

    trim_history();

    ek::log::debug("Command added to history. Position: " +
                   std::to_string(current_index_) + "/" + std::to_string(commands_.size()));
    return true;
}

bool CommandHistory::push_undo(const std::string& description, SnapshotCommand::SnapshotPtr previous,
                               SnapshotCommand::SnapshotPtr next) {
    auto command = std::make_unique<SnapshotCommand>(description, std::move(previous), std::move(next));
    if (!command->changes_state()) {
        ek::log::debug("State unchanged, not recording: " + description);
        return false;
    }
    return push(std::move(command));
}

core::Result<std::string> CommandHistory::undo(timeline::Timeline& timeline) {
    if (!can_undo()) {
        ek::log::debug("Cannot undo: no commands in history");
        return core::Fail<std::string>(core::ErrorCode::UndoUnavailable, "Nothing to undo");
    }

    // Get the command to undo (at current_index_ - 1)
    auto& command = commands_[current_index_ - 1];
    std::string description = command->description();

    if (!command->undo(timeline)) {
        ek::log::warn("Failed to undo command: " + description);
        return core::Fail<std::string>(core::ErrorCode::UndoUnavailable, "Cannot undo: " + description);
    }

    current_index_--;
    ek::log::info("Undid command: " + description);
    ek::log::debug("Undo successful. Position: " +
                   std::to_string(current_index_) + "/" + std::to_string(commands_.size()));
    return description;
}

core::Result<std::string> CommandHistory::redo(timeline::Timeline& timeline) {
    if (!can_redo()) {
        ek::log::debug("Cannot redo: at end of history");
        return core::Fail<std::string>(core::ErrorCode::UndoUnavailable, "Nothing to redo");
    }

    // Get the command to redo (at current_index_)
    auto& command = commands_[current_index_];
    std::string description = command->description();

    if (!command->execute(timeline)) {
        ek::log::warn("Failed to redo command: " + description);
        return core::Fail<std::string>(core::ErrorCode::UndoUnavailable, "Cannot redo: " + description);
    }

    current_index_++;
    ek::log::info("Redid command: " + description);
    ek::log::debug("Redo successful. Position: " +
                   std::to_string(current_index_) + "/" + std::to_string(commands_.size()));
    return description;
}

std::string CommandHistory::undo_description() const {
    if (!can_undo()) {
        return "";
    }
    return commands_[current_index_ - 1]->description();
}

std::string CommandHistory::redo_description() const {
    if (!can_redo()) {
        return "";
    }
    return commands_[current_index_]->description();
}

void CommandHistory::clear() {
    commands_.clear();
    current_index_ = 0;
    ek::log::debug("Command history cleared");
}

void CommandHistory::set_max_history(size_t max_history) {
    max_history_ = max_history;
    trim_history();
}

void CommandHistory::trim_history() {
    if (commands_.size() <= max_history_) {
        return;
    }

    // Remove oldest commands
    size_t excess = commands_.size() - max_history_;
    commands_.erase(commands_.begin(), commands_.begin() + static_cast<std::ptrdiff_t>(excess));

    // Adjust current index
    current_index_ = current_index_ > excess ? current_index_ - excess : 0;
    EK_ASSERT(current_index_ <= commands_.size());

    ek::log::debug("Trimmed command history. Removed " + std::to_string(excess) +
                   " old commands. New position: " + std::to_string(current_index_) +
                   "/" + std::to_string(commands_.size()));
}

} // namespace ek::commands
