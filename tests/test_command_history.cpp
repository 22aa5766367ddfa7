// Tests for snapshot commands and undo/redo bookkeeping
#include <catch2/catch_test_macros.hpp>
#include "commands/command.hpp"
#include "test_support.hpp"

using namespace ek;
using namespace ek::commands;
using ek::timeline::MediaType;

namespace {

// Records one clip insertion as a snapshot command
std::unique_ptr<SnapshotCommand> add_clip_command(timeline::Timeline& tl, timeline::TrackId track, Seconds at,
                                                  const std::string& name) {
    auto before = tl.snapshot();
    REQUIRE(tl.add_clip(track, test::make_clip(MediaType::Video, at, 1.0, name)) != 0);
    return std::make_unique<SnapshotCommand>(name, before, tl.snapshot());
}

} // namespace

TEST_CASE("Empty history reports nothing to undo", "[history]") {
    timeline::Timeline tl;
    CommandHistory history;
    REQUIRE_FALSE(history.can_undo());
    REQUIRE_FALSE(history.can_redo());

    auto u = history.undo(tl);
    REQUIRE(u.is_error());
    REQUIRE(u.code() == core::ErrorCode::UndoUnavailable);
    REQUIRE(u.message() == "Nothing to undo");
    auto r = history.redo(tl);
    REQUIRE(r.is_error());
    REQUIRE(r.message() == "Nothing to redo");
    REQUIRE(history.undo_description().empty());
}

TEST_CASE("push_undo records only structural changes", "[history]") {
    timeline::Timeline tl;
    auto v = tl.add_track(timeline::Track::Video, "V1");
    CommandHistory history;

    auto same = tl.snapshot();
    REQUIRE_FALSE(history.push_undo("noop", same, tl.snapshot()));
    REQUIRE_FALSE(history.can_undo());

    auto before = tl.snapshot();
    REQUIRE(tl.add_clip(v, test::make_clip(MediaType::Video, 0.0, 1.0)) != 0);
    REQUIRE(history.push_undo("Add clip", before, tl.snapshot()));
    REQUIRE(history.can_undo());
    REQUIRE(history.undo_description() == "Add clip");
}

TEST_CASE("Undo and redo walk the history in order", "[history]") {
    timeline::Timeline tl;
    auto v = tl.add_track(timeline::Track::Video, "V1");
    auto pristine = tl.snapshot();
    CommandHistory history;

    REQUIRE(history.push(add_clip_command(tl, v, 0.0, "A")));
    REQUIRE(history.push(add_clip_command(tl, v, 1.0, "B")));
    REQUIRE(history.push(add_clip_command(tl, v, 2.0, "C")));
    auto latest = tl.snapshot();

    REQUIRE(history.undo(tl).value() == "C");
    REQUIRE(history.undo(tl).value() == "B");
    REQUIRE(history.undo(tl).value() == "A");
    REQUIRE(*tl.snapshot() == *pristine);
    REQUIRE_FALSE(history.can_undo());
    REQUIRE(history.redo_count() == 3);

    REQUIRE(history.redo(tl).value() == "A");
    REQUIRE(history.redo(tl).value() == "B");
    REQUIRE(history.redo(tl).value() == "C");
    REQUIRE(*tl.snapshot() == *latest);
    REQUIRE_FALSE(history.can_redo());
}

TEST_CASE("A new command clears the redo branch", "[history]") {
    timeline::Timeline tl;
    auto v = tl.add_track(timeline::Track::Video, "V1");
    CommandHistory history;

    REQUIRE(history.push(add_clip_command(tl, v, 0.0, "A")));
    REQUIRE(history.push(add_clip_command(tl, v, 1.0, "B")));
    REQUIRE(history.undo(tl).is_ok());
    REQUIRE(history.can_redo());

    REQUIRE(history.push(add_clip_command(tl, v, 5.0, "D")));
    REQUIRE_FALSE(history.can_redo());
    REQUIRE(history.undo_count() == 2);
    REQUIRE(history.undo_description() == "D");
}

TEST_CASE("History is bounded and drops the oldest entries", "[history]") {
    timeline::Timeline tl;
    auto v = tl.add_track(timeline::Track::Video, "V1");
    CommandHistory history(3);

    for (int i = 0; i < 5; ++i) {
        REQUIRE(history.push(add_clip_command(tl, v, i * 1.0, "edit " + std::to_string(i))));
    }
    REQUIRE(history.commands().size() == 3);
    REQUIRE(history.undo_count() == 3);
    REQUIRE(history.commands().front()->description() == "edit 2");

    history.set_max_history(1);
    REQUIRE(history.commands().size() == 1);
    REQUIRE(history.undo_description() == "edit 4");
}

TEST_CASE("execute applies the command before recording it", "[history]") {
    timeline::Timeline tl;
    auto v = tl.add_track(timeline::Track::Video, "V1");
    CommandHistory history;

    auto cmd = add_clip_command(tl, v, 0.0, "A");
    auto applied = cmd->next_state();
    REQUIRE(history.undo(tl).is_error());
    tl.restore(*cmd->previous_state());

    REQUIRE(history.execute(std::move(cmd), tl));
    REQUIRE(*tl.snapshot() == *applied);
    REQUIRE_FALSE(history.execute(nullptr, tl));

    history.clear();
    REQUIRE_FALSE(history.can_undo());
    REQUIRE_FALSE(history.can_redo());
}
