// End-to-end edits through the engine: recording, undo and redo
#include <catch2/catch_test_macros.hpp>
#include "engine/edit_engine.hpp"
#include "host/timeline_host.hpp"
#include "test_support.hpp"

using namespace ek;
using namespace ek::engine;
using ek::commands::ActionParams;
using ek::commands::BatchResult;
using ek::commands::EditAction;
using ek::timeline::Interpolation;
using ek::timeline::MediaType;

namespace {

struct Project {
    EditEngine engine;
    timeline::TrackId video;
    std::vector<timeline::ClipId> clips;

    explicit Project(size_t count = 1, EngineConfig config = {}, HostFactory factory = {})
        : engine(config, std::move(factory)) {
        video = engine.timeline().add_track(timeline::Track::Video, "V1");
        clips = test::add_video_clips(engine.timeline(), video, count);
    }

    const timeline::Clip& clip(size_t i = 0) const { return *engine.timeline().find_clip(clips[i]); }
};

// Wraps the local host in a FaultyHost and hands back a pointer to it
HostFactory faulty_factory(test::FaultyHost*& out) {
    return [&out](timeline::Timeline& tl, const effects::EffectRegistry& reg) {
        auto host = std::make_unique<test::FaultyHost>(std::make_unique<host::TimelineHost>(tl, reg),
                                                       std::set<timeline::ClipId>{});
        out = host.get();
        return std::unique_ptr<host::HostSurface>(std::move(host));
    };
}

} // namespace

TEST_CASE("Static zoom then undo leaves an empty history", "[engine]") {
    Project p;
    auto r = p.engine.execute("zoom", {{"scale", 150.0}});
    REQUIRE(r.result == BatchResult{1, 0});
    REQUIRE(r.recorded);
    REQUIRE(r.description == "Zoom to 150%");

    const auto* scale = p.clip().find_effect("builtin-scale");
    REQUIRE(scale);
    REQUIRE_FALSE(scale->is_animated());
    REQUIRE(scale->value_at("scale", 0.5) == 150.0);
    REQUIRE(scale->value_at("scale", 3.5) == 150.0);
    REQUIRE(p.engine.can_undo());

    auto undone = p.engine.undo();
    REQUIRE(undone.is_ok());
    REQUIRE(undone.value() == "Zoom to 150%");
    REQUIRE_FALSE(p.engine.can_undo());
    REQUIRE(p.engine.can_redo());
    REQUIRE(p.clip().transform.scale == 100.0);
    REQUIRE(p.clip().find_effect("builtin-scale") == nullptr);
}

TEST_CASE("Animated zoom undo restores the prior keyframes exactly", "[engine]") {
    Project p;
    REQUIRE(p.engine.execute("zoom", {{"scale", 120.0}, {"startScale", 90.0}, {"animated", true},
                                      {"duration", 1.0}, {"interpolation", "ease-in"}}).recorded);
    auto before = p.clip().effects;
    REQUIRE(before.size() == 1);
    REQUIRE(before[0].keyframes.size() == 2);

    auto r = p.engine.execute("zoom", {{"scale", 150.0}, {"startScale", 100.0}, {"animated", true},
                                       {"duration", 2.0}, {"interpolation", "bezier"}});
    REQUIRE(r.recorded);
    REQUIRE(p.clip().effects != before);

    REQUIRE(p.engine.undo().is_ok());
    REQUIRE(p.clip().effects == before);
    REQUIRE(p.clip().transform.scale == 120.0);

    REQUIRE(p.engine.redo().is_ok());
    auto keys = p.clip().find_effect("builtin-scale")->keyframes_for("scale");
    REQUIRE(keys.size() == 3);
    REQUIRE(keys.back().time == 2.0);
    REQUIRE(keys.back().value == 150.0);
    REQUIRE(keys.back().interpolation == Interpolation::Bezier);
}

TEST_CASE("Three edits undo to the start and redo in order", "[engine]") {
    Project p;
    auto pristine = p.engine.timeline().snapshot();

    REQUIRE(p.engine.execute("zoom", {{"scale", 150.0}}).recorded);                 // A
    auto after_a = p.engine.timeline().snapshot();
    REQUIRE(p.engine.execute("rotation", {{"degrees", 30.0}}).recorded);            // B
    auto after_b = p.engine.timeline().snapshot();
    REQUIRE(p.engine.execute("filter", {{"filter", "sepia"}, {"value", 0.6}}).recorded);  // C
    auto after_c = p.engine.timeline().snapshot();

    REQUIRE(p.engine.undo().is_ok());
    REQUIRE(*p.engine.timeline().snapshot() == *after_b);
    REQUIRE(p.engine.undo().is_ok());
    REQUIRE(*p.engine.timeline().snapshot() == *after_a);
    REQUIRE(p.engine.undo().is_ok());
    REQUIRE(*p.engine.timeline().snapshot() == *pristine);
    REQUIRE(p.engine.undo().code() == core::ErrorCode::UndoUnavailable);

    REQUIRE(p.engine.redo().value() == "Zoom to 150%");
    REQUIRE(*p.engine.timeline().snapshot() == *after_a);
    REQUIRE(p.engine.redo().is_ok());
    REQUIRE(*p.engine.timeline().snapshot() == *after_b);
    REQUIRE(p.engine.redo().is_ok());
    REQUIRE(*p.engine.timeline().snapshot() == *after_c);
    REQUIRE(p.engine.redo().is_error());

    // D after one undo clears redo
    REQUIRE(p.engine.undo().is_ok());
    REQUIRE(p.engine.can_redo());
    REQUIRE(p.engine.execute("opacity", {{"value", 50.0}}).recorded);
    REQUIRE_FALSE(p.engine.can_redo());
    REQUIRE(p.engine.undo_description() == "Set opacity to 50%");
}

TEST_CASE("Edits that change nothing are not recorded", "[engine]") {
    Project p;
    auto r = p.engine.execute("zoom", {{"scale", 100.0}});
    REQUIRE(r.result == BatchResult{1, 0});
    REQUIRE_FALSE(r.recorded);
    REQUIRE_FALSE(p.engine.can_undo());

    auto failed = p.engine.execute("cut", {{"time", 99.0}});
    REQUIRE(failed.result == BatchResult{0, 1});
    REQUIRE_FALSE(failed.recorded);
}

TEST_CASE("Validation errors propagate and record nothing", "[engine]") {
    Project p;
    REQUIRE_THROWS_AS(p.engine.execute("zoom", ActionParams{}), core::ValidationError);
    REQUIRE_THROWS_AS(p.engine.execute(EditAction{"spin", {}, "do a spin"}), core::UnknownActionError);
    REQUIRE_FALSE(p.engine.can_undo());
}

TEST_CASE("Partial batch failure is recorded as one command", "[engine]") {
    test::FaultyHost* faulty = nullptr;
    Project p(4, {}, faulty_factory(faulty));
    REQUIRE(faulty);
    faulty->set_failing({p.clips[2]});

    auto r = p.engine.execute("zoom", {{"scale", 150.0}}, p.clips);
    REQUIRE(r.result == BatchResult{3, 1});
    REQUIRE(r.recorded);
    REQUIRE(p.clip(0).transform.scale == 150.0);
    REQUIRE(p.clip(2).transform.scale == 100.0);
    REQUIRE(p.clip(3).transform.scale == 150.0);

    REQUIRE(p.engine.undo().is_ok());
    for (size_t i = 0; i < 4; ++i) {
        REQUIRE(p.clip(i).transform.scale == 100.0);
    }
    REQUIRE_FALSE(p.engine.can_undo());
}

TEST_CASE("Undo of an applied effect removes it, redo brings it back", "[engine]") {
    Project p;
    REQUIRE(p.engine.execute("applyEffect", {{"effectId", "vignette"}, {"parameters",
                                             commands::NumberMap{{"angle", 1.0}}}}).recorded);
    REQUIRE(p.clip().effects.size() == 1);

    REQUIRE(p.engine.undo().is_ok());
    REQUIRE(p.clip().effects.empty());

    REQUIRE(p.engine.redo().is_ok());
    REQUIRE(p.clip().effects.size() == 1);
    REQUIRE(p.clip().effects[0].effect_id == "vignette");
    REQUIRE(p.clip().effects[0].parameters.at("angle") == 1.0);
}

TEST_CASE("Removing an effect is undone by the snapshot", "[engine]") {
    Project p;
    REQUIRE(p.engine.execute("applyTransition", {{"transitionName", "fade_in"}}).recorded);
    auto with_fade = p.clip().effects;
    REQUIRE(with_fade.size() == 1);

    REQUIRE(p.engine.execute("removeEffect", {{"appliedEffectId", with_fade[0].id}}).recorded);
    REQUIRE(p.clip().effects.empty());
    REQUIRE(p.engine.undo().is_ok());
    REQUIRE(p.clip().effects == with_fade);
}

TEST_CASE("Project settings and structure edits round-trip", "[engine]") {
    Project p(2);
    REQUIRE(p.engine.execute("volume", {{"value", 0.4}}).recorded);
    REQUIRE(p.engine.execute("cut", {{"time", 1.0}}).recorded);
    REQUIRE(p.engine.timeline().clip_ids().size() == 3);
    REQUIRE(p.engine.execute("deleteClip", {}, {p.clips[1]}).recorded);
    REQUIRE(p.engine.timeline().clip_ids().size() == 2);

    REQUIRE(p.engine.undo().is_ok());
    REQUIRE(p.engine.timeline().clip_ids().size() == 3);
    REQUIRE(p.engine.undo().is_ok());
    REQUIRE(p.engine.timeline().clip_ids().size() == 2);
    REQUIRE(p.engine.undo().is_ok());
    REQUIRE(p.engine.timeline().playback().volume == 1.0);
}

TEST_CASE("execute_many is a single history entry", "[engine]") {
    Project p;
    std::vector<EditAction> actions{
        {"zoom", {{"scale", 150.0}}, ""},
        {"unknownThing", {}, ""},
        {"opacity", {{"value", 30.0}}, ""},
    };
    auto r = p.engine.execute_many(actions);
    REQUIRE(r.recorded);
    REQUIRE(r.summary.aggregate == BatchResult{2, 1});
    REQUIRE(p.engine.undo_description() == "Zoom to 150%, Set opacity to 30%");

    REQUIRE(p.engine.undo().is_ok());
    REQUIRE(p.clip().transform.scale == 100.0);
    REQUIRE(p.clip().transform.opacity == 100.0);
    REQUIRE_FALSE(p.engine.can_undo());
}

TEST_CASE("A clip that cannot be read back after the edit still counts as edited", "[engine]") {
    test::FaultyHost* faulty = nullptr;
    Project p(2, {}, faulty_factory(faulty));
    REQUIRE(faulty);
    faulty->fail_after_commit = true;

    auto r = p.engine.execute("zoom", {{"scale", 150.0}}, {p.clips[0]});
    REQUIRE(r.result == BatchResult{1, 0});
    REQUIRE(r.recorded);
    REQUIRE(p.clip(0).transform.scale == 150.0);

    // The host keeps failing that clip; the snapshot still carries undo and redo
    REQUIRE(p.engine.undo().is_ok());
    REQUIRE(p.clip(0).transform.scale == 100.0);
    REQUIRE(p.engine.redo().is_ok());
    REQUIRE(p.clip(0).transform.scale == 150.0);
}

TEST_CASE("A modifications list is one undoable edit", "[engine]") {
    Project p;
    REQUIRE(p.engine.execute("applyEffect", {{"effectId", "sharpen"}}).recorded);
    REQUIRE(p.engine.execute("applyEffect", {{"effectId", "vignette"}}).recorded);
    auto before = p.clip().effects;

    commands::ParameterEdits edits{{"amount", "sharpen", 4.0}, {"angle", "vignette", 1.2}};
    auto r = p.engine.execute("modifyParameter", {{"modifications", edits}});
    REQUIRE(r.result == BatchResult{1, 0});
    REQUIRE(r.recorded);
    REQUIRE(p.engine.undo_description() == "Set sharpen.amount to 4, vignette.angle to 1.2");

    REQUIRE(p.engine.undo().is_ok());
    REQUIRE(p.clip().effects == before);
    REQUIRE(p.engine.redo().is_ok());
    REQUIRE(p.clip().find_effect(before[0].id)->parameters.at("amount") == 4.0);
    REQUIRE(p.clip().find_effect(before[1].id)->parameters.at("angle") == 1.2);
}

TEST_CASE("getParameters returns readings and leaves the history alone", "[engine]") {
    Project p(2);
    auto read = p.engine.execute("getParameters", {}, p.clips);
    REQUIRE(read.result == BatchResult{2, 0});
    REQUIRE_FALSE(read.recorded);
    REQUIRE_FALSE(p.engine.can_undo());
    REQUIRE(read.description == "Read parameters");
    REQUIRE(read.readings.size() == 2);
    REQUIRE(read.readings[0].components.empty());

    REQUIRE(p.engine.execute("zoom", {{"scale", 150.0}}, {p.clips[0]}).recorded);
    read = p.engine.execute("getParameters", {}, {p.clips[0]});
    REQUIRE(read.readings.size() == 1);
    REQUIRE(read.readings[0].components.size() == 1);
    REQUIRE(read.readings[0].components[0].parameters.at("scale") == 150.0);
    REQUIRE(p.engine.undo_description() == "Zoom to 150%");

    std::vector<EditAction> actions{
        {"getParameters", {}, ""},
        {"opacity", {{"value", 30.0}}, ""},
    };
    auto many = p.engine.execute_many(actions, {p.clips[0]});
    REQUIRE(many.recorded);
    REQUIRE(many.summary.outcomes[0].readings.size() == 1);
    REQUIRE(p.engine.undo_description() == "Set opacity to 30%");
}

TEST_CASE("Loading a project clears both stacks", "[engine]") {
    Project p;
    auto start = p.engine.timeline().snapshot();
    REQUIRE(p.engine.execute("zoom", {{"scale", 150.0}}).recorded);
    REQUIRE(p.engine.execute("zoom", {{"scale", 200.0}}).recorded);
    REQUIRE(p.engine.undo().is_ok());
    REQUIRE(p.engine.can_undo());
    REQUIRE(p.engine.can_redo());

    p.engine.load(*start);
    REQUIRE_FALSE(p.engine.can_undo());
    REQUIRE_FALSE(p.engine.can_redo());
    REQUIRE(p.clip().transform.scale == 100.0);

    p.engine.reset();
    REQUIRE(p.engine.timeline().tracks().empty());
    REQUIRE(p.engine.execute("zoom", {{"scale", 150.0}}).result == BatchResult{0, 1});
}

TEST_CASE("Configured history bound and default curve", "[engine]") {
    EngineConfig config;
    config.max_history = 2;
    config.default_interpolation = Interpolation::Linear;
    config.log_level = ek::log::Level::Warn;
    Project p(1, config);

    REQUIRE(p.engine.execute("rotation", {{"degrees", 10.0}}).recorded);
    REQUIRE(p.engine.execute("rotation", {{"degrees", 20.0}}).recorded);
    REQUIRE(p.engine.execute("rotation", {{"degrees", 30.0}, {"animated", true}}).recorded);
    REQUIRE(p.engine.history().commands().size() == 2);

    auto keys = p.clip().find_effect("builtin-rotation")->keyframes_for("degrees");
    REQUIRE(keys.size() == 2);
    REQUIRE(keys[0].value == 20.0);
    REQUIRE(keys[0].interpolation == Interpolation::Linear);

    REQUIRE(p.engine.undo().is_ok());
    REQUIRE(p.engine.undo().is_ok());
    REQUIRE(p.engine.undo().is_error());
    REQUIRE(p.clip().transform.rotation == 10.0);
    ek::log::set_level(ek::log::Level::Info);
}
