// Action validation, routing and per-clip failure isolation
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "commands/dispatcher.hpp"
#include "core/log.hpp"
#include "host/timeline_host.hpp"
#include "test_support.hpp"

using namespace ek;
using namespace ek::commands;
using ek::timeline::MediaType;

namespace {

struct Fixture {
    timeline::Timeline tl;
    effects::EffectRegistry registry = effects::EffectRegistry::with_defaults();
    test::FaultyHost host{std::make_unique<host::TimelineHost>(tl, registry), {}};
    animation::KeyframeResolver resolver{host};
    Dispatcher dispatcher{tl, registry, host, resolver};
    timeline::TrackId video = tl.add_track(timeline::Track::Video, "V1");
    timeline::TrackId audio = tl.add_track(timeline::Track::Audio, "A1");
    std::vector<timeline::ClipId> clips = test::add_video_clips(tl, video, 4);

    Fixture() { register_builtin_handlers(dispatcher); }

    double scale(timeline::ClipId id) const { return tl.find_clip(id)->transform.scale; }
};

// Minimal valid parameters for every stock tag
ActionParams valid_params(const std::string& tag) {
    if (tag == "zoom") return {{"scale", 150.0}};
    if (tag == "position") return {{"x", 10.0}, {"y", 20.0}};
    if (tag == "opacity") return {{"value", 50.0}};
    if (tag == "rotation") return {{"degrees", 45.0}};
    if (tag == "filter") return {{"filter", "blur"}, {"value", 3.0}};
    if (tag == "volume") return {{"value", 0.5}};
    if (tag == "playbackRate") return {{"value", 2.0}};
    if (tag == "cut") return {{"time", 1.0}};
    if (tag == "applyEffect") return {{"effectId", "sepia"}};
    if (tag == "removeEffect") return {{"appliedEffectId", "fx-1"}};
    if (tag == "updateEffect") return {{"appliedEffectId", "fx-1"}, {"parameters", NumberMap{{"amount", 0.5}}}};
    if (tag == "toggleEffect") return {{"appliedEffectId", "fx-1"}, {"enabled", false}};
    if (tag == "applyTransition") return {{"transitionName", "fade_in"}};
    if (tag == "modifyParameter") return {{"parameterName", "scale"}, {"value", 120.0}};
    if (tag == "adjustVolume") return {{"volumeDb", -6.0}};
    return {};
}

} // namespace

TEST_CASE("Every stock tag is registered", "[dispatcher]") {
    Fixture f;
    for (const char* tag : {"zoom", "zoomIn", "zoomOut", "position", "opacity", "rotation", "filter", "volume",
                            "playbackRate", "cut", "trim", "deleteClip", "applyEffect", "removeEffect",
                            "updateEffect", "toggleEffect", "applyTransition", "modifyParameter",
                            "adjustVolume", "getParameters"}) {
        INFO(tag);
        REQUIRE(f.dispatcher.has_action(tag));
    }
    REQUIRE(f.dispatcher.available_actions().size() == 20);
}

TEST_CASE("Omitting a required parameter throws and touches nothing", "[dispatcher]") {
    Fixture f;
    auto before = f.tl.snapshot();

    for (const auto& tag : f.dispatcher.available_actions()) {
        const auto* handler = f.dispatcher.handler(tag);
        REQUIRE(handler);
        for (const auto& key : handler->required_parameters()) {
            INFO(tag << " without " << key);
            ActionParams params = valid_params(tag);
            REQUIRE(params.has(key));
            params.erase(key);
            REQUIRE_THROWS_AS(f.dispatcher.dispatch(tag, params, f.clips), core::ValidationError);
        }
    }
    REQUIRE(*before == *f.tl.snapshot());
    REQUIRE(f.host.transactions == 0);
}

TEST_CASE("Malformed parameters are validation errors", "[dispatcher]") {
    Fixture f;
    REQUIRE_THROWS_AS(f.dispatcher.dispatch("zoom", {{"scale", "big"}}, f.clips), core::ValidationError);
    REQUIRE_THROWS_AS(f.dispatcher.dispatch("zoom", {{"scale", 5000.0}}, f.clips), core::ValidationError);
    REQUIRE_THROWS_AS(f.dispatcher.dispatch("filter", {{"filter", "sparkle"}, {"value", 1.0}}), core::ValidationError);
    REQUIRE_THROWS_AS(f.dispatcher.dispatch("trim", {}), core::ValidationError);
    REQUIRE_THROWS_AS(f.dispatcher.dispatch("applyEffect", {{"effectId", "teleport"}}), core::ValidationError);
    REQUIRE_THROWS_AS(f.dispatcher.dispatch("zoom", {{"scale", 150.0}, {"interpolation", "wobble"}}),
                      core::ValidationError);
    REQUIRE_THROWS_AS(f.dispatcher.dispatch("playbackRate", {{"value", 0.0}}), core::ValidationError);
    REQUIRE_THROWS_AS(f.dispatcher.dispatch("adjustVolume", {{"volumeDb", 40.0}}), core::ValidationError);
}

TEST_CASE("Unknown tag throws UnknownActionError", "[dispatcher]") {
    Fixture f;
    REQUIRE_THROWS_AS(f.dispatcher.dispatch("teleport", {}, f.clips), core::UnknownActionError);
    try {
        f.dispatcher.dispatch("teleport", {});
    } catch (const core::UnknownActionError& e) {
        REQUIRE(e.tag() == "teleport");
        REQUIRE(e.code() == core::ErrorCode::UnknownAction);
    }
}

TEST_CASE("Single target reports one success", "[dispatcher]") {
    Fixture f;
    auto r = f.dispatcher.dispatch("zoom", {{"scale", 150.0}}, {f.clips[1]});
    REQUIRE(r == BatchResult{1, 0});
    REQUIRE(f.scale(f.clips[1]) == 150.0);
    REQUIRE(f.scale(f.clips[0]) == 100.0);
}

TEST_CASE("Host failure on one clip does not stop the batch", "[dispatcher]") {
    Fixture f;
    f.host.set_failing({f.clips[2]});

    auto r = f.dispatcher.dispatch("zoom", {{"scale", 150.0}}, f.clips);
    REQUIRE(r.successful == 3);
    REQUIRE(r.failed == 1);
    REQUIRE(f.scale(f.clips[0]) == 150.0);
    REQUIRE(f.scale(f.clips[1]) == 150.0);
    REQUIRE(f.scale(f.clips[2]) == 100.0);
    REQUIRE(f.scale(f.clips[3]) == 150.0);
    REQUIRE(describe(r) == "applied to 3 of 4 clips");
}

TEST_CASE("Explicit clipId overrides targets, empty targets use the active clip", "[dispatcher]") {
    Fixture f;
    auto r = f.dispatcher.dispatch("opacity", {{"value", 40.0}, {"clipId", static_cast<double>(f.clips[3])}},
                                   {f.clips[0], f.clips[1]});
    REQUIRE(r == BatchResult{1, 0});
    REQUIRE(f.tl.find_clip(f.clips[3])->transform.opacity == 40.0);
    REQUIRE(f.tl.find_clip(f.clips[0])->transform.opacity == 100.0);

    r = f.dispatcher.dispatch("rotation", {{"degrees", 90.0}});
    REQUIRE(r == BatchResult{1, 0});
    REQUIRE(f.tl.find_clip(f.clips[0])->transform.rotation == 90.0);

    f.tl.select_clip(f.clips[2]);
    REQUIRE(f.dispatcher.dispatch("rotation", {{"degrees", 10.0}}) == BatchResult{1, 0});
    REQUIRE(f.tl.find_clip(f.clips[2])->transform.rotation == 10.0);
}

TEST_CASE("No active clip counts as one failure", "[dispatcher]") {
    timeline::Timeline tl;
    auto registry = effects::EffectRegistry::with_defaults();
    host::TimelineHost host(tl, registry);
    animation::KeyframeResolver resolver(host);
    Dispatcher dispatcher(tl, registry, host, resolver);
    register_builtin_handlers(dispatcher);

    REQUIRE(dispatcher.dispatch("zoom", {{"scale", 150.0}}) == BatchResult{0, 1});
}

TEST_CASE("Project-scoped actions run once", "[dispatcher]") {
    Fixture f;
    REQUIRE(f.dispatcher.dispatch("volume", {{"value", 0.25}}, f.clips) == BatchResult{1, 0});
    REQUIRE(f.tl.playback().volume == 0.25);
    REQUIRE(f.dispatcher.dispatch("playbackRate", {{"value", 1.5}}) == BatchResult{1, 0});
    REQUIRE(f.tl.playback().playback_rate == 1.5);
}

TEST_CASE("Filter values land on the named reserved entry", "[dispatcher]") {
    Fixture f;
    REQUIRE(f.dispatcher.dispatch("filter", {{"filter", "brightness"}, {"value", 1.5}}, {f.clips[0]}) ==
            BatchResult{1, 0});
    const auto* entry = test::find_effect(f.tl, f.clips[0], "builtin-brightness");
    REQUIRE(entry);
    REQUIRE(entry->parameters.at("brightness") == Catch::Approx(0.5));
    REQUIRE(f.tl.find_clip(f.clips[0])->transform.filters.brightness == Catch::Approx(1.5));
}

TEST_CASE("Animated position moves both axes", "[dispatcher]") {
    Fixture f;
    auto r = f.dispatcher.dispatch("position", {{"x", 100.0}, {"y", -50.0}, {"animated", true}, {"duration", 2.0},
                                                {"interpolation", "linear"}}, {f.clips[1]});
    REQUIRE(r == BatchResult{1, 0});
    const auto* entry = test::find_effect(f.tl, f.clips[1], "builtin-position");
    REQUIRE(entry);
    auto xs = entry->keyframes_for("positionX");
    auto ys = entry->keyframes_for("positionY");
    REQUIRE(xs.size() == 2);
    REQUIRE(ys.size() == 2);
    REQUIRE(xs[0].time == 4.0);
    REQUIRE(xs[1].time == 6.0);
    REQUIRE(xs[1].value == 100.0);
    REQUIRE(ys[1].value == -50.0);
    REQUIRE(xs[0].interpolation == timeline::Interpolation::Linear);
}

TEST_CASE("zoomIn animates between stock scales", "[dispatcher]") {
    Fixture f;
    REQUIRE(f.dispatcher.dispatch("zoomIn", {}, {f.clips[0]}) == BatchResult{1, 0});
    auto keys = test::find_effect(f.tl, f.clips[0], "builtin-scale")->keyframes_for("scale");
    REQUIRE(keys.size() == 2);
    REQUIRE(keys[0].value == 100.0);
    REQUIRE(keys[1].value == 150.0);
    REQUIRE(keys[1].time == 4.0);

    REQUIRE(f.dispatcher.dispatch("zoomOut", {{"animated", false}}, {f.clips[1]}) == BatchResult{1, 0});
    REQUIRE(f.scale(f.clips[1]) == 100.0);
    REQUIRE(test::find_effect(f.tl, f.clips[1], "builtin-scale") == nullptr);
}

TEST_CASE("Effect lifecycle through apply, update, toggle and remove", "[dispatcher]") {
    Fixture f;
    auto clip = f.clips[0];
    REQUIRE(f.dispatcher.dispatch("applyEffect", {{"effectId", "vignette"}}, {clip}) == BatchResult{1, 0});
    const auto* entry = test::find_effect(f.tl, clip, "fx-1");
    REQUIRE(entry);
    REQUIRE(entry->parameters.at("angle") == 0.5);

    REQUIRE(f.dispatcher.dispatch("updateEffect", {{"appliedEffectId", "fx-1"},
                                                   {"parameters", NumberMap{{"angle", 1.2}}}}, {clip}) ==
            BatchResult{1, 0});
    REQUIRE(test::find_effect(f.tl, clip, "fx-1")->parameters.at("angle") == 1.2);

    REQUIRE(f.dispatcher.dispatch("toggleEffect", {{"appliedEffectId", "fx-1"}, {"enabled", false}}, {clip}) ==
            BatchResult{1, 0});
    REQUIRE_FALSE(test::find_effect(f.tl, clip, "fx-1")->enabled);

    REQUIRE(f.dispatcher.dispatch("removeEffect", {{"appliedEffectId", "fx-1"}}, {clip}) == BatchResult{1, 0});
    REQUIRE(test::find_effect(f.tl, clip, "fx-1") == nullptr);
    REQUIRE(f.dispatcher.dispatch("removeEffect", {{"appliedEffectId", "fx-1"}}, {clip}) == BatchResult{0, 1});
}

TEST_CASE("Applying a builtin-bound effect merges into the reserved entry", "[dispatcher]") {
    Fixture f;
    auto clip = f.clips[0];
    REQUIRE(f.dispatcher.dispatch("filter", {{"filter", "blur"}, {"value", 2.0}}, {clip}) == BatchResult{1, 0});
    REQUIRE(f.dispatcher.dispatch("applyEffect", {{"effectId", "gaussian_blur"},
                                                  {"parameters", NumberMap{{"sigma", 8.0}}}}, {clip}) ==
            BatchResult{1, 0});

    const auto& effects = f.tl.find_clip(clip)->effects;
    REQUIRE(effects.size() == 1);
    REQUIRE(effects[0].id == "builtin-blur");
    REQUIRE(effects[0].parameters.at("sigma") == 8.0);
    REQUIRE(f.tl.find_clip(clip)->transform.filters.blur == 8.0);
}

TEST_CASE("Transitions are placed at the clip edge", "[dispatcher]") {
    Fixture f;
    auto clip = f.clips[0];
    REQUIRE(f.dispatcher.dispatch("applyTransition", {{"transitionName", "Cross Dissolve"}, {"duration", 1.5},
                                                      {"applyToStart", false}}, {clip}) == BatchResult{1, 0});
    REQUIRE(f.dispatcher.dispatch("applyTransition", {{"transitionName", "fade_out"}}, {clip}) == BatchResult{1, 0});

    const auto& effects = f.tl.find_clip(clip)->effects;
    REQUIRE(effects.size() == 2);
    REQUIRE(effects[0].effect_id == "cross_dissolve");
    REQUIRE(effects[0].parameters.at("duration") == 1.5);
    REQUIRE(effects[0].parameters.at("offset") == 2.5);
    REQUIRE(effects[1].effect_id == "fade_out");
    REQUIRE(effects[1].parameters.at("start") == 3.0);
    REQUIRE_THROWS_AS(f.dispatcher.dispatch("applyTransition", {{"transitionName", "wipe"}}, {clip}),
                      core::ValidationError);
}

TEST_CASE("Cut, trim and delete edit the structure", "[dispatcher]") {
    Fixture f;
    REQUIRE(f.dispatcher.dispatch("cut", {{"time", 2.0}}, {f.clips[0]}) == BatchResult{1, 0});
    REQUIRE(f.tl.get_track(f.video)->clips().size() == 5);
    REQUIRE(f.dispatcher.dispatch("cut", {{"time", 30.0}}, {f.clips[1]}) == BatchResult{0, 1});

    REQUIRE(f.dispatcher.dispatch("trim", {{"end", 3.0}}, {f.clips[3]}) == BatchResult{1, 0});
    REQUIRE(f.tl.find_clip(f.clips[3])->source_end == 3.0);

    REQUIRE(f.dispatcher.dispatch("deleteClip", {}, {f.clips[1], 4242}) == BatchResult{1, 1});
    REQUIRE(f.tl.find_clip(f.clips[1]) == nullptr);
}

TEST_CASE("Generic parameter changes skip builtins unless asked", "[dispatcher]") {
    Fixture f;
    auto clip = f.clips[0];
    REQUIRE(f.dispatcher.dispatch("modifyParameter", {{"parameterName", "scale"}, {"value", 120.0}}, {clip}) ==
            BatchResult{0, 1});

    REQUIRE(f.dispatcher.dispatch("modifyParameter", {{"parameterName", "scale"}, {"value", 120.0},
                                                      {"excludeBuiltIn", false}}, {clip}) == BatchResult{1, 0});
    REQUIRE(f.scale(clip) == 120.0);

    REQUIRE(f.dispatcher.dispatch("applyEffect", {{"effectId", "sharpen"}}, {clip}) == BatchResult{1, 0});
    REQUIRE(f.dispatcher.dispatch("modifyParameter", {{"componentName", "sharpen"}, {"parameterName", "amount"},
                                                      {"value", 4.0}, {"animated", true}, {"startValue", 0.0}},
                                  {clip}) == BatchResult{1, 0});
    auto keys = test::find_effect(f.tl, clip, "fx-1")->keyframes_for("amount");
    REQUIRE(keys.size() == 2);
    REQUIRE(keys[0].value == 0.0);
    REQUIRE(keys[1].value == 4.0);
    REQUIRE(keys[0].interpolation == timeline::Interpolation::Bezier);
}

TEST_CASE("Clip gain applies to audio clips only", "[dispatcher]") {
    Fixture f;
    auto voice = f.tl.add_clip(f.audio, test::make_clip(MediaType::Audio, 0.0, 6.0));
    REQUIRE(f.dispatcher.dispatch("adjustVolume", {{"volumeDb", -6.0}}, {voice, f.clips[0]}) == BatchResult{1, 1});
    REQUIRE(f.dispatcher.dispatch("adjustVolume", {{"volumeDb", 3.0}}, {voice}) == BatchResult{1, 0});

    const auto& effects = f.tl.find_clip(voice)->effects;
    REQUIRE(effects.size() == 1);
    REQUIRE(effects[0].effect_id == "audio_gain");
    REQUIRE(effects[0].parameters.at("gain_db") == 3.0);
}

TEST_CASE("dispatch_many records failures and keeps going", "[dispatcher]") {
    Fixture f;
    std::vector<EditAction> actions{
        {"zoom", {{"scale", 150.0}}, "zoom in"},
        {"teleport", {}, ""},
        {"opacity", {}, "missing value"},
        {"rotation", {{"degrees", 30.0}}, ""},
    };
    auto summary = f.dispatcher.dispatch_many(actions, {f.clips[0], f.clips[1]});

    REQUIRE(summary.outcomes.size() == 4);
    REQUIRE(summary.outcomes[0].result == BatchResult{2, 0});
    REQUIRE(summary.outcomes[0].description == "Zoom to 150%");
    REQUIRE(summary.outcomes[1].error);
    REQUIRE(summary.outcomes[1].error->code == core::ErrorCode::UnknownAction);
    REQUIRE(summary.outcomes[1].result == BatchResult{0, 2});
    REQUIRE(summary.outcomes[2].error->code == core::ErrorCode::Validation);
    REQUIRE(summary.outcomes[3].result == BatchResult{2, 0});
    REQUIRE(summary.aggregate == BatchResult{4, 4});
    REQUIRE(format_outcome(summary.outcomes[0]) == "Zoom to 150%: applied to 2 of 2 clips");
    REQUIRE(f.tl.find_clip(f.clips[1])->transform.rotation == 30.0);
}

TEST_CASE("clipId must be a positive integer a double holds exactly", "[dispatcher]") {
    Fixture f;
    auto before = f.tl.snapshot();
    for (double id : {0.0, -3.0, 2.5, 1e30, 9007199254740994.0}) {
        INFO(id);
        REQUIRE_THROWS_AS(f.dispatcher.dispatch("zoom", {{"scale", 150.0}, {"clipId", id}}, f.clips),
                          core::ValidationError);
    }
    REQUIRE(*before == *f.tl.snapshot());

    REQUIRE(ActionParams{{"clipId", 9007199254740992.0}}.clip_id() == 9007199254740992ULL);
    REQUIRE(f.dispatcher.dispatch("zoom", {{"scale", 150.0}, {"clipId", 9007199254740992.0}}) ==
            BatchResult{0, 1});
}

TEST_CASE("A modifications list lands in one transaction", "[dispatcher]") {
    Fixture f;
    auto clip = f.clips[0];
    REQUIRE(f.dispatcher.dispatch("applyEffect", {{"effectId", "sharpen"}}, {clip}) == BatchResult{1, 0});
    REQUIRE(f.dispatcher.dispatch("applyEffect", {{"effectId", "vignette"}}, {clip}) == BatchResult{1, 0});

    ParameterEdits edits{{"amount", "sharpen", 4.0}, {"angle", "", 1.2}};
    REQUIRE(f.dispatcher.handler("modifyParameter")->describe({{"modifications", edits}}) ==
            "Set sharpen.amount to 4, angle to 1.2");

    size_t transactions = f.host.transactions;
    REQUIRE(f.dispatcher.dispatch("modifyParameter", {{"modifications", edits}}, {clip}) == BatchResult{1, 0});
    REQUIRE(f.host.transactions == transactions + 1);
    REQUIRE(test::find_effect(f.tl, clip, "fx-1")->parameters.at("amount") == 4.0);
    REQUIRE(test::find_effect(f.tl, clip, "fx-2")->parameters.at("angle") == 1.2);

    SECTION("one unresolvable entry leaves the clip as it was") {
        auto before = f.tl.snapshot();
        ParameterEdits partial{{"amount", "sharpen", 2.0}, {"warp", "", 3.0}};
        REQUIRE(f.dispatcher.dispatch("modifyParameter", {{"modifications", partial}}, {clip}) ==
                BatchResult{0, 1});
        REQUIRE(*before == *f.tl.snapshot());
        REQUIRE(test::find_effect(f.tl, clip, "fx-1")->parameters.at("amount") == 4.0);
    }

    SECTION("the list wins over a single parameterName") {
        ParameterEdits one{{"amount", "sharpen", 6.0}};
        REQUIRE(f.dispatcher.dispatch("modifyParameter", {{"modifications", one}, {"parameterName", "angle"},
                                                          {"value", 0.1}}, {clip}) == BatchResult{1, 0});
        REQUIRE(test::find_effect(f.tl, clip, "fx-1")->parameters.at("amount") == 6.0);
        REQUIRE(test::find_effect(f.tl, clip, "fx-2")->parameters.at("angle") == 1.2);
    }

    SECTION("malformed lists are rejected up front") {
        REQUIRE_THROWS_AS(f.dispatcher.dispatch("modifyParameter", {{"modifications", ParameterEdits{}}}, {clip}),
                          core::ValidationError);
        REQUIRE_THROWS_AS(f.dispatcher.dispatch("modifyParameter",
                                                {{"modifications", ParameterEdits{{"", "sharpen", 1.0}}}}, {clip}),
                          core::ValidationError);
        REQUIRE_THROWS_AS(f.dispatcher.dispatch("modifyParameter", {{"modifications", 3.0}}, {clip}),
                          core::ValidationError);
        REQUIRE_THROWS_AS(f.dispatcher.dispatch("modifyParameter", {{"value", 3.0}}, {clip}),
                          core::ValidationError);
        REQUIRE_THROWS_AS(f.dispatcher.dispatch("modifyParameter", {{"parameterName", "amount"}}, {clip}),
                          core::ValidationError);
    }
}

TEST_CASE("getParameters reads components without editing", "[dispatcher]") {
    Fixture f;
    auto clip = f.clips[0];
    REQUIRE(f.dispatcher.dispatch("zoom", {{"scale", 150.0}}, {clip}) == BatchResult{1, 0});
    REQUIRE(f.dispatcher.dispatch("applyEffect", {{"effectId", "vignette"}}, {clip}) == BatchResult{1, 0});
    REQUIRE(f.dispatcher.handler("getParameters")->read_only());

    auto before = f.tl.snapshot();
    size_t transactions = f.host.transactions;
    REQUIRE(f.dispatcher.dispatch("getParameters", {}, {clip, f.clips[1]}) == BatchResult{2, 0});
    REQUIRE(*before == *f.tl.snapshot());
    REQUIRE(f.host.transactions == transactions);

    const auto& readings = f.dispatcher.readings();
    REQUIRE(readings.size() == 2);
    REQUIRE(readings[0].clip == clip);
    REQUIRE(readings[0].components.size() == 2);
    for (const auto& component : readings[0].components) {
        if (component.builtin) {
            REQUIRE(component.id == "builtin-scale");
            REQUIRE(component.parameters.at("scale") == 150.0);
        } else {
            REQUIRE(component.effect_id == "vignette");
            REQUIRE(component.parameters.at("angle") == 0.5);
        }
    }
    REQUIRE(readings[1].clip == f.clips[1]);
    REQUIRE(readings[1].components.empty());

    REQUIRE(f.dispatcher.dispatch("getParameters", {{"excludeBuiltIn", true}}, {clip}) == BatchResult{1, 0});
    REQUIRE(f.dispatcher.readings().size() == 1);
    REQUIRE(f.dispatcher.readings()[0].components.size() == 1);
    REQUIRE(f.dispatcher.readings()[0].components[0].effect_id == "vignette");

    f.host.set_failing({clip});
    REQUIRE(f.dispatcher.dispatch("getParameters", {}, {clip, f.clips[1]}) == BatchResult{1, 1});
    REQUIRE(f.dispatcher.readings().size() == 1);

    f.host.set_failing({});
    REQUIRE(f.dispatcher.dispatch("rotation", {{"degrees", 30.0}}, {clip}) == BatchResult{1, 0});
    REQUIRE(f.dispatcher.readings().empty());
}

TEST_CASE("Applying a builtin-bound effect at its defaults changes nothing", "[dispatcher]") {
    Fixture f;
    auto clip = f.clips[0];
    REQUIRE(f.dispatcher.dispatch("applyEffect", {{"effectId", "scale"}}, {clip}) == BatchResult{0, 1});
    REQUIRE(f.tl.find_clip(clip)->effects.empty());

    REQUIRE(f.dispatcher.dispatch("applyEffect", {{"effectId", "scale"}, {"parameters", NumberMap{{"scale", 150.0}}}},
                                  {clip}) == BatchResult{1, 0});
    REQUIRE(f.scale(clip) == 150.0);

    // Back to the default is a real change
    REQUIRE(f.dispatcher.dispatch("applyEffect", {{"effectId", "scale"}, {"parameters", NumberMap{{"scale", 100.0}}}},
                                  {clip}) == BatchResult{1, 0});
    REQUIRE(f.scale(clip) == 100.0);
    REQUIRE(f.tl.find_clip(clip)->effects.empty());
}

namespace {

struct ThrowingObserver : DispatchObserver {
    bool throw_before = false;

    void before_action(const ActionHandler&, const ActionContext&, ClipId, const ActionParams&) override {
        if (throw_before) throw core::HostOperationError("before");
    }
    void after_action(const ActionHandler&, const ActionContext&, ClipId, const ActionParams&, bool) override {
        throw core::HostOperationError("state lost");
    }
};

} // namespace

TEST_CASE("An observer error after the edit keeps the clip a success", "[dispatcher]") {
    Fixture f;
    ThrowingObserver observer;
    REQUIRE(f.dispatcher.dispatch("zoom", {{"scale", 150.0}}, {f.clips[0]}, &observer) == BatchResult{1, 0});
    REQUIRE(f.scale(f.clips[0]) == 150.0);

    observer.throw_before = true;
    REQUIRE(f.dispatcher.dispatch("zoom", {{"scale", 150.0}}, {f.clips[1]}, &observer) == BatchResult{0, 1});
    REQUIRE(f.scale(f.clips[1]) == 100.0);
}

TEST_CASE("A failing clip is reported as a warning", "[dispatcher]") {
    Fixture f;
    std::vector<std::string> warnings;
    ek::log::set_sink([&warnings](ek::log::Level lvl, const std::string& msg) {
        if (lvl == ek::log::Level::Warn) warnings.push_back(msg);
    });
    f.host.set_failing({f.clips[1]});
    auto result = f.dispatcher.dispatch("zoom", {{"scale", 150.0}}, f.clips);
    ek::log::set_sink({});

    REQUIRE(result == BatchResult{3, 1});
    const std::string expected = "zoom failed on clip " + std::to_string(f.clips[1]);
    bool found = false;
    for (const auto& w : warnings) found = found || w.find(expected) != std::string::npos;
    REQUIRE(found);
}
