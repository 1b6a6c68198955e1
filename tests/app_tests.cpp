#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/core/corridor.hpp"
#include <ecs/ecs.hpp>
#include <algorithm>
#include <string>
#include <vector>

// Scheduler behaviour without any game code: stages, events, states,
// deferred commands and archetype notification.

using namespace corridor;

namespace {

enum class Mode : std::uint32_t { Preload, Play };

struct Counter {
    int value = 0;
};

struct Trace {
    std::vector<std::string> log;
    std::vector<int>         order;
};

struct Marker {};
struct Tag {};
struct Extra {};

// Built from the world by init_resource().
struct Seeded {
    int from_counter = -1;
    explicit Seeded(ecs::World& w) : from_counter(w.resource<Counter>().value) {}
};

void push(Context& ctx, const char* what) { ctx.resource<Trace>().log.emplace_back(what); }

int count_markers(ecs::World& world) {
    int n = 0;
    world.each<Marker>([&](ecs::Entity, Marker&) { ++n; });
    return n;
}

} // namespace

// ---------------------------------------------------------------------------
// Scheduler tick
// ---------------------------------------------------------------------------

TEST_CASE("Each tick runs a stateless system exactly once", "[scheduler]") {
    const int n = GENERATE(0, 1, 7);

    App app = App::create()
        .insert_resource(Counter{})
        .add_system([](Context& ctx) { ctx.resource<Counter>().value++; })
        .build();

    for (int i = 0; i < n; ++i) app.tick();

    CHECK(app.resource<Counter>().value == n);
    CHECK(app.frame() == static_cast<std::uint64_t>(n));
}

TEST_CASE("Systems run in stage order, registration order within a stage", "[scheduler]") {
    App app = App::create()
        .insert_resource(Trace{})
        .add_system_to_stage(Stage::First,     [](Context& c) { c.resource<Trace>().order.push_back(1); })
        .add_system_to_stage(Stage::Update,    [](Context& c) { c.resource<Trace>().order.push_back(10); })
        .add_system_to_stage(Stage::PreUpdate, [](Context& c) { c.resource<Trace>().order.push_back(100); })
        .add_system_to_stage(Stage::Update,    [](Context& c) { c.resource<Trace>().order.push_back(11); })
        .build();

    app.tick();
    CHECK(app.resource<Trace>().order == std::vector<int>{1, 100, 10, 11});

    app.tick();
    CHECK(app.resource<Trace>().order == std::vector<int>{1, 100, 10, 11, 1, 100, 10, 11});
}

TEST_CASE("FrameClock advances after the stage sweep", "[scheduler]") {
    App app = App::create()
        .insert_resource(Counter{})
        .add_system([](Context& ctx) {
            // The sweep sees the frame number from before the advance.
            ctx.resource<Counter>().value = static_cast<int>(ctx.clock().frame);
        })
        .build();

    app.resource<FrameClock>().delta = 0.5f;
    app.tick();
    app.tick();

    CHECK(app.resource<Counter>().value == 1);
    CHECK(app.frame() == 2);
    CHECK_THAT(app.resource<FrameClock>().elapsed, Catch::Matchers::WithinRel(1.0, 1e-9));
}

TEST_CASE("Deferred spawns are visible to the next system in the same tick", "[scheduler]") {
    App app = App::create()
        .insert_resource(Counter{})
        .add_system([](Context& ctx) { ctx.commands().create_with(Marker{}); })
        .add_system([](Context& ctx) { ctx.resource<Counter>().value = count_markers(ctx.world()); })
        .build();

    app.tick();
    CHECK(app.resource<Counter>().value == 1);

    app.tick();
    CHECK(app.resource<Counter>().value == 2);
}

TEST_CASE("Startup systems run once, before the first tick, each flushed", "[scheduler]") {
    App app = App::create()
        .insert_resource(Counter{})
        .add_startup_system([](Context& ctx) { ctx.commands().create_with(Marker{}); })
        .add_startup_system([](Context& ctx) { ctx.resource<Counter>().value += count_markers(ctx.world()); })
        .build();

    CHECK(app.resource<Counter>().value == 1);
    CHECK(app.system_count() == 0);

    app.tick();
    app.tick();
    CHECK(app.resource<Counter>().value == 1);
}

// ---------------------------------------------------------------------------
// Event channel
// ---------------------------------------------------------------------------

TEST_CASE("Events live for exactly one tick", "[events]") {
    App app = App::create()
        .insert_resource(Counter{})
        .add_event<int>()
        .add_system([](Context& ctx) {
            for (int v : ctx.read<int>()) ctx.resource<Counter>().value += v;
        })
        .build();

    app.emit_event(5);
    app.tick();
    CHECK(app.resource<Counter>().value == 5);

    app.tick();
    CHECK(app.resource<Counter>().value == 5);
    CHECK(app.events<int>().empty());
}

TEST_CASE("Events reach later stages, never the next tick's earlier ones", "[events]") {
    struct Seen {
        std::vector<std::size_t> before;
        std::vector<std::size_t> after;
    };

    App app = App::create()
        .insert_resource(Seen{})
        .add_event<int>()
        .add_system_to_stage(Stage::PreUpdate,  [](Context& c) { c.resource<Seen>().before.push_back(c.read<int>().size()); })
        .add_system_to_stage(Stage::Update,     [](Context& c) { c.emit(1); })
        .add_system_to_stage(Stage::PostUpdate, [](Context& c) { c.resource<Seen>().after.push_back(c.read<int>().size()); })
        .build();

    app.tick();
    app.tick();

    CHECK(app.resource<Seen>().before == std::vector<std::size_t>{0, 0});
    CHECK(app.resource<Seen>().after  == std::vector<std::size_t>{1, 1});
}

TEST_CASE("Multiple readers observe the same events", "[events]") {
    App app = App::create()
        .insert_resource(Counter{})
        .add_event<int>()
        .add_system([](Context& c) { c.emit(2); c.emit(3); })
        .add_system([](Context& c) { for (int v : c.read<int>()) c.resource<Counter>().value += v; })
        .add_system([](Context& c) { for (int v : c.read<int>()) c.resource<Counter>().value += v * 10; })
        .build();

    app.tick();
    CHECK(app.resource<Counter>().value == 55);
}

TEST_CASE("add_event is idempotent", "[events]") {
    App app = App::create()
        .add_event<int>()
        .add_event<int>()
        .add_event<float>()
        .build();

    // One clearing system per event type.
    CHECK(app.system_count() == 2);

    app.emit_event(1);
    app.tick();
    CHECK(app.events<int>().empty());
}

// ---------------------------------------------------------------------------
// Resource store
// ---------------------------------------------------------------------------

TEST_CASE("Resource insertion and initialisation", "[resources]") {
    SECTION("insert_resource replaces") {
        App app = App::create()
            .insert_resource(Counter{1})
            .insert_resource(Counter{2})
            .build();
        CHECK(app.resource<Counter>().value == 2);
    }

    SECTION("init_resource does not clobber") {
        App app = App::create()
            .insert_resource(Counter{5})
            .init_resource<Counter>()
            .build();
        CHECK(app.resource<Counter>().value == 5);
    }

    SECTION("init_resource builds world-constructible types from the world") {
        App app = App::create()
            .insert_resource(Counter{9})
            .init_resource<Seeded>()
            .build();
        CHECK(app.resource<Seeded>().from_counter == 9);
    }

    SECTION("try_resource reports absence") {
        App app = App::create().build();
        CHECK(app.try_resource<Counter>() == nullptr);
        CHECK(app.try_resource<FrameClock>() != nullptr);
        CHECK(app.try_resource<AppState>() != nullptr);
    }
}

// ---------------------------------------------------------------------------
// State machine
// ---------------------------------------------------------------------------

namespace {

AppBuilder state_app() {
    AppBuilder b = App::create();
    b.insert_resource(Trace{})
     .set_initial_state(Mode::Preload)
     .on_enter_state(Mode::Preload, [](Context& c) { push(c, "enter_preload"); })
     .on_exit_state(Mode::Preload,  [](Context& c) { push(c, "exit_preload"); })
     .on_enter_state(Mode::Play,    [](Context& c) { push(c, "enter_play"); })
     .on_exit_state(Mode::Play,     [](Context& c) { push(c, "exit_play"); })
     .add_system_stateful(Stage::Update, Mode::Play, [](Context& c) { push(c, "play"); });
    return b;
}

} // namespace

TEST_CASE("The initial state's enter listener fires once, during build", "[state]") {
    App app = state_app().build();

    CHECK(app.resource<Trace>().log == std::vector<std::string>{"enter_preload"});
    CHECK(app.state().is(Mode::Preload));

    app.tick();
    app.tick();
    CHECK(app.resource<Trace>().log == std::vector<std::string>{"enter_preload"});
}

TEST_CASE("A transition applies at the end of the tick that requested it", "[state]") {
    App app = state_app()
        .add_system_stateful(Stage::Update, Mode::Preload, [](Context& c) {
            push(c, "preload");
            c.schedule_transition(Mode::Play);
        })
        .build();

    app.tick();
    CHECK(app.resource<Trace>().log ==
          std::vector<std::string>{"enter_preload", "preload", "exit_preload", "enter_play"});
    CHECK(app.state().is(Mode::Play));
    CHECK_FALSE(app.state().pending.has_value());

    // Play systems start on the following tick.
    app.tick();
    CHECK(app.resource<Trace>().log.back() == "play");
}

TEST_CASE("Re-entering the current state runs exit then enter", "[state]") {
    App app = state_app()
        .add_system_stateful(Stage::Update, Mode::Preload, [](Context& c) { c.schedule_transition(Mode::Play); })
        .build();
    app.tick();
    app.resource<Trace>().log.clear();

    app.state().schedule_transition(Mode::Play);
    app.tick();

    CHECK(app.resource<Trace>().log ==
          std::vector<std::string>{"play", "exit_play", "enter_play"});
    CHECK(app.state().is(Mode::Play));
}

TEST_CASE("The last transition request in a tick wins", "[state]") {
    App app = state_app()
        .add_system_stateful(Stage::Update, Mode::Preload, [](Context& c) { c.schedule_transition(Mode::Play); })
        .add_system_stateful(Stage::PostUpdate, Mode::Preload, [](Context& c) { c.schedule_transition(Mode::Preload); })
        .build();

    app.tick();

    CHECK(app.state().is(Mode::Preload));
    CHECK(app.resource<Trace>().log ==
          std::vector<std::string>{"enter_preload", "exit_preload", "enter_preload"});
}

TEST_CASE("A transition requested by a listener waits for the next tick", "[state]") {
    App app = state_app()
        .add_system_stateful(Stage::Update, Mode::Preload, [](Context& c) { c.schedule_transition(Mode::Play); })
        .on_enter_state(Mode::Play, [](Context& c) {
            if (c.resource<Trace>().log.size() < 4) c.schedule_transition(Mode::Preload);
        })
        .build();

    app.tick();
    CHECK(app.state().is(Mode::Play));
    REQUIRE(app.state().pending.has_value());
    CHECK(*app.state().pending == state_id(Mode::Preload));

    app.tick();
    CHECK(app.state().is(Mode::Preload));
}

TEST_CASE("Stateful systems use the state snapshot taken at the start of the tick", "[state]") {
    App app = state_app()
        .add_system_to_stage(Stage::First, [](Context& c) {
            // Flipping current mid-sweep must not change which systems run.
            c.state().current = state_id(Mode::Play);
        })
        .build();

    app.tick();
    const auto& log = app.resource<Trace>().log;
    CHECK(std::find(log.begin(), log.end(), "play") == log.end());

    app.tick();
    CHECK(app.resource<Trace>().log.back() == "play");
}

// ---------------------------------------------------------------------------
// Archetype notification
// ---------------------------------------------------------------------------

TEST_CASE("ArchetypeFilter matches supersets of its required types", "[archetypes]") {
    auto filter = ArchetypeFilter::of<Marker, Tag>();

    ArchetypeSignature both{ecs::component_id<Marker>(), ecs::component_id<Tag>()};
    std::sort(both.begin(), both.end());
    ArchetypeSignature marker_only{ecs::component_id<Marker>()};
    ArchetypeSignature all{ecs::component_id<Marker>(), ecs::component_id<Tag>(), ecs::component_id<Extra>()};
    std::sort(all.begin(), all.end());

    CHECK(filter.matches(both));
    CHECK(filter.matches(all));
    CHECK_FALSE(filter.matches(marker_only));

    CHECK(filter.absorb(both));
    CHECK_FALSE(filter.absorb(both));
    CHECK_FALSE(filter.absorb(marker_only));
    CHECK(filter.matched().size() == 1);
}

TEST_CASE("Archetype listeners see each new signature exactly once", "[archetypes]") {
    struct Seen {
        std::vector<ArchetypeSignature> signatures;
        ArchetypeFilter                 tagged = ArchetypeFilter::of<Tag>();
    };

    App app = App::create()
        .insert_resource(Seen{})
        .insert_resource(Counter{})
        .track_component<Marker>()
        .track_component<Tag>()
        .add_archetype_system(
            Stage::Update,
            [](Context& c) {
                const int tick = c.resource<Counter>().value++;
                if (tick == 0 || tick == 1) c.commands().create_with(Marker{});
                if (tick == 2) c.commands().create_with(Marker{}, Extra{}); // Extra is untracked
                if (tick == 3) c.commands().create_with(Marker{}, Tag{});
            },
            [](Context& c, const ArchetypeSignature& sig) {
                auto& seen = c.resource<Seen>();
                seen.signatures.push_back(sig);
                seen.tagged.absorb(sig);
            })
        .build();

    app.tick();
    REQUIRE(app.resource<Seen>().signatures.size() == 1);
    CHECK(app.resource<Seen>().signatures[0] == ArchetypeSignature{ecs::component_id<Marker>()});

    app.tick();
    app.tick();
    CHECK(app.resource<Seen>().signatures.size() == 1);
    CHECK(app.resource<Seen>().tagged.empty());

    app.tick();
    CHECK(app.resource<Seen>().signatures.size() == 2);
    CHECK(app.resource<Seen>().tagged.matched().size() == 1);
    CHECK(app.resource<ArchetypeTracker>().generation() == 2);
}

TEST_CASE("Entities spawned before the first tick are announced on it", "[archetypes]") {
    App app = App::create()
        .insert_resource(Counter{})
        .track_component<Marker>()
        .add_startup_system([](Context& c) { c.commands().create_with(Marker{}); })
        .add_archetype_system(
            Stage::Update, [](Context&) {},
            [](Context& c, const ArchetypeSignature&) { c.resource<Counter>().value++; })
        .build();

    CHECK(app.resource<Counter>().value == 0);
    app.tick();
    CHECK(app.resource<Counter>().value == 1);
    app.tick();
    CHECK(app.resource<Counter>().value == 1);
}

TEST_CASE("Entities the host spawns between ticks are announced even if no system runs", "[archetypes]") {
    SystemDescriptor watcher;
    watcher.name         = "play_only_watcher";
    watcher.run          = [](Context&) {};
    watcher.on_archetype = [](Context& c, const ArchetypeSignature&) { c.resource<Counter>().value++; };
    watcher.stage        = Stage::Update;
    watcher.kind         = SystemKind::Stateful;
    watcher.state        = state_id(Mode::Play);

    App app = App::create()
        .insert_resource(Counter{})
        .track_component<Marker>()
        .set_initial_state(Mode::Preload)
        .add_system_descriptor(std::move(watcher))
        .build();

    // Preload: the sweep runs nothing, so only the notification step can see it.
    app.world().create_with(Marker{});
    app.tick();

    CHECK(app.resource<Counter>().value == 1);
    CHECK(app.resource<ArchetypeTracker>().generation() == 1);
}

TEST_CASE("Removing a tracked component can reveal a new signature", "[archetypes]") {
    App app = App::create()
        .track_component<Marker>()
        .track_component<Tag>()
        .add_startup_system([](Context& c) { c.commands().create_with(Marker{}, Tag{}); })
        .build();

    auto& tracker = app.resource<ArchetypeTracker>();
    CHECK(tracker.generation() == 1);

    ecs::Entity e{};
    app.world().each<Tag>([&](ecs::Entity found, Tag&) { e = found; });
    app.world().deferred().remove<Tag>(e);
    app.world().flush_deferred();
    tracker.collect(app.world());

    CHECK(tracker.generation() == 2);
    CHECK(tracker.signatures()[1] == ArchetypeSignature{ecs::component_id<Marker>()});
}

// ---------------------------------------------------------------------------
// Builder composition
// ---------------------------------------------------------------------------

namespace {

struct CounterModule {
    static void install(AppBuilder& app) {
        app.init_resource<Counter>()
           .add_system([](Context& c) { c.resource<Counter>().value += 100; });
    }
};

} // namespace

TEST_CASE("Plugins and modules register through the builder", "[builder]") {
    App app = App::create()
        .add_plugin([](AppBuilder& b) { b.insert_resource(Counter{1}); })
        .add_module<CounterModule>()
        .build();

    CHECK(app.resource<Counter>().value == 1);
    app.tick();
    CHECK(app.resource<Counter>().value == 101);
}

TEST_CASE("run() hands the built app to the runner", "[builder]") {
    SECTION("no runner ticks once") {
        int observed = 0;
        App::create()
            .insert_resource(Counter{})
            .add_system([&observed](Context& c) { observed = ++c.resource<Counter>().value; })
            .run();
        CHECK(observed == 1);
    }

    SECTION("custom runner") {
        std::uint64_t frames = 0;
        App::create()
            .set_runner([&frames](App app) {
                for (int i = 0; i < 3; ++i) app.tick();
                frames = app.frame();
            })
            .run();
        CHECK(frames == 3);
    }
}

TEST_CASE("Builder world is shared with the built app", "[builder]") {
    AppBuilder builder = App::create();
    ecs::World& world = builder.world();
    world.create_with(Marker{});

    App app = builder.build();
    CHECK(&app.world() == &world);
    CHECK(count_markers(app.world()) == 1);
}
