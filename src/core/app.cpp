#include "app.hpp"
#include <algorithm>

namespace corridor {

namespace {

// Runs one system and applies its deferred commands before anything else
// runs. Archetype observation piggybacks on the same flush point.
void run_and_flush(SystemDescriptor& sys, ecs::World& world) {
    Context ctx(world);
    sys.run(ctx);
    world.flush_deferred();
    if (auto* tracker = world.try_resource<ArchetypeTracker>()) tracker->collect(world);
}

void notify_and_flush(SystemDescriptor& sys, ecs::World& world, const ArchetypeSignature& sig) {
    Context ctx(world);
    sys.on_archetype(ctx, sig);
    world.flush_deferred();
    if (auto* tracker = world.try_resource<ArchetypeTracker>()) tracker->collect(world);
}

} // namespace

// ---------------------------------------------------------------------------
// App
// ---------------------------------------------------------------------------

AppBuilder App::create() { return AppBuilder{}; }

App::App(std::unique_ptr<ecs::World> world,
         std::vector<SystemDescriptor> systems,
         std::vector<SystemDescriptor> listeners)
    : world_(std::move(world)),
      systems_(std::move(systems)),
      listeners_(std::move(listeners)) {}

void App::tick() {
    // 1. The state snapshot governs filtering for the whole sweep.
    const StateId current = require_resource<AppState>(*world_).current;

    // 2. Stage sweep. systems_ is already stable-sorted by stage.
    for (auto& sys : systems_) {
        if (sys.kind == SystemKind::Stateful && sys.state != current) continue;
        run_and_flush(sys, *world_);
    }

    // 3. Incremental archetype notification.
    notify_archetypes();

    // 4. Epoch advance.
    advance_epoch();

    // 5. At most one state transition.
    apply_transition();
}

void App::notify_archetypes() {
    // Pick up anything the host spawned between ticks.
    if (auto* tracker = world_->try_resource<ArchetypeTracker>()) tracker->collect(*world_);

    for (;;) {
        auto* tracker = world_->try_resource<ArchetypeTracker>();
        if (!tracker || notified_generation_ >= tracker->generation()) return;

        CORRIDOR_ASSERT(notified_generation_ < tracker->signatures().size(),
                        "generation out of step with signature list");
        // Copy: callbacks may discover more signatures and grow the list.
        const ArchetypeSignature sig = tracker->signatures()[notified_generation_];
        ++notified_generation_;

        for (auto& sys : systems_)
            if (sys.on_archetype) notify_and_flush(sys, *world_, sig);
        for (auto& sys : listeners_)
            if (sys.on_archetype) notify_and_flush(sys, *world_, sig);
    }
}

void App::advance_epoch() {
    auto& clock = require_resource<FrameClock>(*world_);
    clock.elapsed += clock.delta;
    ++clock.frame;
}

void App::apply_transition() {
    auto& state = require_resource<AppState>(*world_);
    if (!state.pending) return;

    const StateId previous = state.current;
    const StateId next     = *state.pending;
    // Cleared before the listeners run: a request made by a listener stays
    // pending and is applied on the next tick.
    state.pending.reset();

    run_listeners(SystemKind::OnExit, previous);

    // Listeners may have replaced the resource; look it up again.
    require_resource<AppState>(*world_).current = next;

    run_listeners(SystemKind::OnEnter, next);
}

void App::run_listeners(SystemKind edge, StateId state) {
    for (auto& sys : listeners_) {
        if (sys.kind == edge && sys.state == state) run_and_flush(sys, *world_);
    }
}

// ---------------------------------------------------------------------------
// AppBuilder
// ---------------------------------------------------------------------------

AppBuilder::AppBuilder() : world_(std::make_unique<ecs::World>()) {
    world_->set_resource(FrameClock{});
    world_->set_resource(ArchetypeTracker{});
}

void AppBuilder::ensure_open(const char* op) const {
    if (built_) detail::fatal("AppBuilder used after build()", op);
}

AppBuilder& AppBuilder::add_system(SystemFunc fn, std::string name) {
    return add_system_to_stage(Stage::Update, std::move(fn), std::move(name));
}

AppBuilder& AppBuilder::add_system_to_stage(Stage stage, SystemFunc fn, std::string name) {
    return add_system_descriptor(
        {std::move(name), std::move(fn), nullptr, stage, SystemKind::Stateless, 0});
}

AppBuilder& AppBuilder::add_startup_system(SystemFunc fn, std::string name) {
    return add_system_descriptor(
        {std::move(name), std::move(fn), nullptr, Stage::First, SystemKind::Startup, 0});
}

AppBuilder& AppBuilder::add_archetype_system(Stage stage, SystemFunc fn,
                                             ArchetypeFunc on_archetype, std::string name) {
    return add_system_descriptor({std::move(name), std::move(fn), std::move(on_archetype), stage,
                                  SystemKind::Stateless, 0});
}

AppBuilder& AppBuilder::add_system_descriptor(SystemDescriptor desc) {
    ensure_open("add_system");
    if (!desc.run) detail::fatal("system registered without a body", desc.name.c_str());

    switch (desc.kind) {
    case SystemKind::Startup:
        startup_.push_back(std::move(desc));
        break;
    case SystemKind::Stateless:
    case SystemKind::Stateful:
        systems_.push_back(std::move(desc));
        break;
    case SystemKind::OnEnter:
    case SystemKind::OnExit:
        listeners_.push_back(std::move(desc));
        break;
    }
    return *this;
}

AppBuilder& AppBuilder::add_plugin(const Plugin& plugin) {
    ensure_open("add_plugin");
    plugin(*this);
    return *this;
}

AppBuilder& AppBuilder::set_runner(Runner runner) {
    ensure_open("set_runner");
    runner_ = std::move(runner);
    return *this;
}

ecs::World& AppBuilder::world() {
    ensure_open("world");
    return *world_;
}

App AppBuilder::build() {
    ensure_open("build");
    built_ = true;
    ecs::World& world = *world_;

    // 1. Startup systems, once, in registration order.
    for (auto& sys : startup_) run_and_flush(sys, world);
    startup_.clear();

    // 2. Seed the state machine.
    world.set_resource(AppState{initial_state_, std::nullopt});

    // 3. Stage order, registration order within a stage.
    std::stable_sort(systems_.begin(), systems_.end(),
                     [](const SystemDescriptor& a, const SystemDescriptor& b) {
                         return a.stage < b.stage;
                     });

    // 4. Enter the initial state like any later transition would.
    for (auto& sys : listeners_) {
        if (sys.kind == SystemKind::OnEnter && sys.state == initial_state_)
            run_and_flush(sys, world);
    }

    return App(std::move(world_), std::move(systems_), std::move(listeners_));
}

void AppBuilder::run() {
    Runner runner = std::move(runner_);
    App app = build();
    if (runner) {
        runner(std::move(app));
    } else {
        app.tick();
    }
}

} // namespace corridor
