#include "control_mode.hpp"
#include "../chunk.hpp"
#include "../events.hpp"
#include "../math_util.hpp"
#include "tweaks.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

using namespace corridor;

static constexpr float SPRINT_FACTOR = 5.0f;

// Turning around always goes the same way.
static constexpr float REVERSE_BIAS = 0.001f;

std::optional<ControlMode> ControlModeSystem::requested_mode(ControlMode current,
                                                             const InputRecord& input) {
    std::optional<ControlMode> target;
    if (input.was_pressed(Keys::Space))  target = ControlMode::AutoWalk;
    else if (input.was_pressed(Keys::X)) target = ControlMode::Hover;
    if (!target) return std::nullopt;
    return *target == current ? ControlMode::Manual : *target;
}

void ControlModeSystem::ReadInput(Context& ctx) {
    auto* input = ctx.try_resource<InputRecord>();
    if (!input) return;

    auto& current = ctx.init_resource<ControlModeResource>();
    if (auto next = requested_mode(current.mode, *input)) {
        current.mode = *next;
        ctx.emit(ControlModeChanged{*next});
    }
}

void ControlModeSystem::UpdateHover(Context& ctx) {
    const auto& changes = ctx.read<ControlModeChanged>();
    if (changes.empty()) return;
    const bool hover = changes.back().mode == ControlMode::Hover;

    auto& cmd = ctx.commands();
    ctx.world().each<PlayerTag>([&](ecs::Entity e, PlayerTag&) {
        if (hover) cmd.add(e, NoClip{});
        else       cmd.remove<NoClip>(e);
    });
}

std::optional<WalkStep> ControlModeSystem::choose_step(const Chunk& chunk, const Chunk* next,
                                                       std::size_t cell, GridDirection previous,
                                                       bool first_step) {
    auto target_in = [&](GridDirection dir) -> std::optional<Position> {
        if (cell == chunk.exit.cell && dir == chunk.exit.side) {
            if (!next) return std::nullopt;
            return chunk_cell_center(*next, next->entrance.cell);
        }
        if (!chunk.maze.has_link(cell, dir)) return std::nullopt;
        return chunk_cell_center(chunk, *chunk.maze.neighbor(cell, dir));
    };

    GridDirection dir = first_step ? previous : rotate_cw(previous);
    for (int i = 0; i < 4; ++i) {
        if (auto target = target_in(dir)) return WalkStep{dir, *target};
        dir = rotate_ccw(dir);
    }
    return std::nullopt;
}

void ControlModeSystem::advance(AutoWalkState& state, float dt, float speed, Position& p, Heading& h) {
    if (!state.progress) return;

    const float dx = state.to.x - state.from.x;
    const float dz = state.to.z - state.from.z;
    const float distance = std::max(std::sqrt(dx * dx + dz * dz), 0.0001f);

    const float t = std::min(1.0f, *state.progress + dt * speed * CELL_SIZE / distance);
    p.x = state.from.x + dx * t;
    p.z = state.from.z + dz * t;
    h.yaw   = math::normalize_angle(
        math::lerp_angle(state.yaw_from, state.yaw_to, math::ease_in_out(std::min(2.0f * t, 1.0f))));
    h.pitch = 0.0f;

    if (t < 1.0f) state.progress = t;
    else          state.progress.reset();
}

void ControlModeSystem::AutoWalk(Context& ctx) {
    auto& state = ctx.init_resource<AutoWalkState>();
    for (const auto& ev : ctx.read<ControlModeChanged>()) {
        if (ev.mode != ControlMode::AutoWalk) {
            state.heading.reset();
            state.progress.reset();
        }
    }

    auto* mode   = ctx.try_resource<ControlModeResource>();
    auto* tweaks = ctx.try_resource<TweaksResource>();
    if (!mode || mode->mode != ControlMode::AutoWalk || !tweaks) return;

    auto* input = ctx.try_resource<InputRecord>();
    const float dt = ctx.delta() * (input && input->is_down(Keys::LeftShift) ? SPRINT_FACTOR : 1.0f);

    auto& world = ctx.world();
    std::vector<const Chunk*> chunks;
    world.each<Chunk>([&](ecs::Entity, Chunk& c) { chunks.push_back(&c); });

    world.each<PlayerTag, Position, Heading>([&](ecs::Entity, PlayerTag&, Position& p, Heading& h) {
        advance(state, dt, tweaks->values.move_speed, p, h);
        if (state.progress) return;

        auto here = std::find_if(chunks.begin(), chunks.end(),
                                 [&](const Chunk* c) { return chunk_contains(*c, p); });
        if (here == chunks.end()) return;
        const Chunk& chunk = **here;
        auto ahead = std::find_if(chunks.begin(), chunks.end(),
                                  [&](const Chunk* c) { return c->index == chunk.index + 1; });

        const GridDirection previous = state.heading.value_or(direction_from_yaw(h.yaw));
        const auto step = choose_step(chunk, ahead == chunks.end() ? nullptr : *ahead,
                                      chunk_cell_at(chunk, p), previous, !state.heading);
        if (!step) return;

        state.heading  = step->direction;
        state.from     = p;
        state.to       = step->target;
        state.yaw_from = h.yaw + REVERSE_BIAS;
        state.yaw_to   = direction_yaw(step->direction);
        state.progress = 0.0f;
    });
}
