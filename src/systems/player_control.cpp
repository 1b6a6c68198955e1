#include "player_control.hpp"
#include "../events.hpp"
#include "../math_util.hpp"
#include "tweaks.hpp"
#include <algorithm>
#include <cmath>

using namespace corridor;

static constexpr float MAX_PITCH = 1.2f;

void PlayerControlSystem::apply_look(const InputRecord& input, float mouse_dx, float mouse_dy,
                                     const Tweaks& tweaks, float dt, Heading& heading) {
    float turn = 0.0f;
    if (input.is_down(Keys::Right)) turn += 1.0f;
    if (input.is_down(Keys::Left))  turn -= 1.0f;

    const float cap = tweaks.mouse_delta_cap;
    const float mdx = std::clamp(mouse_dx, -cap, cap);
    const float mdy = std::clamp(mouse_dy, -cap, cap);

    heading.yaw   = math::normalize_angle(heading.yaw + turn * tweaks.turn_speed * dt +
                                          mdx * tweaks.mouse_sensitivity);
    heading.pitch = std::clamp(heading.pitch - mdy * tweaks.mouse_sensitivity,
                               -MAX_PITCH, MAX_PITCH);
}

Position PlayerControlSystem::move_delta(const InputRecord& input, const Heading& heading,
                                         float speed, float dt) {
    float forward = 0.0f, strafe = 0.0f;
    if (input.is_down(Keys::W) || input.is_down(Keys::Up))   forward += 1.0f;
    if (input.is_down(Keys::S) || input.is_down(Keys::Down)) forward -= 1.0f;
    if (input.is_down(Keys::D)) strafe += 1.0f;
    if (input.is_down(Keys::A)) strafe -= 1.0f;

    const float len = std::sqrt(forward * forward + strafe * strafe);
    if (len < 0.001f) return {};
    forward /= len;
    strafe  /= len;

    float fx, fz, rx, rz;
    math::forward_of(heading.yaw, fx, fz);
    math::right_of(heading.yaw, rx, rz);

    const float step = speed * CELL_SIZE * dt;
    return {(fx * forward + rx * strafe) * step, (fz * forward + rz * strafe) * step};
}

static ControlMode current_mode(Context& ctx) {
    auto* mode = ctx.try_resource<ControlModeResource>();
    return mode ? mode->mode : ControlMode::Manual;
}

void PlayerControlSystem::Look(Context& ctx) {
    auto* input  = ctx.try_resource<InputRecord>();
    auto* tweaks = ctx.try_resource<TweaksResource>();
    if (!input || !tweaks || current_mode(ctx) == ControlMode::AutoWalk) return;

    float mdx = 0.0f, mdy = 0.0f;
    for (const auto& m : ctx.read<MouseMoved>()) {
        mdx += m.dx;
        mdy += m.dy;
    }

    const float dt = ctx.delta();
    ctx.world().each<PlayerTag, Heading>([&](ecs::Entity, PlayerTag&, Heading& h) {
        apply_look(*input, mdx, mdy, tweaks->values, dt, h);
    });
}

void PlayerControlSystem::Move(Context& ctx) {
    auto* input  = ctx.try_resource<InputRecord>();
    auto* tweaks = ctx.try_resource<TweaksResource>();
    if (!input || !tweaks) return;

    const bool idle = current_mode(ctx) == ControlMode::AutoWalk;
    const float dt = ctx.delta();
    ctx.world().each<PlayerTag, Heading, MoveIntent>(
        [&](ecs::Entity, PlayerTag&, Heading& h, MoveIntent& intent) {
            const Position d = idle ? Position{}
                                    : move_delta(*input, h, tweaks->values.move_speed, dt);
            intent = {d.x, d.z};
        });
}
