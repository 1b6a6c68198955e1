#pragma once
#include <cmath>
#include <algorithm>

namespace corridor::math {

constexpr float PI = 3.1415926535f;

/**
 * @brief Normalizes an angle into the range [-PI, PI].
 */
inline float normalize_angle(float angle) {
    while (angle < -PI) angle += 2.0f * PI;
    while (angle >  PI) angle -= 2.0f * PI;
    return angle;
}

/**
 * @brief Yaw that looks along the 2D direction (dx, dz). yaw 0 is +x.
 */
inline float yaw_towards(float dx, float dz) {
    return std::atan2(dz, dx);
}

// Unit vectors on the ground plane for a yaw.
inline void forward_of(float yaw, float& dx, float& dz) {
    dx = std::cos(yaw);
    dz = std::sin(yaw);
}

inline void right_of(float yaw, float& dx, float& dz) {
    dx = -std::sin(yaw);
    dz =  std::cos(yaw);
}

/**
 * @brief Interpolates from one angle toward another along the shorter arc.
 */
inline float lerp_angle(float from, float to, float t) {
    constexpr float TAU = 2.0f * PI;
    const float difference = std::fmod(to - from, TAU);
    const float distance   = std::fmod(2.0f * difference, TAU) - difference;
    return from + distance * t;
}

// Quadratic ease in / ease out on [0, 1].
inline float ease_in_out(float t) {
    t = std::clamp(t, 0.0f, 1.0f);
    return t < 0.5f ? 2.0f * t * t : 1.0f - 2.0f * (1.0f - t) * (1.0f - t);
}

} // namespace corridor::math
