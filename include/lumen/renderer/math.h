// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <glm/glm.hpp>

namespace lumen::renderer {

using Vec3 = glm::dvec3;

/// Distance below which geometric results are treated as degenerate.
inline constexpr double kEpsilon = 1e-5;

inline double Dot(const Vec3& a, const Vec3& b) {
    return glm::dot(a, b);
}

inline Vec3 Cross(const Vec3& a, const Vec3& b) {
    return glm::cross(a, b);
}

inline double Length(const Vec3& v) {
    return glm::length(v);
}

/**
 * Returns v scaled to unit length.
 *
 * The zero vector is returned unchanged instead of producing NaNs.
 */
inline Vec3 Normalized(const Vec3& v) {
    double length = Length(v);
    if (length == 0.0) {
        return v;
    }
    return v / length;
}

/// Component-wise product, used for color modulation.
inline Vec3 Hadamard(const Vec3& a, const Vec3& b) {
    return a * b;
}

inline Vec3 Clamp01(const Vec3& v) {
    return glm::clamp(v, Vec3(0.0), Vec3(1.0));
}

} // namespace lumen::renderer
