// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <optional>

#include "lumen/renderer/math.h"
#include "lumen/renderer/primitive.h"
#include "lumen/renderer/ray.h"
#include "lumen/renderer/scene.h"

namespace lumen::renderer {

inline constexpr double kAmbientCoefficient = 0.1;

/// Returned for rays that hit nothing.
inline const Vec3 kBackgroundColor{0.0, 0.0, 0.0};

/// Closest hit over all primitives; on equal distance the earlier primitive wins.
std::optional<HitRecord> FindNearestHit(const Scene& scene, const Ray& ray);

/// True when any primitive intersects the ray closer than maxDistance.
bool IsOccluded(const Scene& scene, const Ray& ray, double maxDistance);

/// Ambient plus unshadowed Lambertian contribution of every light at the hit, clamped to [0, 1].
Vec3 Shade(const Scene& scene, const HitRecord& hit);

Vec3 Trace(const Scene& scene, const Ray& ray);

} // namespace lumen::renderer
