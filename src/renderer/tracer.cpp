// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "lumen/renderer/tracer.h"

#include <algorithm>

namespace lumen::renderer {

std::optional<HitRecord> FindNearestHit(const Scene& scene, const Ray& ray) {
    std::optional<HitRecord> nearest;
    for (const auto& primitive : scene.GetPrimitives()) {
        auto candidate = primitive->Intersect(ray);
        if (candidate && (!nearest || candidate->Distance < nearest->Distance)) {
            nearest = candidate;
        }
    }
    return nearest;
}

bool IsOccluded(const Scene& scene, const Ray& ray, double maxDistance) {
    const auto& primitives = scene.GetPrimitives();
    return std::any_of(primitives.begin(), primitives.end(), [&](const auto& primitive) {
        auto hit = primitive->Intersect(ray);
        return hit && hit->Distance < maxDistance;
    });
}

Vec3 Shade(const Scene& scene, const HitRecord& hit) {
    Vec3 color = hit.Color * kAmbientCoefficient;

    for (const auto& light : scene.GetLights()) {
        Vec3 toLight = light.Position - hit.Point;
        double lightDistance = Length(toLight);
        if (lightDistance == 0.0) {
            continue;
        }
        Vec3 lightDir = toLight / lightDistance;

        Ray shadowRay{hit.Point + hit.Normal * kEpsilon, lightDir};
        if (IsOccluded(scene, shadowRay, lightDistance)) {
            continue;
        }

        double diffuse = std::max(Dot(hit.Normal, lightDir), 0.0);
        color += Hadamard(hit.Color, light.Intensity) * diffuse;
    }

    return Clamp01(color);
}

Vec3 Trace(const Scene& scene, const Ray& ray) {
    auto hit = FindNearestHit(scene, ray);
    if (!hit) {
        return kBackgroundColor;
    }
    return Shade(scene, *hit);
}

} // namespace lumen::renderer
