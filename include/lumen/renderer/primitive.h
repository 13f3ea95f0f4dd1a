// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <optional>
#include <string>

#include "lumen/renderer/math.h"
#include "lumen/renderer/ray.h"

namespace lumen::renderer {

struct HitRecord {
    double Distance;
    Vec3 Point;
    Vec3 Normal;
    Vec3 Color;
};

class Primitive {
public:
    virtual ~Primitive() = default;

    /**
     * Nearest intersection in front of the ray origin.
     *
     * Hits closer than kEpsilon are ignored so that rays leaving a surface
     * do not report the surface they start on.
     */
    virtual std::optional<HitRecord> Intersect(const Ray& ray) const = 0;

    virtual std::string Describe() const = 0;
};

class Sphere final : public Primitive {
public:
    Sphere(const Vec3& center, double radius, const Vec3& color)
        : m_center(center), m_radius(radius), m_color(color) {}

    std::optional<HitRecord> Intersect(const Ray& ray) const override;
    std::string Describe() const override;

    const Vec3& Center() const { return m_center; }
    double Radius() const { return m_radius; }
    const Vec3& Color() const { return m_color; }

private:
    Vec3 m_center;
    double m_radius;
    Vec3 m_color;
};

/// Axis-aligned box, min < max on every axis.
class Box final : public Primitive {
public:
    Box(const Vec3& minimum, const Vec3& maximum, const Vec3& color)
        : m_min(minimum), m_max(maximum), m_color(color) {}

    std::optional<HitRecord> Intersect(const Ray& ray) const override;
    std::string Describe() const override;

    const Vec3& Min() const { return m_min; }
    const Vec3& Max() const { return m_max; }
    const Vec3& Color() const { return m_color; }

private:
    Vec3 NormalAt(const Vec3& point) const;

    Vec3 m_min;
    Vec3 m_max;
    Vec3 m_color;
};

} // namespace lumen::renderer
