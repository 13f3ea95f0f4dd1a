// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "lumen/renderer/primitive.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

#include <fmt/format.h>

namespace lumen::renderer {

namespace {

constexpr double kInfinity = std::numeric_limits<double>::infinity();

struct Slab {
    double Near;
    double Far;
};

// Entry/exit distances for one axis; nullopt when the ray runs parallel to
// the slab and starts outside it.
std::optional<Slab> IntersectSlab(double origin, double direction, double minimum, double maximum) {
    if (std::abs(direction) < kEpsilon) {
        if (origin < minimum || origin > maximum) {
            return std::nullopt;
        }
        return Slab{-kInfinity, kInfinity};
    }

    double invDir = 1.0 / direction;
    double t0 = (minimum - origin) * invDir;
    double t1 = (maximum - origin) * invDir;
    if (t0 > t1) {
        std::swap(t0, t1);
    }
    return Slab{t0, t1};
}

std::string FormatVec(const Vec3& v) {
    return fmt::format("({}, {}, {})", v.x, v.y, v.z);
}

} // namespace

std::optional<HitRecord> Sphere::Intersect(const Ray& ray) const {
    Vec3 oc = ray.Origin - m_center;
    double a = Dot(ray.Direction, ray.Direction);
    if (a < kEpsilon) {
        return std::nullopt;
    }
    double b = 2.0 * Dot(oc, ray.Direction);
    double c = Dot(oc, oc) - m_radius * m_radius;

    double discriminant = b * b - 4.0 * a * c;
    if (discriminant < 0.0) {
        return std::nullopt;
    }

    double sqrtDisc = std::sqrt(discriminant);
    double root = (-b - sqrtDisc) / (2.0 * a);
    if (root < kEpsilon) {
        root = (-b + sqrtDisc) / (2.0 * a);
        if (root < kEpsilon) {
            return std::nullopt;
        }
    }

    Vec3 point = ray.PointAt(root);
    return HitRecord{root, point, Normalized(point - m_center), m_color};
}

std::string Sphere::Describe() const {
    return fmt::format("sphere center={} radius={} color={}", FormatVec(m_center), m_radius, FormatVec(m_color));
}

std::optional<HitRecord> Box::Intersect(const Ray& ray) const {
    double tNear = -kInfinity;
    double tFar = kInfinity;

    for (int axis = 0; axis < 3; ++axis) {
        auto slab = IntersectSlab(ray.Origin[axis], ray.Direction[axis], m_min[axis], m_max[axis]);
        if (!slab) {
            return std::nullopt;
        }
        tNear = std::max(tNear, slab->Near);
        tFar = std::min(tFar, slab->Far);
        if (tNear > tFar) {
            return std::nullopt;
        }
    }

    if (tFar < kEpsilon) {
        return std::nullopt;
    }

    // Origin inside the box: the exit point is the visible surface.
    double distance = tNear >= kEpsilon ? tNear : tFar;
    // Unbounded on every axis only happens for a zero direction.
    if (distance < kEpsilon || std::isinf(distance)) {
        return std::nullopt;
    }

    Vec3 point = ray.PointAt(distance);
    return HitRecord{distance, point, NormalAt(point), m_color};
}

Vec3 Box::NormalAt(const Vec3& point) const {
    // Fixed face order -x, +x, -y, +y, -z, +z resolves edge and corner hits.
    if (std::abs(point.x - m_min.x) < kEpsilon) return Vec3(-1.0, 0.0, 0.0);
    if (std::abs(point.x - m_max.x) < kEpsilon) return Vec3(1.0, 0.0, 0.0);
    if (std::abs(point.y - m_min.y) < kEpsilon) return Vec3(0.0, -1.0, 0.0);
    if (std::abs(point.y - m_max.y) < kEpsilon) return Vec3(0.0, 1.0, 0.0);
    if (std::abs(point.z - m_min.z) < kEpsilon) return Vec3(0.0, 0.0, -1.0);
    return Vec3(0.0, 0.0, 1.0);
}

std::string Box::Describe() const {
    return fmt::format("box min={} max={} color={}", FormatVec(m_min), FormatVec(m_max), FormatVec(m_color));
}

} // namespace lumen::renderer
