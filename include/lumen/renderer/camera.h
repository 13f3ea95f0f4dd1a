// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "lumen/core/common.h"
#include "lumen/renderer/math.h"
#include "lumen/renderer/ray.h"

namespace lumen::renderer {

struct CameraBasis {
    Vec3 Forward;
    Vec3 Right;
    Vec3 Up;
};

/**
 * Pinhole camera looking from Position towards LookAt.
 *
 * VerticalFov is in degrees, 0 < fov < 180. The basis is derived on every
 * call, so a Camera holds no cached state.
 */
class Camera {
public:
    Vec3 Position{0.0, 0.0, 0.0};
    Vec3 LookAt{0.0, 0.0, -1.0};
    Vec3 Up{0.0, 1.0, 0.0};
    double VerticalFov = 60.0;
    u32 Width = 320;
    u32 Height = 240;

    Camera() = default;

    Camera(const Vec3& position, const Vec3& lookAt, const Vec3& up, double verticalFov, u32 width, u32 height)
        : Position(position), LookAt(lookAt), Up(up), VerticalFov(verticalFov), Width(width), Height(height) {}

    double AspectRatio() const {
        return static_cast<double>(Width) / static_cast<double>(Height);
    }

    CameraBasis CalcBasis() const;

    /// Ray through the center of pixel (x, y); row 0 is the top of the image.
    Ray GenerateRay(u32 x, u32 y) const;
};

} // namespace lumen::renderer
