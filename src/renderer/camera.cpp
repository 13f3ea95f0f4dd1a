// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "lumen/renderer/camera.h"

#include <cmath>

namespace lumen::renderer {

CameraBasis Camera::CalcBasis() const {
    Vec3 w = Normalized(LookAt - Position);
    Vec3 u = Normalized(Cross(w, Up));
    Vec3 v = Cross(u, w);
    return CameraBasis{w, u, v};
}

Ray Camera::GenerateRay(u32 x, u32 y) const {
    double halfHeight = std::tan(glm::radians(VerticalFov) / 2.0);
    double halfWidth = AspectRatio() * halfHeight;

    auto basis = CalcBasis();

    double px = (2.0 * ((static_cast<double>(x) + 0.5) / static_cast<double>(Width)) - 1.0) * halfWidth;
    double py = (1.0 - 2.0 * ((static_cast<double>(y) + 0.5) / static_cast<double>(Height))) * halfHeight;

    Vec3 direction = Normalized(basis.Forward + px * basis.Right + py * basis.Up);
    return Ray{Position, direction};
}

} // namespace lumen::renderer
