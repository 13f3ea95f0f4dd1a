// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "lumen/renderer/math.h"

namespace lumen::renderer {

/// Direction is expected to be unit length; producers normalize it.
struct Ray {
    Vec3 Origin;
    Vec3 Direction;

    Vec3 PointAt(double t) const { return Origin + Direction * t; }
};

} // namespace lumen::renderer
