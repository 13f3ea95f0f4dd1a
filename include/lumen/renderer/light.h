// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "lumen/renderer/math.h"

namespace lumen::renderer {

struct PointLight {
    Vec3 Position;
    Vec3 Intensity{1.0, 1.0, 1.0};
};

} // namespace lumen::renderer
