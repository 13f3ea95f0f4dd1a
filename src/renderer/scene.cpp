// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "lumen/renderer/scene.h"

#include <utility>

namespace lumen::renderer {

Scene::Scene(Camera camera, std::vector<std::unique_ptr<Primitive>> primitives, std::vector<PointLight> lights)
    : m_camera(std::move(camera)), m_primitives(std::move(primitives)), m_lights(std::move(lights)) {}

} // namespace lumen::renderer
