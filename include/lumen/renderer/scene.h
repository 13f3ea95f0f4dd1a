// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <memory>
#include <vector>

#include "lumen/renderer/camera.h"
#include "lumen/renderer/light.h"
#include "lumen/renderer/primitive.h"

namespace lumen::renderer {

/**
 * Camera, primitives and lights of one render.
 *
 * The scene owns its primitives and exposes them read-only; nothing can be
 * added or changed once it is built, so concurrent tracing needs no locks.
 */
class Scene {
public:
    Scene(Camera camera, std::vector<std::unique_ptr<Primitive>> primitives, std::vector<PointLight> lights);

    Scene(Scene&&) = default;
    Scene& operator=(Scene&&) = default;
    Scene(const Scene&) = delete;
    Scene& operator=(const Scene&) = delete;

    const Camera& GetCamera() const { return m_camera; }
    const std::vector<std::unique_ptr<Primitive>>& GetPrimitives() const { return m_primitives; }
    const std::vector<PointLight>& GetLights() const { return m_lights; }

private:
    Camera m_camera;
    std::vector<std::unique_ptr<Primitive>> m_primitives;
    std::vector<PointLight> m_lights;
};

} // namespace lumen::renderer
