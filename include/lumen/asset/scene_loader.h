// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "lumen/renderer/scene.h"

namespace lumen::asset {

/**
 * Builds a scene from a JSON scene description.
 *
 * Document layout:
 *   camera  { position, look_at, up = [0,1,0], fov = 60, width = 320, height = 240 }
 *   objects [ { type: "sphere", center, radius, color = [1,1,1] }
 *             { type: "box" | "cube", min, max, color = [1,1,1] } ]
 *   lights  [ { type: "point", position, intensity = [1,1,1] } ]
 *
 * Every failure throws SceneError naming the offending field; a scene is
 * either loaded completely or not at all.
 */
renderer::Scene ParseScene(const nlohmann::json& document);

renderer::Scene ParseSceneString(const std::string& text);

renderer::Scene LoadScene(const std::filesystem::path& path);

} // namespace lumen::asset
