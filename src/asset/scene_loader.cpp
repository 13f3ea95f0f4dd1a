// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "lumen/asset/scene_loader.h"

#include <cstdint>
#include <fstream>
#include <limits>
#include <memory>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "lumen/core/common.h"
#include "lumen/core/error.h"
#include "lumen/core/log.h"

namespace lumen::asset {

using renderer::Box;
using renderer::Camera;
using renderer::PointLight;
using renderer::Primitive;
using renderer::Scene;
using renderer::Sphere;
using renderer::Vec3;
using renderer::kEpsilon;
using renderer::Cross;
using renderer::Length;
using renderer::Normalized;

namespace {

const nlohmann::json& Require(const nlohmann::json& object, const char* key, const std::string& where) {
    auto it = object.find(key);
    if (it == object.end()) {
        throw SceneError(fmt::format("{}: missing required field '{}'", where, key));
    }
    return *it;
}

double ParseNumber(const nlohmann::json& value, const std::string& where) {
    if (!value.is_number()) {
        throw SceneError(fmt::format("{}: expected a number, got {}", where, value.dump()));
    }
    return value.get<double>();
}

Vec3 ParseVec3(const nlohmann::json& value, const std::string& where) {
    if (!value.is_array() || value.size() != 3) {
        throw SceneError(fmt::format("{}: expected an array of three numbers, got {}", where, value.dump()));
    }
    return Vec3(ParseNumber(value[0], where + "[0]"),
                ParseNumber(value[1], where + "[1]"),
                ParseNumber(value[2], where + "[2]"));
}

Vec3 ParseVec3Or(const nlohmann::json& object, const char* key, const Vec3& fallback, const std::string& where) {
    auto it = object.find(key);
    if (it == object.end()) {
        return fallback;
    }
    return ParseVec3(*it, where + "." + key);
}

double ParseNumberOr(const nlohmann::json& object, const char* key, double fallback, const std::string& where) {
    auto it = object.find(key);
    if (it == object.end()) {
        return fallback;
    }
    return ParseNumber(*it, where + "." + key);
}

u32 ParseRasterSize(const nlohmann::json& object, const char* key, u32 fallback) {
    std::string where = std::string("camera.") + key;
    auto it = object.find(key);
    if (it == object.end()) {
        return fallback;
    }
    constexpr std::int64_t kMax = std::numeric_limits<u32>::max();
    bool valid = false;
    if (it->is_number_unsigned()) {
        auto value = it->get<std::uint64_t>();
        valid = value > 0 && value <= static_cast<std::uint64_t>(kMax);
    } else if (it->is_number_integer()) {
        auto value = it->get<std::int64_t>();
        valid = value > 0 && value <= kMax;
    }
    if (!valid) {
        throw SceneError(fmt::format("{}: expected an integer in [1, {}], got {}", where,
                                     std::numeric_limits<u32>::max(), it->dump()));
    }
    return static_cast<u32>(it->get<std::uint64_t>());
}

std::string TypeOf(const nlohmann::json& object, const std::string& where) {
    auto it = object.find("type");
    if (it == object.end() || !it->is_string()) {
        throw SceneError(fmt::format("{}: missing or non-string 'type'", where));
    }
    return it->get<std::string>();
}

Camera ParseCamera(const nlohmann::json& document) {
    auto it = document.find("camera");
    if (it == document.end() || !it->is_object() || it->empty()) {
        throw SceneError("scene must include a camera");
    }
    const auto& data = *it;

    Camera camera(ParseVec3(Require(data, "position", "camera"), "camera.position"),
                  ParseVec3(Require(data, "look_at", "camera"), "camera.look_at"),
                  ParseVec3Or(data, "up", Vec3(0.0, 1.0, 0.0), "camera"),
                  ParseNumberOr(data, "fov", 60.0, "camera"),
                  ParseRasterSize(data, "width", 320),
                  ParseRasterSize(data, "height", 240));

    if (!(camera.VerticalFov > 0.0 && camera.VerticalFov < 180.0)) {
        throw SceneError(fmt::format("camera.fov: must lie in (0, 180) degrees, got {}", camera.VerticalFov));
    }

    Vec3 forward = camera.LookAt - camera.Position;
    if (Length(forward) < kEpsilon) {
        throw SceneError("camera.look_at: must differ from camera.position");
    }
    if (Length(Cross(Normalized(forward), camera.Up)) < kEpsilon) {
        throw SceneError("camera.up: must not be zero or parallel to the viewing direction");
    }
    return camera;
}

std::unique_ptr<Primitive> ParseObject(const nlohmann::json& data, const std::string& where) {
    if (!data.is_object()) {
        throw SceneError(fmt::format("{}: expected an object", where));
    }

    std::string type = TypeOf(data, where);
    Vec3 color = ParseVec3Or(data, "color", Vec3(1.0, 1.0, 1.0), where);

    if (type == "sphere") {
        Vec3 center = ParseVec3(Require(data, "center", where), where + ".center");
        double radius = ParseNumber(Require(data, "radius", where), where + ".radius");
        if (!(radius > 0.0)) {
            throw SceneError(fmt::format("{}.radius: must be positive, got {}", where, radius));
        }
        return std::make_unique<Sphere>(center, radius, color);
    }

    if (type == "box" || type == "cube") {
        Vec3 minimum = ParseVec3(Require(data, "min", where), where + ".min");
        Vec3 maximum = ParseVec3(Require(data, "max", where), where + ".max");
        if (!(minimum.x < maximum.x && minimum.y < maximum.y && minimum.z < maximum.z)) {
            throw SceneError(fmt::format("{}: min must be below max on every axis", where));
        }
        return std::make_unique<Box>(minimum, maximum, color);
    }

    throw SceneError(fmt::format("{}: unsupported object type '{}'", where, type));
}

PointLight ParseLight(const nlohmann::json& data, const std::string& where) {
    if (!data.is_object()) {
        throw SceneError(fmt::format("{}: expected an object", where));
    }

    std::string type = TypeOf(data, where);
    if (type != "point") {
        throw SceneError(fmt::format("{}: unsupported light type '{}'", where, type));
    }

    return PointLight{ParseVec3(Require(data, "position", where), where + ".position"),
                      ParseVec3Or(data, "intensity", Vec3(1.0, 1.0, 1.0), where)};
}

const nlohmann::json* OptionalArray(const nlohmann::json& document, const char* key) {
    auto it = document.find(key);
    if (it == document.end()) {
        return nullptr;
    }
    if (!it->is_array()) {
        throw SceneError(fmt::format("{}: expected an array", key));
    }
    return &*it;
}

} // namespace

Scene ParseScene(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw SceneError("scene document must be a JSON object");
    }

    Camera camera = ParseCamera(document);

    std::vector<std::unique_ptr<Primitive>> primitives;
    if (const auto* objects = OptionalArray(document, "objects")) {
        for (usize i = 0; i < objects->size(); ++i) {
            primitives.push_back(ParseObject((*objects)[i], fmt::format("objects[{}]", i)));
            LUMEN_LOG_DEBUG("objects[{}]: {}", i, primitives.back()->Describe());
        }
    }

    std::vector<PointLight> lights;
    if (const auto* entries = OptionalArray(document, "lights")) {
        for (usize i = 0; i < entries->size(); ++i) {
            lights.push_back(ParseLight((*entries)[i], fmt::format("lights[{}]", i)));
        }
    }

    LUMEN_LOG_INFO("Loaded scene: {}x{} camera, {} object(s), {} light(s)",
                   camera.Width, camera.Height, primitives.size(), lights.size());

    return Scene(std::move(camera), std::move(primitives), std::move(lights));
}

Scene ParseSceneString(const std::string& text) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& err) {
        throw SceneError(fmt::format("invalid JSON: {}", err.what()));
    }
    return ParseScene(document);
}

Scene LoadScene(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw SceneError(fmt::format("failed to open scene file: {}", path.string()));
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& err) {
        throw SceneError(fmt::format("{}: invalid JSON: {}", path.string(), err.what()));
    }
    return ParseScene(document);
}

} // namespace lumen::asset
