// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

namespace lumen
{

/**
 * @brief Base exception class for lumen errors
 */
class LumenError : public std::runtime_error
{
public:
    explicit LumenError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Scene description loading/validation errors
 */
class SceneError : public LumenError
{
public:
    explicit SceneError(const std::string& message) : LumenError("Scene error: " + message) {}
};

/**
 * @brief Image output errors
 */
class ImageError : public LumenError
{
public:
    explicit ImageError(const std::string& message) : LumenError("Image error: " + message) {}
};

/**
 * @brief Configuration file errors
 */
class ConfigError : public LumenError
{
public:
    explicit ConfigError(const std::string& message) : LumenError("Config error: " + message) {}
};

} // namespace lumen
