// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace lumen::log {

/**
 * @brief Create (or reuse) the "lumen" console logger and set its level
 *
 * The CLI calls this once the config file and flags are merged; tests and
 * samples call it again freely, which only changes the level.
 */
void init(spdlog::level::level_enum level = spdlog::level::info);

/// Logger behind the LUMEN_LOG_* macros, initialized at info on first use.
std::shared_ptr<spdlog::logger> get_logger();

} // namespace lumen::log

// fmt-style format strings, e.g. LUMEN_LOG_INFO("Loaded {} object(s)", n)
#define LUMEN_LOG_TRACE(...) ::lumen::log::get_logger()->trace(__VA_ARGS__)
#define LUMEN_LOG_DEBUG(...) ::lumen::log::get_logger()->debug(__VA_ARGS__)
#define LUMEN_LOG_INFO(...)  ::lumen::log::get_logger()->info(__VA_ARGS__)
#define LUMEN_LOG_WARN(...)  ::lumen::log::get_logger()->warn(__VA_ARGS__)
#define LUMEN_LOG_ERROR(...) ::lumen::log::get_logger()->error(__VA_ARGS__)
#define LUMEN_LOG_CRITICAL(...) ::lumen::log::get_logger()->critical(__VA_ARGS__)
