// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <filesystem>
#include <string>

#include <spdlog/common.h>

namespace lumen::config {

struct AppConfig {
    spdlog::level::level_enum log_level = spdlog::level::info;
    unsigned threads = 1; // 0 means one worker per hardware thread
    std::filesystem::path config_path;
};

/// Maps a level name to spdlog's enum; unknown names map to info.
spdlog::level::level_enum parse_log_level(const std::string& value);

/// Missing file yields defaults; unreadable or malformed files throw ConfigError.
AppConfig load_from_file(const std::filesystem::path& path);

} // namespace lumen::config
