// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "lumen/core/config.h"

#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

#include "lumen/core/error.h"

namespace lumen::config {

spdlog::level::level_enum parse_log_level(const std::string& value) {
    const auto lowered = [&]() {
        std::string tmp = value;
        for (char& c : tmp) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return tmp;
    }();

    if (lowered == "fatal") {
        return spdlog::level::critical;
    }

    // from_str knows spdlog's names plus "warn" and "err", and answers off for anything else
    auto level = spdlog::level::from_str(lowered);
    if (level == spdlog::level::off && lowered != "off") {
        return spdlog::level::info;
    }
    return level;
}

AppConfig load_from_file(const std::filesystem::path& path) {
    AppConfig config{};
    config.config_path = path;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return config;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("failed to open " + path.string());
    }

    try {
        nlohmann::json json;
        file >> json;

        if (auto logging = json.find("logging"); logging != json.end()) {
            if (logging->contains("level")) {
                config.log_level = parse_log_level((*logging)["level"].get<std::string>());
            }
        }

        if (auto render = json.find("render"); render != json.end()) {
            if (auto threads = render->find("threads"); threads != render->end()) {
                if (!threads->is_number_unsigned() || threads->get<std::uint64_t>() > std::numeric_limits<unsigned>::max()) {
                    throw ConfigError(fmt::format("{}: render.threads must be a non-negative integer, got {}",
                                                  path.string(), threads->dump()));
                }
                config.threads = threads->get<unsigned>();
            }
        }
    } catch (const nlohmann::json::exception& err) {
        throw ConfigError(path.string() + ": " + err.what());
    }

    return config;
}

} // namespace lumen::config
