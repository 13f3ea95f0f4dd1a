// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "lumen/asset/image.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>

#include <fmt/format.h>

#include "lumen/core/error.h"
#include "lumen/core/log.h"

namespace lumen::asset {

int QuantizeChannel(double value) {
    if (!std::isfinite(value)) {
        return 0;
    }
    return static_cast<int>(std::floor(std::clamp(value, 0.0, 1.0) * 255.0));
}

std::string FormatPpm(const renderer::PixelGrid& grid) {
    fmt::memory_buffer out;
    fmt::format_to(std::back_inserter(out), "P3\n{} {}\n255\n", grid.Width(), grid.Height());

    for (u32 y = 0; y < grid.Height(); ++y) {
        for (u32 x = 0; x < grid.Width(); ++x) {
            const auto& color = grid.At(x, y);
            fmt::format_to(std::back_inserter(out), "{}{} {} {}", x == 0 ? "" : " ",
                           QuantizeChannel(color.x), QuantizeChannel(color.y), QuantizeChannel(color.z));
        }
        out.push_back('\n');
    }

    return fmt::to_string(out);
}

void WritePpm(const std::filesystem::path& path, const renderer::PixelGrid& grid) {
    std::string document = FormatPpm(grid);

    std::ofstream file(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file.is_open()) {
        throw ImageError(fmt::format("failed to open {} for writing", path.string()));
    }

    file.write(document.data(), static_cast<std::streamsize>(document.size()));
    file.close();
    if (!file) {
        throw ImageError(fmt::format("failed to write {}", path.string()));
    }

    LUMEN_LOG_INFO("Wrote {}x{} image to {}", grid.Width(), grid.Height(), path.string());
}

} // namespace lumen::asset
