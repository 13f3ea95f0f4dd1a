// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <filesystem>
#include <string>

#include "lumen/renderer/renderer.h"

namespace lumen::asset {

/// floor(clamp(c, 0, 1) * 255); NaN and infinities map to 0.
int QuantizeChannel(double value);

/**
 * Plain-text PPM (P3) document for the grid: header "P3", "<width> <height>",
 * "255", then one line of "R G B" triples per row.
 */
std::string FormatPpm(const renderer::PixelGrid& grid);

/// Throws ImageError when the file cannot be written.
void WritePpm(const std::filesystem::path& path, const renderer::PixelGrid& grid);

} // namespace lumen::asset
