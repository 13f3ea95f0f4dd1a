// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <vector>

#include "lumen/core/common.h"
#include "lumen/renderer/math.h"
#include "lumen/renderer/scene.h"

namespace lumen::renderer {

/// Row-major grid of linear colors, row 0 at the top.
class PixelGrid {
public:
    PixelGrid(u32 width, u32 height)
        : m_width(width), m_height(height), m_pixels(static_cast<usize>(width) * height, Vec3(0.0)) {}

    u32 Width() const { return m_width; }
    u32 Height() const { return m_height; }

    const Vec3& At(u32 x, u32 y) const { return m_pixels[Index(x, y)]; }
    Vec3& At(u32 x, u32 y) { return m_pixels[Index(x, y)]; }

    bool operator==(const PixelGrid& other) const {
        return m_width == other.m_width && m_height == other.m_height && m_pixels == other.m_pixels;
    }

private:
    usize Index(u32 x, u32 y) const { return static_cast<usize>(y) * m_width + x; }

    u32 m_width;
    u32 m_height;
    std::vector<Vec3> m_pixels;
};

struct RenderOptions {
    // 1 renders on the calling thread, 0 uses one worker per hardware thread.
    unsigned Threads = 1;
};

/**
 * Traces one ray per pixel of the scene camera's raster.
 *
 * With several workers the rows are split into contiguous bands; every pixel
 * is computed exactly as in the sequential render, so the result is identical.
 */
PixelGrid Render(const Scene& scene, const RenderOptions& options = {});

} // namespace lumen::renderer
