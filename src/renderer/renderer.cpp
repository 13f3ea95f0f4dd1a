// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "lumen/renderer/renderer.h"

#include <algorithm>
#include <functional>
#include <future>
#include <thread>

#include "lumen/core/log.h"
#include "lumen/renderer/tracer.h"

namespace lumen::renderer {

namespace {

void RenderRows(const Scene& scene, PixelGrid& grid, u32 firstRow, u32 endRow) {
    const auto& camera = scene.GetCamera();
    for (u32 y = firstRow; y < endRow; ++y) {
        for (u32 x = 0; x < grid.Width(); ++x) {
            grid.At(x, y) = Trace(scene, camera.GenerateRay(x, y));
        }
    }
}

unsigned ResolveWorkerCount(unsigned requested, u32 rows) {
    unsigned workers = requested;
    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    return std::max(1u, std::min<unsigned>(workers, rows));
}

} // namespace

PixelGrid Render(const Scene& scene, const RenderOptions& options) {
    const auto& camera = scene.GetCamera();
    PixelGrid grid(camera.Width, camera.Height);

    unsigned workers = ResolveWorkerCount(options.Threads, camera.Height);
    LUMEN_LOG_DEBUG("Rendering {}x{} with {} primitive(s), {} light(s) on {} worker(s)",
                    camera.Width, camera.Height, scene.GetPrimitives().size(), scene.GetLights().size(), workers);

    if (workers == 1) {
        RenderRows(scene, grid, 0, camera.Height);
        return grid;
    }

    // Each band writes a disjoint set of rows.
    u32 bandHeight = (camera.Height + workers - 1) / workers;
    std::vector<std::future<void>> bands;
    bands.reserve(workers);
    for (u32 first = 0; first < camera.Height; first += bandHeight) {
        u32 end = std::min(camera.Height, first + bandHeight);
        bands.push_back(std::async(std::launch::async, RenderRows, std::cref(scene), std::ref(grid), first, end));
    }
    for (auto& band : bands) {
        band.get();
    }

    return grid;
}

} // namespace lumen::renderer
