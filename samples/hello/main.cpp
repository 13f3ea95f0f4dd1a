#include <lumen/asset/image.h>
#include <lumen/core/log.h>
#include <lumen/renderer/renderer.h>
#include <lumen/renderer/scene.h>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace lumen::renderer;

int main() {
    try {
        lumen::log::init();

        // Red sphere resting on a wide grey slab, lit from above and the side
        Camera camera(Vec3(0.0, 1.5, 5.0), Vec3(0.0, 0.5, 0.0), Vec3(0.0, 1.0, 0.0), 50.0, 640, 480);

        std::vector<std::unique_ptr<Primitive>> primitives;
        primitives.push_back(std::make_unique<Sphere>(Vec3(0.0, 1.0, 0.0), 1.0, Vec3(1.0, 0.2, 0.2)));
        primitives.push_back(std::make_unique<Box>(Vec3(-4.0, -0.5, -4.0), Vec3(4.0, 0.0, 4.0), Vec3(0.7, 0.7, 0.7)));
        primitives.push_back(std::make_unique<Box>(Vec3(1.5, 0.0, -1.0), Vec3(2.5, 1.0, 0.0), Vec3(0.2, 0.4, 1.0)));

        std::vector<PointLight> lights{
            PointLight{Vec3(0.0, 6.0, 2.0), Vec3(0.9, 0.9, 0.9)},
            PointLight{Vec3(-5.0, 3.0, 3.0), Vec3(0.3, 0.3, 0.4)},
        };

        Scene scene(camera, std::move(primitives), std::move(lights));

        RenderOptions options;
        options.Threads = 0;
        auto pixels = Render(scene, options);

        lumen::asset::WritePpm("hello.ppm", pixels);

        return 0;

    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
}
