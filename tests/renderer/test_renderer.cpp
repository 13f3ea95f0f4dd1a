#include <catch2/catch_test_macros.hpp>
#include <lumen/renderer/renderer.h>
#include <memory>
#include <utility>
#include <vector>

using namespace lumen::renderer;

namespace {

Scene MakeRedSphereScene(lumen::u32 width, lumen::u32 height) {
    Camera camera(Vec3(0.0, 0.0, 5.0), Vec3(0.0), Vec3(0.0, 1.0, 0.0), 60.0, width, height);

    std::vector<std::unique_ptr<Primitive>> primitives;
    primitives.push_back(std::make_unique<Sphere>(Vec3(0.0), 1.0, Vec3(1.0, 0.0, 0.0)));

    std::vector<PointLight> lights{PointLight{Vec3(0.0, 5.0, 0.0), Vec3(1.0)}};

    return Scene(camera, std::move(primitives), std::move(lights));
}

} // namespace

TEST_CASE("Pixel grid", "[renderer][renderer]") {
    PixelGrid grid(3, 2);

    REQUIRE(grid.Width() == 3u);
    REQUIRE(grid.Height() == 2u);
    REQUIRE(grid.At(2, 1) == Vec3(0.0));

    grid.At(2, 1) = Vec3(0.25, 0.5, 0.75);
    REQUIRE(grid.At(2, 1) == Vec3(0.25, 0.5, 0.75));
    REQUIRE(grid.At(1, 1) == Vec3(0.0));
}

TEST_CASE("Rendering a lit sphere", "[renderer][renderer]") {
    auto scene = MakeRedSphereScene(32, 24);
    auto pixels = Render(scene);

    REQUIRE(pixels.Width() == 32u);
    REQUIRE(pixels.Height() == 24u);

    SECTION("Sphere projection is red") {
        const auto& center = pixels.At(16, 12);
        REQUIRE(center.x > 0.0);
        REQUIRE(center.y == 0.0);
        REQUIRE(center.z == 0.0);
    }

    SECTION("Upper half of the sphere is lit") {
        // Row 9 looks slightly upwards at the sphere, which faces the overhead light
        REQUIRE(pixels.At(16, 9).x > pixels.At(16, 14).x);
    }

    SECTION("Corners see the background") {
        REQUIRE(pixels.At(0, 0) == Vec3(0.0));
        REQUIRE(pixels.At(31, 0) == Vec3(0.0));
        REQUIRE(pixels.At(0, 23) == Vec3(0.0));
        REQUIRE(pixels.At(31, 23) == Vec3(0.0));
    }

    SECTION("Every channel lies in [0, 1]") {
        for (lumen::u32 y = 0; y < pixels.Height(); ++y) {
            for (lumen::u32 x = 0; x < pixels.Width(); ++x) {
                const auto& c = pixels.At(x, y);
                for (int i = 0; i < 3; ++i) {
                    REQUIRE(c[i] >= 0.0);
                    REQUIRE(c[i] <= 1.0);
                }
            }
        }
    }
}

TEST_CASE("Parallel rendering matches sequential rendering", "[renderer][renderer]") {
    auto scene = MakeRedSphereScene(17, 13);

    RenderOptions sequential;
    auto reference = Render(scene, sequential);

    SECTION("Fixed worker count") {
        RenderOptions options;
        options.Threads = 4;
        REQUIRE(Render(scene, options) == reference);
    }

    SECTION("More workers than rows") {
        RenderOptions options;
        options.Threads = 64;
        REQUIRE(Render(scene, options) == reference);
    }

    SECTION("Hardware concurrency") {
        RenderOptions options;
        options.Threads = 0;
        REQUIRE(Render(scene, options) == reference);
    }
}
