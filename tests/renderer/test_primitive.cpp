#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <lumen/renderer/primitive.h>

using namespace lumen::renderer;
using Catch::Matchers::WithinAbs;

namespace {

void RequireVec(const Vec3& actual, const Vec3& expected, double tolerance = 1e-9) {
    REQUIRE_THAT(actual.x, WithinAbs(expected.x, tolerance));
    REQUIRE_THAT(actual.y, WithinAbs(expected.y, tolerance));
    REQUIRE_THAT(actual.z, WithinAbs(expected.z, tolerance));
}

} // namespace

TEST_CASE("Sphere intersection", "[renderer][primitive]") {
    Sphere sphere(Vec3(0.0), 1.0, Vec3(1.0, 0.0, 0.0));

    SECTION("Head-on hit reports the near surface") {
        auto hit = sphere.Intersect(Ray{Vec3(0.0, 0.0, 5.0), Vec3(0.0, 0.0, -1.0)});

        REQUIRE(hit.has_value());
        REQUIRE_THAT(hit->Distance, WithinAbs(4.0, 1e-9));
        RequireVec(hit->Point, Vec3(0.0, 0.0, 1.0));
        RequireVec(hit->Normal, Vec3(0.0, 0.0, 1.0));
        REQUIRE(hit->Color == Vec3(1.0, 0.0, 0.0));
    }

    SECTION("Ray passing beside the sphere misses") {
        auto hit = sphere.Intersect(Ray{Vec3(0.0, 2.0, 5.0), Vec3(0.0, 0.0, -1.0)});
        REQUIRE_FALSE(hit.has_value());
    }

    SECTION("Origin inside the sphere hits the far side") {
        auto hit = sphere.Intersect(Ray{Vec3(0.0), Vec3(1.0, 0.0, 0.0)});

        REQUIRE(hit.has_value());
        REQUIRE_THAT(hit->Distance, WithinAbs(1.0, 1e-9));
        RequireVec(hit->Normal, Vec3(1.0, 0.0, 0.0));
    }

    SECTION("Sphere behind the ray is not hit") {
        auto hit = sphere.Intersect(Ray{Vec3(0.0, 0.0, 5.0), Vec3(0.0, 0.0, 1.0)});
        REQUIRE_FALSE(hit.has_value());
    }

    SECTION("Ray starting on the surface ignores that surface") {
        auto hit = sphere.Intersect(Ray{Vec3(0.0, 0.0, 1.0), Vec3(0.0, 0.0, 1.0)});
        REQUIRE_FALSE(hit.has_value());
    }

    SECTION("Zero direction never reports a hit") {
        REQUIRE_FALSE(sphere.Intersect(Ray{Vec3(0.0, 0.0, 5.0), Vec3(0.0)}).has_value());
        REQUIRE_FALSE(sphere.Intersect(Ray{Vec3(0.0), Vec3(0.0)}).has_value());
    }

    SECTION("Describe names the shape") {
        REQUIRE_THAT(sphere.Describe(), Catch::Matchers::StartsWith("sphere"));
    }
}

TEST_CASE("Box intersection", "[renderer][primitive]") {
    Box box(Vec3(-1.0), Vec3(1.0), Vec3(0.0, 1.0, 0.0));

    SECTION("Hit on the +x face") {
        auto hit = box.Intersect(Ray{Vec3(5.0, 0.0, 0.0), Vec3(-1.0, 0.0, 0.0)});

        REQUIRE(hit.has_value());
        REQUIRE_THAT(hit->Distance, WithinAbs(4.0, 1e-9));
        RequireVec(hit->Point, Vec3(1.0, 0.0, 0.0));
        REQUIRE(hit->Normal == Vec3(1.0, 0.0, 0.0));
        REQUIRE(hit->Color == Vec3(0.0, 1.0, 0.0));
    }

    SECTION("Every face reports its outward normal") {
        struct Case {
            Vec3 Origin;
            Vec3 Direction;
            Vec3 Normal;
        };
        const Case cases[] = {
            {Vec3(-5.0, 0.0, 0.0), Vec3(1.0, 0.0, 0.0), Vec3(-1.0, 0.0, 0.0)},
            {Vec3(0.0, -5.0, 0.0), Vec3(0.0, 1.0, 0.0), Vec3(0.0, -1.0, 0.0)},
            {Vec3(0.0, 5.0, 0.0), Vec3(0.0, -1.0, 0.0), Vec3(0.0, 1.0, 0.0)},
            {Vec3(0.0, 0.0, -5.0), Vec3(0.0, 0.0, 1.0), Vec3(0.0, 0.0, -1.0)},
            {Vec3(0.0, 0.0, 5.0), Vec3(0.0, 0.0, -1.0), Vec3(0.0, 0.0, 1.0)},
        };
        for (const auto& c : cases) {
            auto hit = box.Intersect(Ray{c.Origin, c.Direction});
            REQUIRE(hit.has_value());
            REQUIRE_THAT(hit->Distance, WithinAbs(4.0, 1e-9));
            REQUIRE(hit->Normal == c.Normal);
        }
    }

    SECTION("Parallel ray outside the slab misses") {
        auto hit = box.Intersect(Ray{Vec3(5.0, 2.0, 0.0), Vec3(-1.0, 0.0, 0.0)});
        REQUIRE_FALSE(hit.has_value());
    }

    SECTION("Oblique ray passing the corner misses") {
        auto hit = box.Intersect(Ray{Vec3(5.0, 0.0, 0.0), Normalized(Vec3(-1.0, 1.0, 0.0))});
        REQUIRE_FALSE(hit.has_value());
    }

    SECTION("Origin inside the box hits the exit face") {
        auto hit = box.Intersect(Ray{Vec3(0.0), Vec3(0.0, 1.0, 0.0)});

        REQUIRE(hit.has_value());
        REQUIRE_THAT(hit->Distance, WithinAbs(1.0, 1e-9));
        REQUIRE(hit->Normal == Vec3(0.0, 1.0, 0.0));
    }

    SECTION("Box behind the ray is not hit") {
        auto hit = box.Intersect(Ray{Vec3(5.0, 0.0, 0.0), Vec3(1.0, 0.0, 0.0)});
        REQUIRE_FALSE(hit.has_value());
    }

    SECTION("Zero direction from inside the box is not a hit") {
        REQUIRE_FALSE(box.Intersect(Ray{Vec3(0.0), Vec3(0.0)}).has_value());
        REQUIRE_FALSE(box.Intersect(Ray{Vec3(5.0, 0.0, 0.0), Vec3(0.0)}).has_value());
    }

    SECTION("Edge hit resolves to the -x face first") {
        // Grazes the edge shared by the -x and -y faces
        auto hit = box.Intersect(Ray{Vec3(-1.0, -1.0, 5.0), Vec3(0.0, 0.0, -1.0)});

        REQUIRE(hit.has_value());
        REQUIRE(hit->Normal == Vec3(-1.0, 0.0, 0.0));
    }
}
