#include <doctest/doctest.h>
#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>
#include <cmath>

#include "core/LodErrors.h"
#include "core/LodMath.h"
#include "view/PlanetView.h"
#include "view/TerrainView.h"

using namespace PlanetLod;

namespace {

ViewPosition makePosition(double x0, double y0, double theta, double phi, double distance) {
    ViewPosition p;
    p.x0 = x0;
    p.y0 = y0;
    p.theta = theta;
    p.phi = phi;
    p.distance = distance;
    return p;
}

} // namespace

TEST_SUITE("TerrainView") {
    TEST_CASE("vertical camera sits above the look-at point") {
        TerrainView view;
        view.setPosition(makePosition(100.0, -200.0, 0.0, 0.0, 5000.0));
        view.updateView();

        const glm::dvec3& cam = view.worldCameraPos();
        CHECK(cam.x == doctest::Approx(100.0).epsilon(1e-6));
        CHECK(cam.y == doctest::Approx(-200.0).epsilon(1e-6));
        CHECK(cam.z == doctest::Approx(5000.0).epsilon(1e-6));
        CHECK(view.height() == doctest::Approx(5000.0).epsilon(1e-6));

        // The look-at point lies straight ahead of the camera
        glm::dvec3 target = transformPoint(view.worldToCamera(), view.lookAtPos());
        CHECK(target.x == doctest::Approx(0.0).epsilon(1e-6));
        CHECK(target.y == doctest::Approx(0.0).epsilon(1e-6));
        CHECK(target.z == doctest::Approx(-5000.0).epsilon(1e-6));

        CHECK(view.cameraDir().z == doctest::Approx(1.0).epsilon(1e-6));
    }

    TEST_CASE("camera to world inverts world to camera") {
        TerrainView view;
        view.setPosition(makePosition(10.0, 20.0, 0.8, 0.3, 700.0));
        view.updateView();

        glm::dvec3 p(123.0, -45.0, 6.0);
        glm::dvec3 back = transformPoint(view.cameraToWorld(), transformPoint(view.worldToCamera(), p));
        CHECK(back.x == doctest::Approx(p.x).epsilon(1e-9));
        CHECK(back.y == doctest::Approx(p.y).epsilon(1e-9));
        CHECK(back.z == doctest::Approx(p.z).epsilon(1e-9));
    }

    TEST_CASE("camera stays ten units above the ground") {
        TerrainView view;
        view.setGroundHeight(100.0);
        view.setPosition(makePosition(0.0, 0.0, 0.0, 0.0, 5.0));
        view.updateView();
        CHECK(view.worldCameraPos().z == doctest::Approx(110.0));

        view.setGroundHeight(-50.0);
        view.updateView();
        CHECK(view.worldCameraPos().z == doctest::Approx(5.0).epsilon(1e-6));
    }

    TEST_CASE("constrain clamps tilt and distance") {
        TerrainView view;
        view.setPosition(makePosition(0.0, 0.0, -1.0, 0.0, -3.0));
        view.constrain();
        CHECK(view.position().theta == doctest::Approx(0.0001));
        CHECK(view.position().distance == doctest::Approx(0.1));

        view.position().theta = 10.0;
        view.constrain();
        CHECK(view.position().theta == doctest::Approx(glm::pi<double>()));
    }

    TEST_CASE("moving forward follows the heading") {
        TerrainView view;
        view.setPosition(makePosition(0.0, 0.0, 0.5, 0.0, 100.0));
        view.moveForward(100.0);
        CHECK(view.position().x0 == doctest::Approx(0.0));
        CHECK(view.position().y0 == doctest::Approx(100.0));

        view.turn(glm::half_pi<double>());
        CHECK(view.position().phi == doctest::Approx(glm::half_pi<double>()));
        view.moveForward(50.0);
        CHECK(view.position().x0 == doctest::Approx(-50.0));
        CHECK(view.position().y0 == doctest::Approx(100.0));
    }

    TEST_CASE("flat interpolation is linear and clamped") {
        TerrainView view;
        ViewPosition from = makePosition(0.0, 0.0, 0.2, 0.0, 1000.0);
        ViewPosition to = makePosition(100.0, -100.0, 0.6, 1.0, 3000.0);

        CHECK(view.interpolate(from, to, 0.5) == doctest::Approx(0.5));
        CHECK(view.position().x0 == doctest::Approx(50.0));
        CHECK(view.position().y0 == doctest::Approx(-50.0));
        CHECK(view.position().theta == doctest::Approx(0.4));
        CHECK(view.position().phi == doctest::Approx(0.5));
        CHECK(view.position().distance == doctest::Approx(2000.0));

        CHECK(view.interpolate(from, to, 2.0) == doctest::Approx(1.0));
        CHECK(view.position().x0 == doctest::Approx(100.0));
        CHECK(view.position().distance == doctest::Approx(3000.0));

        CHECK(view.interpolate(from, to, -1.0) == doctest::Approx(0.0));
        CHECK(view.position().distance == doctest::Approx(1000.0));
    }

    TEST_CASE("frame view carries the camera state") {
        TerrainView view;
        view.setViewport(800, 600);
        view.setGroundHeight(12.0);
        view.setPosition(makePosition(1.0, 2.0, 0.0, 0.0, 1000.0));
        view.updateView();

        FrameView frame = view.frameView();
        CHECK(frame.viewportWidth == doctest::Approx(800.0));
        CHECK(frame.groundHeight == doctest::Approx(12.0));
        CHECK(frame.worldCameraPos == view.worldCameraPos());
        CHECK(frame.worldToCamera == view.worldToCamera());
        CHECK(frame.cameraToScreen == view.cameraToScreen());
    }

    TEST_CASE("viewport size is at least one pixel") {
        TerrainView view;
        view.setViewport(0, -5);
        CHECK(view.viewportWidth() == 1);
        CHECK(view.viewportHeight() == 1);
    }

    TEST_CASE("near and far planes scale with the altitude") {
        TerrainView view;
        view.setViewport(800, 600);
        view.setPosition(makePosition(0.0, 0.0, 0.0, 0.0, 2000.0));
        view.updateView();

        double h = view.worldCameraPos().z;
        glm::dmat4 expected = glm::perspective(glm::radians(60.0), 800.0 / 600.0, 0.1 * h, 1e6 * h);
        for (int c = 0; c < 4; ++c) {
            for (int r = 0; r < 4; ++r) {
                CHECK(view.cameraToScreen()[c][r] == doctest::Approx(expected[c][r]).epsilon(1e-9));
            }
        }
    }
}

TEST_SUITE("PlanetView") {
    TEST_CASE("radius must be positive") {
        CHECK_THROWS_AS(PlanetView(0.0), InvalidParameterError);
        CHECK_THROWS_AS(PlanetView(-10.0), InvalidParameterError);
    }

    TEST_CASE("look-at point is on the sphere") {
        PlanetView view(1000.0);
        view.setPosition(makePosition(0.0, 0.0, 0.5, 0.0, 100.0));
        glm::dvec3 p = view.lookAtPos();
        CHECK(p.x == doctest::Approx(1000.0));
        CHECK(p.y == doctest::Approx(0.0));
        CHECK(p.z == doctest::Approx(0.0));

        view.position().y0 = glm::half_pi<double>();
        p = view.lookAtPos();
        CHECK(p.z == doctest::Approx(1000.0));
    }

    TEST_CASE("altitude accounts for the clamped tilt") {
        const double R = 1000.0;
        const double d = 500.0;
        PlanetView view(R);
        view.setPosition(makePosition(0.3, 0.2, 0.0, 0.7, d));
        view.updateView();

        CHECK(view.position().theta == doctest::Approx(0.1));
        double expected = std::sqrt(R * R + 2.0 * R * d * std::cos(0.1) + d * d) - R;
        CHECK(view.height() == doctest::Approx(expected).epsilon(1e-9));
    }

    TEST_CASE("camera stays above the planet surface") {
        const double R = 1000.0;
        PlanetView view(R);
        view.setGroundHeight(20.0);
        view.setPosition(makePosition(0.0, 0.0, 0.1, 0.0, 1.0));
        view.updateView();
        CHECK(glm::length(view.worldCameraPos()) == doctest::Approx(R + 30.0).epsilon(1e-9));
    }

    TEST_CASE("latitude is clamped to the poles") {
        PlanetView view(1000.0);
        view.setPosition(makePosition(0.0, 3.0, 0.5, 0.0, 10.0));
        view.constrain();
        CHECK(view.position().y0 == doctest::Approx(glm::half_pi<double>()));
    }

    TEST_CASE("moving north raises the latitude") {
        const double R = 1000.0;
        const double d = 100.0;
        PlanetView view(R);
        view.setPosition(makePosition(0.0, 0.0, 0.5, 0.0, 100.0));
        view.moveForward(d);
        CHECK(view.position().x0 == doctest::Approx(0.0));
        CHECK(view.position().y0 == doctest::Approx(std::atan(d / R)));
    }

    TEST_CASE("moving east raises the longitude") {
        const double R = 1000.0;
        PlanetView view(R);
        view.setPosition(makePosition(0.0, 0.0, 0.5, -glm::half_pi<double>(), 100.0));
        view.moveForward(100.0);
        CHECK(view.position().x0 == doctest::Approx(std::atan(0.1)));
        CHECK(view.position().y0 == doctest::Approx(0.0));
    }

    TEST_CASE("interpolation reaches the target") {
        PlanetView view(6360000.0);
        ViewPosition from = makePosition(0.0, 0.0, 0.3, 0.0, 10000.0);
        ViewPosition to = makePosition(0.5, 0.2, 0.6, 1.0, 20000.0);

        double t = 0.0;
        int steps = 0;
        double maxDistance = 0.0;
        while (t < 1.0 && steps < 100000) {
            double next = view.interpolate(from, to, t);
            CHECK(next > t);
            t = next;
            maxDistance = std::max(maxDistance, view.position().distance);
            ++steps;
        }

        CHECK(t == doctest::Approx(1.0));
        CHECK(steps > 10);
        CHECK(view.position().x0 == doctest::Approx(0.5).epsilon(1e-9));
        CHECK(view.position().y0 == doctest::Approx(0.2).epsilon(1e-9));
        CHECK(view.position().theta == doctest::Approx(0.6).epsilon(1e-9));
        CHECK(view.position().phi == doctest::Approx(1.0).epsilon(1e-9));
        CHECK(view.position().distance == doctest::Approx(20000.0).epsilon(1e-6));

        // Long trips climb in the middle
        CHECK(maxDistance > 100000.0);
    }
}
