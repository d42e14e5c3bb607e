#include <catch2/catch.hpp>
#include "view_transform.h"

TEST_CASE("Screen and canvas mapping", "[view]") {
    ViewTransform view;

    SECTION("Identity view maps the window onto the canvas") {
        float u, v;
        screenToCanvas(view, 1.0f, 0.0, 0.0, 800, 800, u, v);
        REQUIRE(u == Approx(0.0f));
        REQUIRE(v == Approx(0.0f));
        screenToCanvas(view, 1.0f, 800.0, 400.0, 800, 800, u, v);
        REQUIRE(u == Approx(1.0f));
        REQUIRE(v == Approx(0.5f));
    }

    SECTION("Canvas to screen inverts screen to canvas") {
        view.offsetX = 0.2f;
        view.offsetY = -0.35f;
        view.zoom = 2.5f;
        const float aspect = 1.6f;
        for (double mx : {0.0, 137.0, 640.0, 1279.0}) {
            for (double my : {0.0, 211.0, 799.0}) {
                float u, v, sx, sy;
                screenToCanvas(view, aspect, mx, my, 1280, 800, u, v);
                canvasToScreen(view, aspect, u, v, sx, sy);
                REQUIRE(sx * 1280.0f == Approx((float)mx).margin(1e-3));
                REQUIRE(sy * 800.0f == Approx((float)my).margin(1e-3));
            }
        }
    }

    SECTION("Zooming keeps the canvas center fixed") {
        view.zoom = 4.0f;
        float sx, sy;
        canvasToScreen(view, 1.0f, 0.5f, 0.5f, sx, sy);
        REQUIRE(sx == Approx(0.5f));
        REQUIRE(sy == Approx(0.5f));
        canvasToScreen(view, 1.0f, 0.625f, 0.5f, sx, sy);
        REQUIRE(sx == Approx(1.0f));
    }

    SECTION("Zero-sized windows fall back to the center") {
        float u, v;
        screenToCanvas(view, 1.0f, 10.0, 10.0, 0, 0, u, v);
        REQUIRE(u == Approx(0.5f));
        REQUIRE(v == Approx(0.5f));
    }
}

TEST_CASE("Visible canvas and tiles", "[view]") {
    ViewTransform view;

    SECTION("Identity view shows exactly one canvas") {
        CanvasRect r = visibleCanvasRect(view, 1.0f);
        REQUIRE(r.u0 == Approx(0.0f));
        REQUIRE(r.u1 == Approx(1.0f));
        REQUIRE(r.v0 == Approx(0.0f));
        REQUIRE(r.v1 == Approx(1.0f));
        TileRange t = tileRange(r);
        REQUIRE(t.originU == 0);
        REQUIRE(t.originV == 0);
        REQUIRE(t.count() == 1);
    }

    SECTION("A wide window zoomed out needs neighbouring copies") {
        view.zoom = 0.5f;
        CanvasRect r = visibleCanvasRect(view, 2.0f);
        REQUIRE(r.u0 == Approx(-1.5f));
        REQUIRE(r.u1 == Approx(2.5f));
        REQUIRE(r.v0 == Approx(-0.5f));
        REQUIRE(r.v1 == Approx(1.5f));
        TileRange t = tileRange(r);
        REQUIRE(t.originU == -2);
        REQUIRE(t.countU == 5);
        REQUIRE(t.originV == -1);
        REQUIRE(t.countV == 3);
    }

    SECTION("Panning shifts the tiles") {
        view.offsetX = -0.5f;
        TileRange t = tileRange(visibleCanvasRect(view, 1.0f));
        REQUIRE(t.originU == 0);
        REQUIRE(t.countU == 2);
        REQUIRE(t.countV == 1);
    }

    SECTION("Far zoom-out is capped around the view center") {
        view.zoom = 0.1f;
        TileRange t = tileRange(visibleCanvasRect(view, 1.0f));
        REQUIRE(t.countU == kMaxTilesPerAxis);
        REQUIRE(t.countV == kMaxTilesPerAxis);
        REQUIRE(t.originU == -kMaxTilesPerAxis / 2);
        REQUIRE(t.originV == -kMaxTilesPerAxis / 2);
    }

    SECTION("Zoomed in on one tile") {
        view.zoom = 8.0f;
        view.offsetX = -3.2f;
        TileRange t = tileRange(visibleCanvasRect(view, 1.0f));
        REQUIRE(t.originU == 3);
        REQUIRE(t.count() == 1);
    }
}

TEST_CASE("Wrapping clicks into the base tile", "[view]") {
    REQUIRE(wrapToBaseTile(0.25f) == Approx(0.25f));
    REQUIRE(wrapToBaseTile(1.25f) == Approx(0.25f));
    REQUIRE(wrapToBaseTile(-0.25f) == Approx(0.75f));
    REQUIRE(wrapToBaseTile(-3.0f) == 0.0f);
    REQUIRE(wrapToBaseTile(1.0f) == 0.0f);
    float tiny = wrapToBaseTile(-1e-9f);
    REQUIRE(tiny >= 0.0f);
    REQUIRE(tiny < 1.0f);
}

TEST_CASE("View options", "[view]") {
    SimState state;
    REQUIRE(state.view == ViewOption::Particles);
    REQUIRE(isParticleView(state.view));
    REQUIRE_FALSE(isTiledView(state.view));
    REQUIRE(isParticleView(ViewOption::TiledParticles));
    REQUIRE(isTiledView(ViewOption::TiledParticles));
    REQUIRE_FALSE(isParticleView(ViewOption::Canvas));
    REQUIRE_FALSE(isParticleView(ViewOption::Brush));
}
