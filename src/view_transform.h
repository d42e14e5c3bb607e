#pragma once
#include "sim_state.h"

// Pan/zoom of the canvas inside the window
struct ViewTransform {
    float offsetX = 0.0f, offsetY = 0.0f;
    float zoom = 1.0f;
};

// Window position (pixels) to canvas UV, the inverse of fullscreen_quad.wgsl.
// `aspect` is window aspect over canvas aspect.
void screenToCanvas(const ViewTransform& view, float aspect, double mx, double my,
                    int winW, int winH, float& u, float& v);

// Canvas UV to normalized window position, [0,1] with (0,0) top-left.
// Same mapping particle_view.wgsl places dots with.
void canvasToScreen(const ViewTransform& view, float aspect, float u, float v, float& sx, float& sy);

// Canvas UV rectangle the window shows; extends past [0,1] when zoomed out or panned
struct CanvasRect {
    float u0 = 0.0f, v0 = 0.0f;
    float u1 = 1.0f, v1 = 1.0f;
};
CanvasRect visibleCanvasRect(const ViewTransform& view, float aspect);

constexpr int kMaxTilesPerAxis = 5;

// Copies of the canvas needed to cover a rectangle. Tile (i, j) is the canvas shifted by (i, j) in UV.
struct TileRange {
    int originU = 0, originV = 0;
    int countU = 1, countV = 1;

    int count() const { return countU * countV; }
};
// At most maxPerAxis tiles per axis, kept centered on the rectangle when it needs more
TileRange tileRange(const CanvasRect& rect, int maxPerAxis = kMaxTilesPerAxis);

// Folds a UV coordinate from any tile back into the base tile, [0, 1)
float wrapToBaseTile(float u);

// Dot views render entities in window space instead of showing a canvas texture
inline bool isParticleView(ViewOption view) {
    return view == ViewOption::Particles || view == ViewOption::TiledParticles;
}
inline bool isTiledView(ViewOption view) { return view == ViewOption::TiledParticles; }
