#include "view_transform.h"
#include <algorithm>
#include <cmath>

void screenToCanvas(const ViewTransform& view, float aspect, double mx, double my,
                    int winW, int winH, float& u, float& v) {
    float sx = winW > 0 ? (float)(mx / winW) : 0.5f;
    float sy = winH > 0 ? (float)(my / winH) : 0.5f;
    u = (sx - 0.5f) * aspect / view.zoom + 0.5f - view.offsetX;
    v = (sy - 0.5f) / view.zoom + 0.5f - view.offsetY;
}

void canvasToScreen(const ViewTransform& view, float aspect, float u, float v, float& sx, float& sy) {
    sx = (u - 0.5f + view.offsetX) * view.zoom / aspect + 0.5f;
    sy = (v - 0.5f + view.offsetY) * view.zoom + 0.5f;
}

CanvasRect visibleCanvasRect(const ViewTransform& view, float aspect) {
    CanvasRect r;
    float halfU = 0.5f * aspect / view.zoom;
    float halfV = 0.5f / view.zoom;
    float cu = 0.5f - view.offsetX;
    float cv = 0.5f - view.offsetY;
    r.u0 = cu - halfU;
    r.u1 = cu + halfU;
    r.v0 = cv - halfV;
    r.v1 = cv + halfV;
    return r;
}

static void axisRange(float lo, float hi, int maxCount, int& origin, int& count) {
    int first = (int)std::floor(lo);
    int last = (int)std::ceil(hi) - 1;
    if (last < first) last = first;
    count = last - first + 1;
    origin = first;
    if (count > maxCount) {
        int center = (int)std::floor((lo + hi) * 0.5f);
        count = maxCount;
        origin = center - maxCount / 2;
    }
}

TileRange tileRange(const CanvasRect& rect, int maxPerAxis) {
    TileRange t;
    maxPerAxis = std::max(1, maxPerAxis);
    axisRange(rect.u0, rect.u1, maxPerAxis, t.originU, t.countU);
    axisRange(rect.v0, rect.v1, maxPerAxis, t.originV, t.countV);
    return t;
}

float wrapToBaseTile(float u) {
    float w = u - std::floor(u);
    return w >= 1.0f ? 0.0f : w;
}
