#pragma once

#include <array>
#include <cstddef>
#include <vector>

#include <blend2d.h>

#include "render/Shapes.hpp"
#include "utils/Vec2.hpp"

// Flat per-vertex buffers ready for GPU upload. Positions are x,y pairs,
// colors RGBA floats. Caps are only filled for pill-shaped primitives.
struct VertexData {
    std::vector<float> positions;
    std::vector<float> caps;
    std::vector<float> colors;

    [[nodiscard]] size_t VertexCount() const { return positions.size() / 2; }
    [[nodiscard]] bool Empty() const { return positions.empty(); }

    void Append(const VertexData& other);
    void Clear();
};

// Turns shapes into triangles. Lines and circles become two-triangle quads
// whose rounded caps are cut out in the fragment shader using the cap
// region: the fraction of the quad length taken up by the end caps.
namespace tesselator
{
constexpr size_t kVerticesPerQuad = 6;

using Quad = std::array<Vec2, 4>;

// Corners a, b at p1 and c, d at p2, each pushed out by width / 2 along the
// segment normal and backwards/forwards along the segment for the caps.
Quad TesselateSegment(const Vec2& p1, const Vec2& p2, double width);

// A circle is a zero-length pill: a square of side 2r centered on the center.
Quad TesselateCircle(const shapes::Circle& circle);

// Appends the quad as triangles (q0, q2, q1), (q1, q2, q3). Returns false and
// appends nothing if any coordinate is NaN or infinite.
bool QuadToTriangles(const Quad& quad, std::vector<float>& out);

void PopulateColorData(std::vector<float>& dest, BLRgba32 color, size_t vertex_count);

// One quad per non-degenerate segment.
VertexData TesselatePolyline(const shapes::Polyline& polyline);

VertexData TesselateCircles(const std::vector<shapes::Circle>& circles);

// Ear-clipping triangulation; triangles pass through unchanged. Fewer than
// three points, or any non-finite point, give no triangles. Caps are left empty.
VertexData TriangulatePolygon(const shapes::Polygon& polygon);
}  // namespace tesselator
