#include "render/Tesselator.hpp"

#include <cmath>
#include <cstdint>
#include <iostream>

#include <mapbox/earcut.hpp>

#include "utils/ColorUtils.hpp"

void VertexData::Append(const VertexData& other)
{
    positions.insert(positions.end(), other.positions.begin(), other.positions.end());
    caps.insert(caps.end(), other.caps.begin(), other.caps.end());
    colors.insert(colors.end(), other.colors.begin(), other.colors.end());
}

void VertexData::Clear()
{
    positions.clear();
    caps.clear();
    colors.clear();
}

namespace tesselator
{

Quad TesselateSegment(const Vec2& p1, const Vec2& p2, double width)
{
    Vec2 const line = p2 - p1;
    Vec2 const n = line.Normal().Normalized() * (width / 2);
    Vec2 const n2 = n.Normal();

    Vec2 const a = p1 + n + n2;
    Vec2 const b = p1 - n + n2;
    Vec2 const c = p2 + n - n2;
    Vec2 const d = p2 - n - n2;

    return {a, b, c, d};
}

Quad TesselateCircle(const shapes::Circle& circle)
{
    Vec2 const n(circle.radius, 0);
    Vec2 const n2 = n.Normal();

    Vec2 const a = circle.center + n + n2;
    Vec2 const b = circle.center - n + n2;
    Vec2 const c = circle.center + n - n2;
    Vec2 const d = circle.center - n - n2;

    return {a, b, c, d};
}

bool QuadToTriangles(const Quad& quad, std::vector<float>& out)
{
    for (const Vec2& corner : quad) {
        if (!std::isfinite(corner.x_ax) || !std::isfinite(corner.y_ax)) {
            return false;
        }
    }

    for (size_t index : {0, 2, 1, 1, 2, 3}) {
        out.push_back(static_cast<float>(quad[index].x_ax));
        out.push_back(static_cast<float>(quad[index].y_ax));
    }
    return true;
}

void PopulateColorData(std::vector<float>& dest, BLRgba32 color, size_t vertex_count)
{
    std::array<float, 4> const rgba = color_utils::ToFloat4(color);
    for (size_t i = 0; i < vertex_count; ++i) {
        dest.insert(dest.end(), rgba.begin(), rgba.end());
    }
}

VertexData TesselatePolyline(const shapes::Polyline& polyline)
{
    VertexData data;
    const std::vector<Vec2>& points = polyline.points;
    double const width = polyline.width;

    if (points.size() < 2) {
        return data;
    }

    size_t const segment_count = points.size() - 1;
    data.positions.reserve(segment_count * kVerticesPerQuad * 2);
    data.caps.reserve(segment_count * kVerticesPerQuad);
    data.colors.reserve(segment_count * kVerticesPerQuad * 4);

    for (size_t segment_num = 1; segment_num < points.size(); ++segment_num) {
        const Vec2& p1 = points[segment_num - 1];
        const Vec2& p2 = points[segment_num];

        double const length = (p2 - p1).Length();
        if (length == 0) {
            continue;
        }

        if (!QuadToTriangles(TesselateSegment(p1, p2, width), data.positions)) {
            std::cerr << "Tesselator: Skipping degenerate quad in polyline segment " << segment_num << std::endl;
            continue;
        }

        float const cap_region = static_cast<float>(width / (length + width));
        data.caps.insert(data.caps.end(), kVerticesPerQuad, cap_region);
        PopulateColorData(data.colors, polyline.color, kVerticesPerQuad);
    }

    return data;
}

VertexData TesselateCircles(const std::vector<shapes::Circle>& circles)
{
    VertexData data;
    data.positions.reserve(circles.size() * kVerticesPerQuad * 2);
    data.caps.reserve(circles.size() * kVerticesPerQuad);
    data.colors.reserve(circles.size() * kVerticesPerQuad * 4);

    for (const shapes::Circle& circle : circles) {
        if (!QuadToTriangles(TesselateCircle(circle), data.positions)) {
            std::cerr << "Tesselator: Skipping degenerate circle quad" << std::endl;
            continue;
        }
        data.caps.insert(data.caps.end(), kVerticesPerQuad, 1.0F);
        PopulateColorData(data.colors, circle.color, kVerticesPerQuad);
    }

    return data;
}

VertexData TriangulatePolygon(const shapes::Polygon& polygon)
{
    VertexData data;
    const std::vector<Vec2>& points = polygon.points;

    if (points.size() < 3) {
        return data;
    }

    for (const Vec2& pt : points) {
        if (!std::isfinite(pt.x_ax) || !std::isfinite(pt.y_ax)) {
            std::cerr << "Tesselator: Skipping polygon with non-finite vertex" << std::endl;
            return data;
        }
    }

    if (points.size() == 3) {
        for (const Vec2& pt : points) {
            data.positions.push_back(static_cast<float>(pt.x_ax));
            data.positions.push_back(static_cast<float>(pt.y_ax));
        }
        PopulateColorData(data.colors, polygon.color, 3);
        return data;
    }

    using Point = std::array<double, 2>;
    std::vector<std::vector<Point>> rings(1);
    rings[0].reserve(points.size());
    for (const Vec2& pt : points) {
        rings[0].push_back({pt.x_ax, pt.y_ax});
    }

    std::vector<uint32_t> const indices = mapbox::earcut<uint32_t>(rings);

    data.positions.reserve(indices.size() * 2);
    for (uint32_t index : indices) {
        data.positions.push_back(static_cast<float>(points[index].x_ax));
        data.positions.push_back(static_cast<float>(points[index].y_ax));
    }
    PopulateColorData(data.colors, polygon.color, indices.size());

    return data;
}

}  // namespace tesselator
