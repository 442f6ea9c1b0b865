#pragma once

#include <vector>

#include "render/Shapes.hpp"
#include "render/Tesselator.hpp"

// Shapes collected for one layer, tesselated into three vertex streams on
// Commit(): polygons, circles and polylines. Circles and polylines share the
// pill shader, polygons use the flat one.
class PrimitiveSet
{
public:
    void AddCircle(const shapes::Circle& circle) { m_circles_.push_back(circle); }
    void AddLine(const shapes::Polyline& line) { m_lines_.push_back(line); }
    void AddPolygon(const shapes::Polygon& polygon) { m_polygons_.push_back(polygon); }

    // Tesselates everything added so far and releases the source shapes.
    void Commit();
    void Clear();

    [[nodiscard]] bool IsCommitted() const { return m_committed_; }

    [[nodiscard]] const VertexData& GetPolygonData() const { return m_polygon_data_; }
    [[nodiscard]] const VertexData& GetCircleData() const { return m_circle_data_; }
    [[nodiscard]] const VertexData& GetPolylineData() const { return m_polyline_data_; }

private:
    std::vector<shapes::Circle> m_circles_;
    std::vector<shapes::Polyline> m_lines_;
    std::vector<shapes::Polygon> m_polygons_;

    VertexData m_polygon_data_;
    VertexData m_circle_data_;
    VertexData m_polyline_data_;
    bool m_committed_ = false;
};
