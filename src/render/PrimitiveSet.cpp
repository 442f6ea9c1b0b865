#include "render/PrimitiveSet.hpp"

void PrimitiveSet::Commit()
{
    for (const shapes::Polygon& polygon : m_polygons_) {
        m_polygon_data_.Append(tesselator::TriangulatePolygon(polygon));
    }
    for (const shapes::Polyline& line : m_lines_) {
        m_polyline_data_.Append(tesselator::TesselatePolyline(line));
    }
    m_circle_data_.Append(tesselator::TesselateCircles(m_circles_));

    m_polygons_ = {};
    m_lines_ = {};
    m_circles_ = {};
    m_committed_ = true;
}

void PrimitiveSet::Clear()
{
    m_polygons_.clear();
    m_lines_.clear();
    m_circles_.clear();
    m_polygon_data_.Clear();
    m_circle_data_.Clear();
    m_polyline_data_.Clear();
    m_committed_ = false;
}
