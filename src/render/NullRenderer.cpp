#include "render/NullRenderer.hpp"

void NullRenderLayer::Clear()
{
    m_circles_.clear();
    m_lines_.clear();
    m_polygons_.clear();
}

void NullRenderLayer::Render(const Matrix3& /*camera*/, double depth, double global_alpha)
{
    m_render_count_++;
    m_last_depth_ = depth;
    m_last_alpha_ = global_alpha;
}
