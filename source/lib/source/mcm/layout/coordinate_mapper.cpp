#include <mcm/layout/coordinate_mapper.hpp>

CoordinateMapper::CoordinateMapper(float surface_width, float surface_height)
    : m_SurfaceWidth{ surface_width }
    , m_SurfaceHeight{ surface_height }
{
}

CoordinateMapper::CoordinateMapper(dla::vec2 surface_size)
    : CoordinateMapper{ surface_size.x, surface_size.y }
{
}

float CoordinateMapper::ScaleX(float x) const
{
    return x / c_ReferenceWidth * m_SurfaceWidth;
}

float CoordinateMapper::ScaleY(float y) const
{
    return y / c_ReferenceHeight * m_SurfaceHeight;
}

dla::vec2 CoordinateMapper::Scale(dla::vec2 point) const
{
    return { ScaleX(point.x), ScaleY(point.y) };
}

SurfaceRect CoordinateMapper::ScaleRect(SurfaceRect rect) const
{
    return { Scale(rect.m_Position), Scale(rect.m_Size) };
}

float CoordinateMapper::ScaleFont(float points) const
{
    return ScaleY(2.0f * points);
}

dla::vec2 CoordinateMapper::SurfaceSize() const
{
    return { m_SurfaceWidth, m_SurfaceHeight };
}
