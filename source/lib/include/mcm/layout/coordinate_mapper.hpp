#pragma once

#include <dla/vector.h>

struct SurfaceRect
{
    dla::vec2 m_Position;
    dla::vec2 m_Size;
};

/*
        All card geometry is authored against the native template resolution and
        mapped onto whatever surface a card is drawn to
*/
class CoordinateMapper
{
  public:
    static constexpr float c_ReferenceWidth{ 661.0f };
    static constexpr float c_ReferenceHeight{ 1028.0f };

    CoordinateMapper(float surface_width, float surface_height);
    explicit CoordinateMapper(dla::vec2 surface_size);

    float ScaleX(float x) const;
    float ScaleY(float y) const;
    dla::vec2 Scale(dla::vec2 point) const;
    SurfaceRect ScaleRect(SurfaceRect rect) const;

    // One design point covers two reference units
    float ScaleFont(float points) const;

    dla::vec2 SurfaceSize() const;

  private:
    float m_SurfaceWidth;
    float m_SurfaceHeight;
};
