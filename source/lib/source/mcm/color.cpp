#include <mcm/color.hpp>

#include <QColor>

ColorRGB32f ToColorRGB32f(const ColorRGB8& color)
{
    return ColorRGB32f{
        static_cast<float>(color.r) / 255.0f,
        static_cast<float>(color.g) / 255.0f,
        static_cast<float>(color.b) / 255.0f,
    };
}

QColor ToQColor(const ColorRGB8& color, float alpha)
{
    return QColor{ color.r, color.g, color.b, static_cast<int>(alpha * 255.0f) };
}
