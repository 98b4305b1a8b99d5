#pragma once

#include <cstdint>

#include <dla/vector.h>

using ColorRGB8 = dla::tvec3<uint8_t>;
using ColorRGB32f = dla::tvec3<float>;

class QColor;

ColorRGB32f ToColorRGB32f(const ColorRGB8& color);
QColor ToQColor(const ColorRGB8& color, float alpha = 1.0f);
