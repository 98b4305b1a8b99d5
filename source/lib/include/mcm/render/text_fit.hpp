#pragma once

#include <functional>

struct TextFitParams
{
    float m_MaxSize{ 13.0f };
    float m_MinSize{ 8.0f };
    float m_Step{ 0.5f };
};

// Returns the measured height of a text block at the given font size
using TextMeasure = std::function<float(float font_size)>;

// Largest size in [min, max] on the step grid whose block fits max_height, never below min
float FitFontSize(const TextMeasure& measure, float max_height, const TextFitParams& params = {});
