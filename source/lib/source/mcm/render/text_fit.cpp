#include <mcm/render/text_fit.hpp>

#include <algorithm>
#include <cmath>

float FitFontSize(const TextMeasure& measure, float max_height, const TextFitParams& params)
{
    const float step{ std::max(params.m_Step, 0.01f) };
    const auto num_steps{ static_cast<int>(std::floor((params.m_MaxSize - params.m_MinSize) / step + 0.001f)) };

    for (int i = 0; i <= num_steps; i++)
    {
        const float font_size{ params.m_MaxSize - static_cast<float>(i) * step };
        if (font_size < params.m_MinSize)
        {
            break;
        }

        if (measure(font_size) <= max_height)
        {
            return font_size;
        }
    }
    return params.m_MinSize;
}
