#include <catch2/catch_test_macros.hpp>

#include <vector>

#include <mcm/render/text_fit.hpp>

TEST_CASE("Largest size that fits is chosen", "[text_fit_largest]")
{
    // Height grows linearly with the font size
    const auto measure{
        [](float font_size)
        {
            return font_size * 10.0f;
        }
    };

    REQUIRE(FitFontSize(measure, 1000.0f) == 13.0f);
    REQUIRE(FitFontSize(measure, 130.0f) == 13.0f);
    REQUIRE(FitFontSize(measure, 129.0f) == 12.5f);
    REQUIRE(FitFontSize(measure, 100.0f) == 10.0f);
    REQUIRE(FitFontSize(measure, 84.0f) == 8.0f);
}

TEST_CASE("Never below the minimum", "[text_fit_minimum]")
{
    const auto measure{
        [](float /*font_size*/)
        {
            return 1000.0f;
        }
    };
    REQUIRE(FitFontSize(measure, 10.0f) == 8.0f);

    const TextFitParams params{
        .m_MaxSize = 26.0f,
        .m_MinSize = 16.0f,
        .m_Step = 1.0f,
    };
    REQUIRE(FitFontSize(measure, 10.0f, params) == 16.0f);
}

TEST_CASE("Sizes are tried from large to small", "[text_fit_order]")
{
    std::vector<float> tried;
    const auto measure{
        [&](float font_size)
        {
            tried.push_back(font_size);
            return font_size <= 11.0f ? 0.0f : 1.0f;
        }
    };

    REQUIRE(FitFontSize(measure, 0.5f) == 11.0f);
    REQUIRE(tried == std::vector<float>{ 13.0f, 12.5f, 12.0f, 11.5f, 11.0f });
}
