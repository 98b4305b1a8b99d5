#include "png_backend.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <opencv2/imgproc.hpp>

#include <fmt/format.h>

#include <mcm/util/log.hpp>

int32_t PngPage::ToPixels(Length l) const
{
    return static_cast<int32_t>(std::round(l * m_Document->GetDPI() / 1_pix));
}

void PngPage::FillRect(RectData data, ColorRGB32f color)
{
    const cv::Point from{ ToPixels(data.m_Pos.x), ToPixels(data.m_Pos.y) };
    const cv::Point to{ ToPixels(data.m_Pos.x + data.m_Size.x), ToPixels(data.m_Pos.y + data.m_Size.y) };
    const cv::Scalar color_cv{ color.b * 255, color.g * 255, color.r * 255, 255.0f };

    cv::rectangle(m_Page, from, to, color_cv, cv::FILLED);
}

void PngPage::DrawSolidLine(LineData data, LineStyle style)
{
    const auto real_fx{ ToPixels(data.m_From.x) };
    const auto real_fy{ ToPixels(data.m_From.y) };
    const auto real_tx{ ToPixels(data.m_To.x) };
    const auto real_ty{ ToPixels(data.m_To.y) };
    const auto real_w{ std::max((ToPixels(style.m_Thickness) / 2) * 2, 2) };

    const cv::Point line_from{ real_fx, real_fy };
    const cv::Point line_to{ real_tx, real_ty };
    const cv::Point delta{ line_to - line_from };

    const cv::Point perp{ delta.x == 0 ? cv::Point{ real_w / 2, 0 } : cv::Point{ 0, real_w / 2 } };
    const cv::Point from{ line_from - perp };
    const cv::Point to{ line_to + perp };

    const cv::Scalar color_cv{ style.m_Color.b * 255, style.m_Color.g * 255, style.m_Color.r * 255, 255.0f };

    cv::rectangle(m_Page, from, to, color_cv, cv::FILLED);
}

void PngPage::DrawImage(ImageData data)
{
    const auto real_x{ ToPixels(data.m_Pos.x) };
    const auto real_y{ ToPixels(data.m_Pos.y) };
    const auto real_w{ ToPixels(data.m_Size.x) };
    const auto real_h{ ToPixels(data.m_Size.y) };

    const cv::Rect target{ cv::Rect{ real_x, real_y, real_w, real_h } & cv::Rect{ 0, 0, m_Page.cols, m_Page.rows } };
    if (target.empty())
    {
        return;
    }

    const cv::Mat& image{ m_Document->GetImage(data.m_Key, data.m_Encoded, real_w, real_h) };
    image(cv::Rect{ target.x - real_x, target.y - real_y, target.width, target.height })
        .copyTo(m_Page(target));
}

PngDocument::PngDocument(const PrintLayout& layout, const Config& config)
    : m_DPI{ config.m_PngDPI }
    , m_PngCompression{ config.m_PngCompression }
{
    m_PrecomputedPageSize = PixelSize{
        std::round(layout.m_PageSize.x * m_DPI / 1_pix) * 1_pix,
        std::round(layout.m_PageSize.y * m_DPI / 1_pix) * 1_pix,
    };
}

void PngDocument::ReservePages(size_t pages)
{
    m_Pages.reserve(pages);
}

PngPage* PngDocument::NextPage()
{
    auto& new_page{ m_Pages.emplace_back(new PngPage) };
    new_page->m_Document = this;
    new_page->m_Page = cv::Mat::zeros(cv::Size{
                                          static_cast<int32_t>(m_PrecomputedPageSize.x / 1_pix),
                                          static_cast<int32_t>(m_PrecomputedPageSize.y / 1_pix) },
                                      CV_8UC4);
    return new_page.get();
}

fs::path PngDocument::Write(fs::path path)
{
    const fs::path png_folder{ fs::path{ path }.replace_extension("") };
    try
    {
        if (!fs::exists(png_folder))
        {
            fs::create_directories(png_folder);
        }
        else if (!fs::is_directory(png_folder))
        {
            fs::remove(png_folder);
            fs::create_directories(png_folder);
        }
    }
    catch (const fs::filesystem_error& e)
    {
        throw std::logic_error{ e.what() };
    }

    for (size_t i = 0; i < m_Pages.size(); i++)
    {
        const fs::path png_path{ png_folder / fs::path{ std::to_string(i) }.replace_extension(".png") };
        {
            const auto png_path_str{ png_path.string() };
            LogInfo("Saving to {}...", png_path_str);
        }

        if (!Image{ std::move(m_Pages[i]->m_Page) }.Write(png_path, m_PngCompression.value_or(5)))
        {
            throw std::logic_error{ fmt::format("Failed writing page {}", png_path.string()) };
        }
    }

    return png_folder;
}

const cv::Mat& PngDocument::GetImage(std::string_view key, EncodedImageView encoded, int32_t w, int32_t h)
{
    // clang-format off
    const auto it{
        std::ranges::find_if(m_ImageCache,
                             [&](const ImageCacheEntry& entry)
                             { return !key.empty() &&
                                      entry.m_Width == w &&
                                      entry.m_Height == h &&
                                      entry.m_Key == key; })
    };
    // clang-format on
    if (it != m_ImageCache.end())
    {
        return it->m_Image;
    }

    const Image decoded{ Image::Decode(encoded) };
    if (!decoded.Valid())
    {
        throw std::logic_error{ fmt::format("Could not decode image {} for png page", key) };
    }

    const Image resized{ decoded.Resize({ w * 1_pix, h * 1_pix }) };
    const cv::Mat& source{ resized.GetUnderlying() };
    cv::Mat four_channel_image{};
    switch (source.channels())
    {
    case 1:
        cv::cvtColor(source, four_channel_image, cv::COLOR_GRAY2BGRA);
        break;
    case 3:
        cv::cvtColor(source, four_channel_image, cv::COLOR_BGR2BGRA);
        break;
    default:
        four_channel_image = source.clone();
        break;
    }

    if (key.empty())
    {
        m_Uncached = std::move(four_channel_image);
        return m_Uncached;
    }

    m_ImageCache.push_back({
        std::string{ key },
        w,
        h,
        std::move(four_channel_image),
    });
    return m_ImageCache.back().m_Image;
}

PixelDensity PngDocument::GetDPI() const
{
    return m_DPI;
}
