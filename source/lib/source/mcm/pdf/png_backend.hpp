#pragma once

#include <map>
#include <optional>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core/mat.hpp>

#include <mcm/export/print_layout.hpp>
#include <mcm/pdf/backend.hpp>

class PngDocument;

class PngPage final : public PdfPage
{
    friend class PngDocument;

  public:
    virtual ~PngPage() override = default;

    virtual void FillRect(RectData data, ColorRGB32f color) override;

    virtual void DrawSolidLine(LineData data, LineStyle style) override;

    virtual void DrawImage(ImageData data) override;

    virtual void Finish() override{};

  private:
    int32_t ToPixels(Length l) const;

    PngDocument* m_Document{ nullptr };
    cv::Mat m_Page{};
};

class PngDocument final : public PdfDocument
{
  public:
    PngDocument(const PrintLayout& layout, const Config& config);
    virtual ~PngDocument() override = default;

    virtual void ReservePages(size_t pages) override;
    virtual PngPage* NextPage() override;

    virtual fs::path Write(fs::path path) override;

    const cv::Mat& GetImage(std::string_view key, EncodedImageView encoded, int32_t w, int32_t h);

    PixelDensity GetDPI() const;

  private:
    PixelDensity m_DPI;
    std::optional<int32_t> m_PngCompression;
    PixelSize m_PrecomputedPageSize;

    std::vector<std::unique_ptr<PngPage>> m_Pages;

    struct ImageCacheEntry
    {
        std::string m_Key;
        int32_t m_Width;
        int32_t m_Height;
        cv::Mat m_Image;
    };
    std::vector<ImageCacheEntry> m_ImageCache;
    cv::Mat m_Uncached;
};
