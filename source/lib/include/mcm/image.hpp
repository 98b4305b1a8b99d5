#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <opencv2/core/mat.hpp>

#include <mcm/color.hpp>
#include <mcm/util.hpp>

class QImage;

using EncodedImage = std::vector<std::byte>;
using EncodedImageView = std::span<const std::byte>;

class [[nodiscard]] Image
{
  public:
    Image() = default;
    Image(cv::Mat impl);
    ~Image() = default;

    Image(Image&& rhs) = default;
    Image(const Image& rhs);

    Image& operator=(Image&& rhs) = default;
    Image& operator=(const Image& rhs);

    static Image Read(const fs::path& path);
    bool Write(const fs::path& path, std::optional<int32_t> png_compression = std::nullopt, std::optional<int32_t> jpg_quality = std::nullopt) const;

    static Image Decode(EncodedImageView buffer);

    EncodedImage EncodePng(std::optional<int32_t> compression = std::nullopt) const;
    EncodedImage EncodeJpg(std::optional<int32_t> quality = std::nullopt) const;

    static Image FromQImage(const QImage& image);
    QImage ToQImage() const;

    explicit operator bool() const;
    bool Valid() const;

    Image Resize(PixelSize size) const;

    Pixel Width() const;
    Pixel Height() const;
    PixelSize Size() const;

    const cv::Mat& GetUnderlying() const;

  private:
    cv::Mat m_Impl{};
};
