#include <mcm/image.hpp>

#include <cstring>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <QImage>

Image::Image(cv::Mat impl)
    : m_Impl{ std::move(impl) }
{
}

Image::Image(const Image& rhs)
    : m_Impl{ rhs.m_Impl.clone() }
{
}

Image& Image::operator=(const Image& rhs)
{
    m_Impl = rhs.m_Impl.clone();
    return *this;
}

Image Image::Read(const fs::path& path)
{
    return Image{ cv::imread(path.string(), cv::IMREAD_UNCHANGED) };
}

bool Image::Write(const fs::path& path, std::optional<int32_t> png_compression, std::optional<int32_t> jpg_quality) const
{
    if (m_Impl.empty())
    {
        return false;
    }

    const fs::path ext{ path.extension() };
    if (ext == ".jpg" || ext == ".jpeg")
    {
        return WriteFileAtomic(path, EncodeJpg(jpg_quality));
    }
    return WriteFileAtomic(path, EncodePng(png_compression));
}

Image Image::Decode(EncodedImageView buffer)
{
    if (buffer.empty())
    {
        return Image{};
    }

    const cv::Mat cv_buffer{
        1,
        static_cast<int>(buffer.size()),
        CV_8UC1,
        const_cast<std::byte*>(buffer.data()),
    };
    return Image{ cv::imdecode(cv_buffer, cv::IMREAD_UNCHANGED) };
}

EncodedImage Image::EncodePng(std::optional<int32_t> compression) const
{
    std::vector<int> png_params;
    if (compression.has_value())
    {
        png_params = {
            cv::IMWRITE_PNG_COMPRESSION,
            compression.value(),
            cv::IMWRITE_PNG_STRATEGY,
            cv::IMWRITE_PNG_STRATEGY_DEFAULT,
        };
    }

    std::vector<uchar> cv_buffer;
    if (m_Impl.empty() || !cv::imencode(".png", m_Impl, cv_buffer, png_params))
    {
        return {};
    }

    EncodedImage out_buffer(cv_buffer.size());
    std::memcpy(out_buffer.data(), cv_buffer.data(), cv_buffer.size());
    return out_buffer;
}

EncodedImage Image::EncodeJpg(std::optional<int32_t> quality) const
{
    std::vector<int> jpg_params;
    if (quality.has_value())
    {
        jpg_params = {
            cv::IMWRITE_JPEG_QUALITY,
            quality.value(),
        };
    }

    if (m_Impl.empty())
    {
        return {};
    }

    // Jpg has no alpha, flatten onto black like a print would
    cv::Mat three_channels{ m_Impl };
    if (m_Impl.channels() == 4)
    {
        cv::cvtColor(m_Impl, three_channels, cv::COLOR_BGRA2BGR);
    }

    std::vector<uchar> cv_buffer;
    if (!cv::imencode(".jpg", three_channels, cv_buffer, jpg_params))
    {
        return {};
    }

    EncodedImage out_buffer(cv_buffer.size());
    std::memcpy(out_buffer.data(), cv_buffer.data(), cv_buffer.size());
    return out_buffer;
}

Image Image::FromQImage(const QImage& image)
{
    if (image.isNull())
    {
        return Image{};
    }

    const QImage argb{ image.convertToFormat(QImage::Format_ARGB32) };
    const cv::Mat view{
        argb.height(),
        argb.width(),
        CV_8UC4,
        const_cast<uchar*>(argb.constBits()),
        static_cast<size_t>(argb.bytesPerLine()),
    };

    // Format_ARGB32 is BGRA in memory on little endian, which is what OpenCV expects
    return Image{ view.clone() };
}

QImage Image::ToQImage() const
{
    switch (m_Impl.channels())
    {
    case 1:
        return QImage(m_Impl.data, m_Impl.cols, m_Impl.rows, static_cast<qsizetype>(m_Impl.step), QImage::Format_Grayscale8).copy();
    case 3:
        return QImage(m_Impl.data, m_Impl.cols, m_Impl.rows, static_cast<qsizetype>(m_Impl.step), QImage::Format_BGR888).copy();
    case 4:
    {
        cv::Mat rgba;
        cv::cvtColor(m_Impl, rgba, cv::COLOR_BGRA2RGBA);
        return QImage(rgba.data, rgba.cols, rgba.rows, static_cast<qsizetype>(rgba.step), QImage::Format_RGBA8888).copy();
    }
    default:
        return QImage{};
    }
}

Image::operator bool() const
{
    return !m_Impl.empty();
}

bool Image::Valid() const
{
    return static_cast<bool>(*this);
}

Image Image::Resize(PixelSize size) const
{
    Image img{};
    cv::resize(m_Impl, img.m_Impl, cv::Size(static_cast<int>(size.x.value), static_cast<int>(size.y.value)), 0.0, 0.0, cv::INTER_AREA);
    return img;
}

Pixel Image::Width() const
{
    return Size().x;
}

Pixel Image::Height() const
{
    return Size().y;
}

PixelSize Image::Size() const
{
    return PixelSize{
        Pixel(static_cast<float>(m_Impl.cols)),
        Pixel(static_cast<float>(m_Impl.rows)),
    };
}

const cv::Mat& Image::GetUnderlying() const
{
    return m_Impl;
}
