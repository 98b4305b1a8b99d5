#pragma once

#include <memory>
#include <string_view>

#include <mcm/color.hpp>
#include <mcm/config.hpp>
#include <mcm/image.hpp>
#include <mcm/util.hpp>

struct PrintLayout;
class PdfDocument;

std::unique_ptr<PdfDocument> CreatePdfDocument(PdfBackend backend, const PrintLayout& layout, const Config& config);

// All positions are measured from the top left of the page
class PdfPage
{
  public:
    virtual ~PdfPage() = default;

    struct LineData
    {
        Position m_From;
        Position m_To;
    };

    struct LineStyle
    {
        Length m_Thickness{ 0.1_mm };
        ColorRGB32f m_Color;
    };

    struct RectData
    {
        Position m_Pos;
        Size m_Size;
    };

    struct ImageData
    {
        // Images sharing a non-empty key are embedded only once per document
        std::string_view m_Key;
        EncodedImageView m_Encoded;
        Position m_Pos;
        Size m_Size;
    };

    virtual void FillRect(RectData data, ColorRGB32f color) = 0;

    virtual void DrawSolidLine(LineData data, LineStyle style) = 0;

    virtual void DrawImage(ImageData data) = 0;

    virtual void Finish() = 0;
};

class PdfDocument
{
  public:
    virtual ~PdfDocument() = default;

    virtual void ReservePages(size_t pages) = 0;
    virtual PdfPage* NextPage() = 0;

    // Throws std::logic_error when the document can not be written
    virtual fs::path Write(fs::path path) = 0;
};
