#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <podofo/main/PdfImage.h>
#include <podofo/main/PdfMemDocument.h>
#include <podofo/main/PdfPainter.h>

#include <mcm/export/print_layout.hpp>
#include <mcm/pdf/backend.hpp>

class PoDoFoDocument;

class PoDoFoPage final : public PdfPage
{
    friend class PoDoFoDocument;

  public:
    virtual ~PoDoFoPage() override = default;

    virtual void FillRect(RectData data, ColorRGB32f color) override;

    virtual void DrawSolidLine(LineData data, LineStyle style) override;

    virtual void DrawImage(ImageData data) override;

    virtual void Finish() override;

  private:
    PoDoFoPage(PoDoFo::PdfPage* page,
               PoDoFo::PdfPainter* painter,
               PoDoFoDocument* document);

    double ToPageY(Length y) const;

    PoDoFo::PdfPage* m_Page{ nullptr };
    PoDoFo::PdfPainter* m_Painter{ nullptr };
    PoDoFoDocument* m_Document{ nullptr };
};

class PoDoFoDocument final : public PdfDocument
{
  public:
    PoDoFoDocument(const PrintLayout& layout);
    virtual ~PoDoFoDocument() override = default;

    virtual void ReservePages(size_t pages) override;
    virtual PoDoFoPage* NextPage() override;

    virtual fs::path Write(fs::path path) override;

    PoDoFo::PdfImage* GetImage(std::string_view key, EncodedImageView encoded);

    Length GetPageHeight() const;

  private:
    Size m_PageSize;

    PoDoFo::PdfMemDocument m_Document;
    std::vector<std::unique_ptr<PoDoFoPage>> m_Pages;
    std::vector<std::unique_ptr<PoDoFo::PdfPainter>> m_Painters;

    std::map<std::string, std::unique_ptr<PoDoFo::PdfImage>, std::less<>> m_ImageCache;
    std::vector<std::unique_ptr<PoDoFo::PdfImage>> m_UncachedImages;
};
