#include "podofo_backend.hpp"

#include <stdexcept>

#include <podofo/podofo.h>

#include <mcm/util/at_scope_exit.hpp>
#include <mcm/util/log.hpp>

inline double ToPoDoFoPoints(Length l)
{
    return static_cast<double>(l / 1_pts);
}

auto Save(PoDoFo::PdfPainter& painter)
{
    painter.Save();
    return AtScopeExit{
        [&painter]
        {
            painter.Restore();
        }
    };
}

PoDoFoPage::PoDoFoPage(PoDoFo::PdfPage* page,
                       PoDoFo::PdfPainter* painter,
                       PoDoFoDocument* document)
    : m_Page{ page }
    , m_Painter{ painter }
    , m_Document{ document }
{
    m_Painter->SetCanvas(*m_Page, PoDoFo::PdfPainterFlags::NoSaveRestorePrior);
}

double PoDoFoPage::ToPageY(Length y) const
{
    // PoDoFo measures from the bottom left
    return ToPoDoFoPoints(m_Document->GetPageHeight() - y);
}

void PoDoFoPage::FillRect(RectData data, ColorRGB32f color)
{
    const auto real_x{ ToPoDoFoPoints(data.m_Pos.x) };
    const auto real_y{ ToPageY(data.m_Pos.y + data.m_Size.y) };
    const auto real_w{ ToPoDoFoPoints(data.m_Size.x) };
    const auto real_h{ ToPoDoFoPoints(data.m_Size.y) };
    const PoDoFo::PdfColor col{ color.r, color.g, color.b };

    auto save{ Save(*m_Painter) };
    m_Painter->GraphicsState.SetNonStrokingColor(col);
    m_Painter->DrawRectangle(PoDoFo::Rect{ real_x, real_y, real_w, real_h }, PoDoFo::PdfPathDrawMode::Fill);
}

void PoDoFoPage::DrawSolidLine(LineData data, LineStyle style)
{
    const auto real_fx{ ToPoDoFoPoints(data.m_From.x) };
    const auto real_fy{ ToPageY(data.m_From.y) };
    const auto real_tx{ ToPoDoFoPoints(data.m_To.x) };
    const auto real_ty{ ToPageY(data.m_To.y) };
    const auto line_width{ ToPoDoFoPoints(style.m_Thickness) };
    const PoDoFo::PdfColor col{ style.m_Color.r, style.m_Color.g, style.m_Color.b };

    auto save{ Save(*m_Painter) };
    m_Painter->GraphicsState.SetLineWidth(line_width);
    m_Painter->GraphicsState.SetStrokingColor(col);
    m_Painter->SetStrokeStyle(PoDoFo::PdfStrokeStyle::Solid);
    m_Painter->DrawLine(real_fx, real_fy, real_tx, real_ty);
}

void PoDoFoPage::DrawImage(ImageData data)
{
    const auto real_x{ ToPoDoFoPoints(data.m_Pos.x) };
    const auto real_y{ ToPageY(data.m_Pos.y + data.m_Size.y) };
    const auto real_w{ ToPoDoFoPoints(data.m_Size.x) };
    const auto real_h{ ToPoDoFoPoints(data.m_Size.y) };

    auto* image{ m_Document->GetImage(data.m_Key, data.m_Encoded) };
    const auto w_scale{ real_w / image->GetWidth() };
    const auto h_scale{ real_h / image->GetHeight() };

    auto save{ Save(*m_Painter) };
    m_Painter->DrawImage(*image, real_x, real_y, w_scale, h_scale);
}

void PoDoFoPage::Finish()
{
    m_Painter->FinishDrawing();
}

PoDoFoDocument::PoDoFoDocument(const PrintLayout& layout)
    : m_PageSize{ layout.m_PageSize }
{
}

void PoDoFoDocument::ReservePages(size_t pages)
{
    m_Pages.reserve(pages);
    m_Painters.reserve(pages);
}

PoDoFoPage* PoDoFoDocument::NextPage()
{
    const auto new_page_idx{ static_cast<unsigned>(m_Pages.size()) };
    PoDoFo::PdfPage* page{
        &m_Document.GetPages().CreatePageAt(
            new_page_idx,
            PoDoFo::Rect(
                0.0,
                0.0,
                ToPoDoFoPoints(m_PageSize.x),
                ToPoDoFoPoints(m_PageSize.y))),
    };

    auto* painter{ m_Painters.emplace_back(new PoDoFo::PdfPainter).get() };

    m_Pages.push_back(std::unique_ptr<PoDoFoPage>{ new PoDoFoPage{ page, painter, this } });
    return m_Pages.back().get();
}

fs::path PoDoFoDocument::Write(fs::path path)
{
    try
    {
        const auto pdf_path{ fs::path{ path }.replace_extension(".pdf") };
        const auto pdf_path_string{ pdf_path.string() };
        LogInfo("Saving to {}...", pdf_path_string);

        m_Document.Save(pdf_path_string);

        return pdf_path;
    }
    catch (const PoDoFo::PdfError& e)
    {
        // Rethrow as a std::exception so the agnostic code can catch it
        throw std::logic_error{ e.what() };
    }
}

PoDoFo::PdfImage* PoDoFoDocument::GetImage(std::string_view key, EncodedImageView encoded)
{
    if (!key.empty())
    {
        if (const auto it{ m_ImageCache.find(key) }; it != m_ImageCache.end())
        {
            return it->second.get();
        }
    }

    std::unique_ptr podofo_image{ m_Document.CreateImage() };
    try
    {
        podofo_image->LoadFromBuffer(
            PoDoFo::bufferview{
                reinterpret_cast<const char*>(encoded.data()),
                encoded.size(),
            });
    }
    catch (const PoDoFo::PdfError& e)
    {
        throw std::logic_error{ e.what() };
    }

    auto* image{ podofo_image.get() };
    if (key.empty())
    {
        m_UncachedImages.push_back(std::move(podofo_image));
    }
    else
    {
        m_ImageCache.emplace(std::string{ key }, std::move(podofo_image));
    }
    return image;
}

Length PoDoFoDocument::GetPageHeight() const
{
    return m_PageSize.y;
}
