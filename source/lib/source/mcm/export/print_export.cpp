#include <mcm/export/print_export.hpp>

#include <algorithm>
#include <set>
#include <stdexcept>

#include <fmt/format.h>
#include <magic_enum/magic_enum.hpp>

#include <mcm/layout/layout_resolver.hpp>
#include <mcm/render/fonts.hpp>
#include <mcm/util/log.hpp>

PrintExportJob::PrintExportJob(std::vector<CardRecord> cards,
                               CardRasterizer& rasterizer,
                               AssetCache& assets,
                               DocumentFactory document_factory,
                               PrintLayout layout,
                               PrintExportOptions options)
    : ExportJob{ std::move(cards), rasterizer }
    , m_Assets{ assets }
    , m_DocumentFactory{ std::move(document_factory) }
    , m_Layout{ std::move(layout) }
    , m_Options{ std::move(options) }
{
    m_Options.m_ChunkSize = std::max(m_Options.m_ChunkSize, 1u);
}

void PrintExportJob::SetPrintProgressCallback(PrintProgressCallback callback)
{
    m_PrintProgressCallback = std::move(callback);
}

const std::vector<fs::path>& PrintExportJob::GetWrittenDocuments() const
{
    return m_WrittenDocuments;
}

size_t PrintExportJob::GetBufferedCards() const
{
    return m_Buffer.size();
}

size_t PrintExportJob::GetChunkCount() const
{
    return ::GetChunkCount(GetTotal(), m_Options.m_ChunkSize);
}

void PrintExportJob::Begin()
{
    LogInfo("Printing {} cards into {} document(s)", GetTotal(), GetChunkCount());

    WarmUpFonts();
    Preload();

    if (!fs::exists(m_Options.m_OutputDir))
    {
        fs::create_directories(m_Options.m_OutputDir);
    }
}

void PrintExportJob::WarmUpFonts()
{
    if (m_FontsWarmedUp)
    {
        return;
    }

    const size_t num_fonts{ LoadFonts(m_Options.m_FontDir, m_Options.m_FontLoadTimeout) };
    LogDebug("Warmed up {} fonts", num_fonts);
    m_FontsWarmedUp = true;
}

void PrintExportJob::Preload()
{
    m_Assets.ResetBudget();

    for (const BackCategory category : magic_enum::enum_values<BackCategory>())
    {
        if (const LoadedAsset* back{ m_Assets.GetBack(category) })
        {
            EncodedImage encoded{ back->m_Image.EncodePng() };
            if (!encoded.empty())
            {
                m_BackImages[category] = std::move(encoded);
                continue;
            }
        }
        LogWarning("Back for {} is not available, its cards are printed without a back", magic_enum::enum_name(category));
    }

    std::set<TemplateKind> templates;
    for (const CardRecord& card : GetCards())
    {
        templates.insert(GetTemplateKind(card));
    }
    for (const TemplateKind kind : templates)
    {
        // Missing templates are reported by the cache and drawn as placeholders later
        static_cast<void>(m_Assets.GetTemplate(kind));
    }
}

void PrintExportJob::ProcessCard(size_t index, const CardRecord& card, Image image)
{
    EncodedImage encoded{ image.EncodeJpg(m_Options.m_JpgQuality) };

    // Release the bitmap, only the compressed card stays in the buffer
    image = Image{};

    if (encoded.empty())
    {
        throw std::runtime_error{ fmt::format("Could not encode card {} \"{}\" as jpg", index + 1, card.m_Title) };
    }

    m_Buffer.push_back({
        std::move(encoded),
        GetBackCategory(card.m_Type),
        index,
    });
}

void PrintExportJob::EndCard(size_t index)
{
    const bool chunk_complete{ (index + 1) % m_Options.m_ChunkSize == 0 };
    const bool last_card{ index + 1 == GetTotal() };
    if (chunk_complete || last_card)
    {
        FlushChunk(index / m_Options.m_ChunkSize);
    }
}

void PrintExportJob::Finish()
{
    if (!m_Buffer.empty())
    {
        FlushChunk(m_Buffer.back().m_Index / m_Options.m_ChunkSize);
    }
    LogInfo("Wrote {} print document(s)", m_WrittenDocuments.size());
}

void PrintExportJob::Abort()
{
    m_Buffer.clear();
}

void PrintExportJob::ReportProgress()
{
    ExportJob::ReportProgress();

    if (m_PrintProgressCallback)
    {
        const size_t current{ GetCurrent() };
        const size_t chunk{ current == 0 ? 0 : (current - 1) / m_Options.m_ChunkSize };
        m_PrintProgressCallback(current, GetTotal(), ChunkInfo{ chunk + 1, GetChunkCount() });
    }
}

void PrintExportJob::FlushChunk(size_t chunk_index)
{
    if (m_Buffer.empty())
    {
        LogWarning("No card of chunk {} could be captured, skipping its document", chunk_index + 1);
        return;
    }

    std::unique_ptr<PdfDocument> document{ m_DocumentFactory() };
    if (document == nullptr)
    {
        throw std::logic_error{ "No print document backend available" };
    }

    const size_t cards_per_page{ m_Layout.CardsPerPage() };
    const size_t num_pages{ (m_Buffer.size() + cards_per_page - 1) / cards_per_page };
    document->ReservePages(num_pages * 2);

    for (size_t p = 0; p < num_pages; p++)
    {
        const size_t first{ p * cards_per_page };
        const size_t count{ std::min(cards_per_page, m_Buffer.size() - first) };

        DrawFacePage(*document->NextPage(), first, count);
        DrawBackPage(*document->NextPage(), first, count);
    }

    const fs::path document_path{ m_Options.m_OutputDir / GetPrintDocumentName(chunk_index, GetChunkCount()) };
    m_WrittenDocuments.push_back(document->Write(document_path));

    m_Buffer.clear();
}

void PrintExportJob::DrawFacePage(PdfPage& page, size_t first, size_t count) const
{
    page.FillRect({ { 0_mm, 0_mm }, m_Layout.m_PageSize }, ToColorRGB32f(m_Layout.m_FaceBackground));

    for (size_t slot = 0; slot < count; slot++)
    {
        const CapturedCard& card{ m_Buffer[first + slot] };
        page.DrawImage({
            .m_Key{},
            .m_Encoded{ card.m_Encoded },
            .m_Pos{ m_Layout.SlotPosition(slot) },
            .m_Size{ m_Layout.m_CardSize },
        });
    }

    DrawCutLines(page);
    page.Finish();
}

void PrintExportJob::DrawBackPage(PdfPage& page, size_t first, size_t count) const
{
    std::vector<BackCategory> categories;
    for (size_t slot = 0; slot < count; slot++)
    {
        categories.push_back(m_Buffer[first + slot].m_BackCategory);
    }
    const BackCategory dominant{ DominantBackCategory(categories) };
    page.FillRect({ { 0_mm, 0_mm }, m_Layout.m_PageSize }, ToColorRGB32f(m_Layout.BackBackground(dominant)));

    for (size_t slot = 0; slot < count; slot++)
    {
        const BackCategory category{ categories[slot] };
        const auto it{ m_BackImages.find(category) };
        if (it == m_BackImages.end())
        {
            continue;
        }

        page.DrawImage({
            .m_Key{ GetBackFilename(category) },
            .m_Encoded{ it->second },
            .m_Pos{ m_Layout.MirroredSlotPosition(slot) },
            .m_Size{ m_Layout.m_CardSize },
        });
    }

    DrawCutLines(page);
    page.Finish();
}

void PrintExportJob::DrawCutLines(PdfPage& page) const
{
    const PdfPage::LineStyle style{
        .m_Thickness{ m_Layout.m_CutLineThickness },
        .m_Color{ ToColorRGB32f(m_Layout.m_CutLineColor) },
    };
    for (const CutLine& line : m_Layout.CutLines())
    {
        page.DrawSolidLine({ line.m_From, line.m_To }, style);
    }
}
