#include <mcm/export/archive_export.hpp>

#include <stdexcept>

#include <fmt/format.h>

#include <mcm/card/card_format.hpp>
#include <mcm/util/log.hpp>

ArchiveExportJob::ArchiveExportJob(std::vector<CardRecord> cards, CardRasterizer& rasterizer, ArchiveExportOptions options)
    : ExportJob{ std::move(cards), rasterizer }
    , m_Options{ std::move(options) }
{
}

ArchiveExportJob::~ArchiveExportJob()
{
    // Removes a partially written archive
    m_Writer.reset();
}

const std::vector<fs::path>& ArchiveExportJob::GetWrittenArchives() const
{
    return m_WrittenArchives;
}

fs::path ArchiveExportJob::GetArchiveName(size_t part_index, size_t num_parts)
{
    if (num_parts <= 1)
    {
        return "munchkin_cards.zip"_p;
    }
    return fmt::format("munchkin_cards_partie{}_sur_{}.zip", part_index + 1, num_parts);
}

size_t ArchiveExportJob::GetPartCount() const
{
    const size_t total{ GetTotal() };
    if (m_Options.m_ChunkSize == 0 || total == 0)
    {
        return 1;
    }
    return (total + m_Options.m_ChunkSize - 1) / m_Options.m_ChunkSize;
}

size_t ArchiveExportJob::GetPartIndex(size_t card_index) const
{
    if (m_Options.m_ChunkSize == 0)
    {
        return 0;
    }
    return card_index / m_Options.m_ChunkSize;
}

void ArchiveExportJob::OpenPart(size_t part_index)
{
    if (!fs::exists(m_Options.m_OutputDir))
    {
        fs::create_directories(m_Options.m_OutputDir);
    }

    m_Writer = std::make_unique<ArchiveWriter>(m_Options.m_OutputDir / GetArchiveName(part_index, GetPartCount()));
    m_OpenPart = part_index;
}

void ArchiveExportJob::ProcessCard(size_t index, const CardRecord& card, Image image)
{
    const EncodedImage png{ image.EncodePng(m_Options.m_PngCompression) };

    // Release the bitmap before packaging
    image = Image{};

    if (png.empty())
    {
        throw std::runtime_error{ fmt::format("Could not encode card {} \"{}\" as png", index + 1, card.m_Title) };
    }

    const size_t part_index{ GetPartIndex(index) };
    if (m_Writer != nullptr && m_OpenPart != part_index)
    {
        m_WrittenArchives.push_back(m_Writer->Commit());
        m_Writer.reset();
    }
    if (m_Writer == nullptr)
    {
        OpenPart(part_index);
    }

    m_Writer->AddEntry(GetExportFilename(card, index), png);
}

void ArchiveExportJob::Finish()
{
    if (m_Writer == nullptr && m_WrittenArchives.empty())
    {
        LogWarning("No card could be captured, writing an empty archive");
        OpenPart(0);
    }

    if (m_Writer != nullptr)
    {
        auto writer{ std::move(m_Writer) };
        m_WrittenArchives.push_back(writer->Commit());
    }
}

void ArchiveExportJob::Abort()
{
    m_Writer.reset();
}
