#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <mcm/export/archive_writer.hpp>
#include <mcm/export/export_job.hpp>

struct ArchiveExportOptions
{
    fs::path m_OutputDir{ "."_p };
    // Zero writes a single archive
    uint32_t m_ChunkSize{ 0 };
    std::optional<int32_t> m_PngCompression{ std::nullopt };
};

class ArchiveExportJob final : public ExportJob
{
  public:
    ArchiveExportJob(std::vector<CardRecord> cards, CardRasterizer& rasterizer, ArchiveExportOptions options);
    virtual ~ArchiveExportJob() override;

    const std::vector<fs::path>& GetWrittenArchives() const;

    static fs::path GetArchiveName(size_t part_index, size_t num_parts);

  protected:
    virtual void ProcessCard(size_t index, const CardRecord& card, Image image) override;
    virtual void Finish() override;
    virtual void Abort() override;

  private:
    size_t GetPartCount() const;
    size_t GetPartIndex(size_t card_index) const;
    void OpenPart(size_t part_index);

    ArchiveExportOptions m_Options;

    std::unique_ptr<ArchiveWriter> m_Writer;
    size_t m_OpenPart{ 0 };

    std::vector<fs::path> m_WrittenArchives;
};
