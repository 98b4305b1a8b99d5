#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <vector>

#include <mcm/export/export_job.hpp>
#include <mcm/export/print_layout.hpp>
#include <mcm/pdf/backend.hpp>
#include <mcm/render/asset_cache.hpp>

struct PrintExportOptions
{
    fs::path m_OutputDir{ "."_p };
    uint32_t m_ChunkSize{ 81 };
    int32_t m_JpgQuality{ 85 };

    fs::path m_FontDir{ "fonts"_p };
    std::chrono::milliseconds m_FontLoadTimeout{ 5000 };
};

struct ChunkInfo
{
    // One based
    size_t m_Chunk;
    size_t m_TotalChunks;
};

/*
        Captures cards as jpg into a buffer of at most one chunk and writes every chunk
        into its own document as pairs of face and mirrored back pages
*/
class PrintExportJob final : public ExportJob
{
  public:
    using DocumentFactory = std::function<std::unique_ptr<PdfDocument>()>;
    using PrintProgressCallback = std::function<void(size_t current, size_t total, ChunkInfo chunk)>;

    PrintExportJob(std::vector<CardRecord> cards,
                   CardRasterizer& rasterizer,
                   AssetCache& assets,
                   DocumentFactory document_factory,
                   PrintLayout layout = {},
                   PrintExportOptions options = {});
    virtual ~PrintExportJob() override = default;

    void SetPrintProgressCallback(PrintProgressCallback callback);

    const std::vector<fs::path>& GetWrittenDocuments() const;
    size_t GetBufferedCards() const;
    size_t GetChunkCount() const;

  protected:
    virtual void Begin() override;
    virtual void ProcessCard(size_t index, const CardRecord& card, Image image) override;
    virtual void EndCard(size_t index) override;
    virtual void Finish() override;
    virtual void Abort() override;

    virtual void ReportProgress() override;

  private:
    void WarmUpFonts();
    void Preload();
    void FlushChunk(size_t chunk_index);

    void DrawFacePage(PdfPage& page, size_t first, size_t count) const;
    void DrawBackPage(PdfPage& page, size_t first, size_t count) const;
    void DrawCutLines(PdfPage& page) const;

    struct CapturedCard
    {
        EncodedImage m_Encoded;
        BackCategory m_BackCategory;
        size_t m_Index;
    };

    AssetCache& m_Assets;
    DocumentFactory m_DocumentFactory;
    PrintLayout m_Layout;
    PrintExportOptions m_Options;

    PrintProgressCallback m_PrintProgressCallback;

    bool m_FontsWarmedUp{ false };
    std::map<BackCategory, EncodedImage> m_BackImages;

    std::vector<CapturedCard> m_Buffer;
    std::vector<fs::path> m_WrittenDocuments;
};
