#include <catch2/catch_test_macros.hpp>

#include <array>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <archive.h>
#include <archive_entry.h>

#include <opencv2/core.hpp>

#include <mcm/export/archive_export.hpp>
#include <mcm/export/archive_writer.hpp>
#include <mcm/export/card_export.hpp>
#include <mcm/export/print_export.hpp>
#include <mcm/pdf/backend.hpp>
#include <mcm/util/at_scope_exit.hpp>
#include <mcm/util/log.hpp>

namespace
{
class FakeRasterizer final : public CardRasterizer
{
  public:
    explicit FakeRasterizer(std::set<size_t> failing = {})
        : m_Failing{ std::move(failing) }
    {
    }

    virtual Image Capture(const CardRecord& card, size_t index) override
    {
        m_Captured.push_back(index);
        if (m_Failing.contains(index))
        {
            throw std::runtime_error{ "Capture timed out for " + card.m_Title };
        }
        return Image{ cv::Mat{ 16, 10, CV_8UC4, cv::Scalar{ 40, 80, 120, 255 } } };
    }

    std::set<size_t> m_Failing;
    std::vector<size_t> m_Captured;
};

std::vector<CardRecord> MakeCards(size_t count)
{
    std::vector<CardRecord> cards;
    for (size_t i = 0; i < count; i++)
    {
        CardRecord card{};
        card.m_Type = i % 2 == 0 ? CardType::Monster : CardType::Item;
        card.m_Title = "Carte " + std::to_string(i + 1);
        cards.push_back(std::move(card));
    }
    return cards;
}

std::vector<std::string> ListArchiveEntries(const fs::path& path)
{
    std::vector<std::string> entries;

    archive* reader{ archive_read_new() };
    AtScopeExit free_reader{
        [reader]()
        {
            archive_read_free(reader);
        }
    };
    archive_read_support_format_zip(reader);
    if (archive_read_open_filename(reader, path.string().c_str(), 10240) != ARCHIVE_OK)
    {
        return entries;
    }

    archive_entry* entry{ nullptr };
    while (archive_read_next_header(reader, &entry) == ARCHIVE_OK)
    {
        entries.emplace_back(archive_entry_pathname(entry));
        archive_read_data_skip(reader);
    }
    return entries;
}

struct TempDir
{
    explicit TempDir(std::string_view name)
        : m_Path{ fs::temp_directory_path() / name }
    {
        fs::remove_all(m_Path);
        fs::create_directories(m_Path);
    }
    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(m_Path, ec);
    }

    fs::path m_Path;
};

struct RecordedPage
{
    std::vector<std::string> m_ImageKeys;
    std::vector<Position> m_ImagePositions;
    size_t m_NumFills{ 0 };
    size_t m_NumLines{ 0 };
    bool m_Finished{ false };
};

struct RecordedDocument
{
    std::vector<RecordedPage> m_Pages;
    fs::path m_WrittenTo;
};

class RecordingPage final : public PdfPage
{
  public:
    explicit RecordingPage(RecordedPage& page)
        : m_Page{ page }
    {
    }

    virtual void FillRect(RectData /*data*/, ColorRGB32f /*color*/) override
    {
        ++m_Page.m_NumFills;
    }

    virtual void DrawSolidLine(LineData /*data*/, LineStyle /*style*/) override
    {
        ++m_Page.m_NumLines;
    }

    virtual void DrawImage(ImageData data) override
    {
        REQUIRE_FALSE(data.m_Encoded.empty());
        m_Page.m_ImageKeys.emplace_back(data.m_Key);
        m_Page.m_ImagePositions.push_back(data.m_Pos);
    }

    virtual void Finish() override
    {
        m_Page.m_Finished = true;
    }

  private:
    RecordedPage& m_Page;
};

class RecordingDocument final : public PdfDocument
{
  public:
    explicit RecordingDocument(std::vector<RecordedDocument>& documents)
        : m_Documents{ documents }
    {
        m_Documents.emplace_back();
    }

    virtual void ReservePages(size_t pages) override
    {
        m_Documents.back().m_Pages.reserve(pages);
    }

    virtual PdfPage* NextPage() override
    {
        RecordedPage& page{ m_Documents.back().m_Pages.emplace_back() };
        m_Pages.push_back(std::make_unique<RecordingPage>(page));
        return m_Pages.back().get();
    }

    virtual fs::path Write(fs::path path) override
    {
        m_Documents.back().m_WrittenTo = path;
        return path;
    }

  private:
    std::vector<RecordedDocument>& m_Documents;
    std::vector<std::unique_ptr<RecordingPage>> m_Pages;
};
} // namespace

TEST_CASE("Archive writer commits atomically", "[export_archive_writer]")
{
    const TempDir dir{ "mcm_archive_writer" };
    const fs::path path{ dir.m_Path / "cards.zip" };

    {
        ArchiveWriter writer{ path };
        const std::array<std::byte, 3> data{ std::byte{ 1 }, std::byte{ 2 }, std::byte{ 3 } };
        writer.AddEntry("a.png", data);
        writer.AddEntry("b.png", data);
        REQUIRE(writer.EntryCount() == 2);
        REQUIRE_FALSE(fs::exists(path));
        REQUIRE(writer.Commit() == path);
    }
    REQUIRE(fs::exists(path));
    REQUIRE(ListArchiveEntries(path) == std::vector<std::string>{ "a.png", "b.png" });

    {
        ArchiveWriter writer{ dir.m_Path / "discarded.zip" };
        writer.AddEntry("a.png", {});
    }
    REQUIRE_FALSE(fs::exists(dir.m_Path / "discarded.zip"));
    REQUIRE_FALSE(fs::exists(dir.m_Path / "discarded.zip.part"));
}

TEST_CASE("Archive export packs every card in order", "[export_archive]")
{
    const TempDir dir{ "mcm_archive_export" };

    FakeRasterizer rasterizer{};
    ArchiveExportJob job{ MakeCards(3), rasterizer, ArchiveExportOptions{ .m_OutputDir{ dir.m_Path } } };

    std::vector<std::pair<size_t, size_t>> progress;
    job.SetProgressCallback(
        [&](size_t current, size_t total)
        {
            progress.emplace_back(current, total);
        });

    REQUIRE(job.Run() == ExportJob::State::Done);
    REQUIRE(rasterizer.m_Captured == std::vector<size_t>{ 0, 1, 2 });
    REQUIRE(progress == std::vector<std::pair<size_t, size_t>>{ { 1, 3 }, { 2, 3 }, { 3, 3 } });

    REQUIRE(job.GetWrittenArchives().size() == 1);
    const fs::path archive_path{ dir.m_Path / "munchkin_cards.zip" };
    REQUIRE(job.GetWrittenArchives()[0] == archive_path);
    REQUIRE(ListArchiveEntries(archive_path) == std::vector<std::string>{
                                                    "Donjon_Monstre_001_carte-1.png",
                                                    "Tresor_Objet_002_carte-2.png",
                                                    "Donjon_Monstre_003_carte-3.png",
                                                });
}

TEST_CASE("Failed captures are skipped and reported", "[export_archive_failure]")
{
    const TempDir dir{ "mcm_archive_failure" };

    std::vector<std::string> errors;
    std::vector<std::string> error_cards;
    Log* log{ Log::GetInstance(Log::c_MainLogName) };
    REQUIRE(log != nullptr);
    const uint32_t hook{ log->InstallHook(
        [&](const Log::DetailInformation& detail, Log::LogLevel level, std::string_view message)
        {
            if (level == Log::LogLevel::Error)
            {
                errors.emplace_back(message);
                error_cards.emplace_back(detail.m_Card);
            }
        }) };
    AtScopeExit uninstall_hook{
        [&]()
        {
            log->UninstallHook(hook);
        }
    };

    FakeRasterizer rasterizer{ { 1 } };
    ArchiveExportJob job{ MakeCards(3), rasterizer, ArchiveExportOptions{ .m_OutputDir{ dir.m_Path } } };

    REQUIRE(job.Run() == ExportJob::State::Done);
    REQUIRE(job.FailedCards() == std::vector<size_t>{ 1 });
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].find("Carte 2") != std::string::npos);
    REQUIRE(error_cards[0] == "2/3 \"Carte 2\"");
    REQUIRE(Log::GetCardContext().empty());

    // Numbering follows the input, the failed card leaves a gap
    REQUIRE(ListArchiveEntries(dir.m_Path / "munchkin_cards.zip") == std::vector<std::string>{
                                                                         "Donjon_Monstre_001_carte-1.png",
                                                                         "Donjon_Monstre_003_carte-3.png",
                                                                     });
}

TEST_CASE("All captures failing still yields an archive", "[export_archive_all_failed]")
{
    const TempDir dir{ "mcm_archive_all_failed" };

    FakeRasterizer rasterizer{ { 0, 1 } };
    ArchiveExportJob job{ MakeCards(2), rasterizer, ArchiveExportOptions{ .m_OutputDir{ dir.m_Path } } };

    REQUIRE(job.Run() == ExportJob::State::Done);
    REQUIRE(fs::exists(dir.m_Path / "munchkin_cards.zip"));
    REQUIRE(ListArchiveEntries(dir.m_Path / "munchkin_cards.zip").empty());
}

TEST_CASE("Archive export in parts", "[export_archive_chunked]")
{
    const TempDir dir{ "mcm_archive_chunked" };

    FakeRasterizer rasterizer{};
    ArchiveExportJob job{
        MakeCards(5),
        rasterizer,
        ArchiveExportOptions{
            .m_OutputDir{ dir.m_Path },
            .m_ChunkSize = 2,
        },
    };

    REQUIRE(job.Run() == ExportJob::State::Done);
    REQUIRE(job.GetWrittenArchives() == std::vector<fs::path>{
                                            dir.m_Path / "munchkin_cards_partie1_sur_3.zip",
                                            dir.m_Path / "munchkin_cards_partie2_sur_3.zip",
                                            dir.m_Path / "munchkin_cards_partie3_sur_3.zip",
                                        });
    REQUIRE(ListArchiveEntries(job.GetWrittenArchives()[2]).size() == 1);
}

TEST_CASE("Cancelled archive export leaves nothing behind", "[export_archive_cancel]")
{
    const TempDir dir{ "mcm_archive_cancel" };

    FakeRasterizer rasterizer{};
    ArchiveExportJob job{ MakeCards(4), rasterizer, ArchiveExportOptions{ .m_OutputDir{ dir.m_Path } } };
    job.SetProgressCallback(
        [&](size_t current, size_t /*total*/)
        {
            if (current == 2)
            {
                job.Cancel();
            }
        });

    REQUIRE(job.Run() == ExportJob::State::Cancelled);
    REQUIRE(job.IsCancelled());
    REQUIRE(rasterizer.m_Captured.size() == 2);
    REQUIRE(job.GetWrittenArchives().empty());
    REQUIRE_FALSE(fs::exists(dir.m_Path / "munchkin_cards.zip"));
    REQUIRE_FALSE(fs::exists(dir.m_Path / "munchkin_cards.zip.part"));
    REQUIRE_FALSE(job.Step());
}

TEST_CASE("Print export pairs face and back pages", "[export_print]")
{
    const TempDir dir{ "mcm_print_export" };

    // 1x1 png
    const std::string back_url{
        "data:image/png;base64,"
        "iVBORw0KGgoAAAANSUhEUgAAAAEAAAABCAYAAAAfFcSJAAAADUlEQVR42mNkYPhfDwAChwGA60e6kgAAAABJRU5ErkJggg=="
    };

    RenderConfig config{};
    config.m_AssetRoot = dir.m_Path / "no_assets";
    config.m_CustomBacks[BackCategory::Donjon] = back_url;
    config.m_CustomBacks[BackCategory::Tresor] = back_url;
    AssetCache assets{ config, std::chrono::milliseconds{ 5000 } };

    std::vector<RecordedDocument> documents;
    FakeRasterizer rasterizer{};
    PrintExportJob job{
        MakeCards(11),
        rasterizer,
        assets,
        [&]()
        { return std::make_unique<RecordingDocument>(documents); },
        PrintLayout{},
        PrintExportOptions{
            .m_OutputDir{ dir.m_Path },
            .m_ChunkSize = 81,
            .m_FontDir{ dir.m_Path / "no_fonts" },
        },
    };

    std::vector<ChunkInfo> chunks;
    job.SetPrintProgressCallback(
        [&](size_t /*current*/, size_t /*total*/, ChunkInfo chunk)
        {
            chunks.push_back(chunk);
        });

    REQUIRE(job.Run() == ExportJob::State::Done);
    REQUIRE(chunks.size() == 11);
    REQUIRE(chunks.front().m_Chunk == 1);
    REQUIRE(chunks.front().m_TotalChunks == 1);

    REQUIRE(documents.size() == 1);
    REQUIRE(documents[0].m_WrittenTo == dir.m_Path / "munchkin_bat.pdf");

    const auto& pages{ documents[0].m_Pages };
    REQUIRE(pages.size() == 4);
    REQUIRE(pages[0].m_ImageKeys.size() == 9);
    REQUIRE(pages[1].m_ImageKeys.size() == 9);
    REQUIRE(pages[2].m_ImageKeys.size() == 2);
    REQUIRE(pages[3].m_ImageKeys.size() == 2);

    // Faces are unique, backs share one embedded image per category
    REQUIRE(pages[0].m_ImageKeys[0].empty());
    REQUIRE(pages[1].m_ImageKeys[0] == "layout_back_donjon.png");
    REQUIRE(pages[1].m_ImageKeys[1] == "layout_back_tresors.png");

    // First back sits behind the first face when the sheet is flipped
    const PrintLayout layout{};
    REQUIRE(pages[1].m_ImagePositions[0] == layout.MirroredSlotPosition(0));
    REQUIRE(pages[0].m_ImagePositions[0] == layout.SlotPosition(0));

    for (const RecordedPage& page : pages)
    {
        REQUIRE(page.m_Finished);
        REQUIRE(page.m_NumFills == 1);
        REQUIRE(page.m_NumLines == layout.CutLines().size());
    }
    REQUIRE(job.GetBufferedCards() == 0);
}

TEST_CASE("Print export splits into chunks", "[export_print_chunked]")
{
    const TempDir dir{ "mcm_print_chunked" };

    RenderConfig config{};
    config.m_AssetRoot = dir.m_Path / "no_assets";
    AssetCache assets{ config, std::chrono::milliseconds{ 5000 } };

    std::vector<RecordedDocument> documents;
    std::vector<size_t> buffered_at_progress;

    FakeRasterizer rasterizer{ { 3 } };
    PrintExportJob job{
        MakeCards(5),
        rasterizer,
        assets,
        [&]()
        { return std::make_unique<RecordingDocument>(documents); },
        PrintLayout{},
        PrintExportOptions{
            .m_OutputDir{ dir.m_Path },
            .m_ChunkSize = 2,
            .m_FontDir{ dir.m_Path / "no_fonts" },
        },
    };

    std::vector<size_t> chunk_numbers;
    job.SetPrintProgressCallback(
        [&](size_t /*current*/, size_t /*total*/, ChunkInfo chunk)
        {
            chunk_numbers.push_back(chunk.m_Chunk);
            buffered_at_progress.push_back(job.GetBufferedCards());
            REQUIRE(chunk.m_TotalChunks == 3);
        });

    REQUIRE(job.Run() == ExportJob::State::Done);
    REQUIRE(chunk_numbers == std::vector<size_t>{ 1, 1, 2, 2, 3 });

    // The buffer never holds more than one chunk
    REQUIRE(buffered_at_progress == std::vector<size_t>{ 1, 0, 1, 0, 0 });

    REQUIRE(documents.size() == 3);
    REQUIRE(documents[0].m_WrittenTo == dir.m_Path / "munchkin_bat_partie1.pdf");
    REQUIRE(documents[1].m_WrittenTo == dir.m_Path / "munchkin_bat_partie2.pdf");
    REQUIRE(documents[2].m_WrittenTo == dir.m_Path / "munchkin_bat_partie3.pdf");

    // Card 4 failed, the second chunk only holds card 3
    REQUIRE(documents[1].m_Pages[0].m_ImageKeys.size() == 1);

    // No backs could be found, back pages only carry their background
    REQUIRE(documents[0].m_Pages[1].m_ImageKeys.empty());
    REQUIRE(job.FailedCards() == std::vector<size_t>{ 3 });
}

TEST_CASE("Single card export writes one file", "[export_single]")
{
    const TempDir dir{ "mcm_single_export" };

    FakeRasterizer rasterizer{};
    const auto cards{ MakeCards(1) };

    const fs::path path{ ExportCard(cards[0], std::nullopt, rasterizer, dir.m_Path) };
    REQUIRE(path == dir.m_Path / "Donjon_Monstre_XXX_carte-1.png");
    REQUIRE(fs::exists(path));

    FakeRasterizer failing{ { 0 } };
    REQUIRE_THROWS(ExportCard(cards[0], 0, failing, dir.m_Path));
    REQUIRE_FALSE(fs::exists(dir.m_Path / "Donjon_Monstre_001_carte-1.png"));
}
