#include <algorithm>
#include <atomic>
#include <charconv>
#include <csignal>
#include <memory>
#include <optional>
#include <ranges>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include <magic_enum/magic_enum.hpp>

#include <QGuiApplication>
#include <QTimer>

#include <mcm/card/deck.hpp>
#include <mcm/config.hpp>
#include <mcm/export/archive_export.hpp>
#include <mcm/export/card_export.hpp>
#include <mcm/export/print_export.hpp>
#include <mcm/pdf/backend.hpp>
#include <mcm/render/asset_cache.hpp>
#include <mcm/render/fonts.hpp>
#include <mcm/render/rasterizer.hpp>
#include <mcm/util/log.hpp>
#include <mcm/version.hpp>

enum class ExportMode
{
    Single,
    Archive,
    Print,
};

struct CommandLineOptions
{
    bool m_HelpDisplayed{ false };
    bool m_Valid{ true };

    std::optional<fs::path> m_DeckFile{ std::nullopt };
    ExportMode m_Mode{ ExportMode::Single };
    std::optional<size_t> m_Index{ std::nullopt };

    std::optional<fs::path> m_OutputDir{ std::nullopt };
    fs::path m_ConfigFile{ "config.ini"_p };
    std::optional<PdfBackend> m_Backend{ std::nullopt };
};

constexpr const char c_HelpStr[]{
    R"(
Command Line Interface for Munchkin-Card-Maker

    --help                  Display this information.
    --version               Display the version.
    --deck <file>           Load cards and settings from this deck file.
    --export <mode>         One of single, archive or print, defaults to single.
    --index <n>             Only export the card at this zero based index,
                            only valid with --export single.
    --out <dir>             Write exports into this folder instead of
                            the one from the configuration.
    --config <file>         Read configuration from this file, defaults
                            to config.ini.
    --backend <name>        Override the print backend, PoDoFo or Png.
    --verbose               Also print debug messages.
)"
};

CommandLineOptions ParseCommandLine(int argc, char** raw_argv)
{
    using namespace std::string_view_literals;

    std::span argv{ raw_argv, static_cast<size_t>(argc) };

    CommandLineOptions cli;

    if (std::ranges::contains(argv, "--help"sv))
    {
        fmt::print("{}", c_HelpStr);
        cli.m_HelpDisplayed = true;
        return cli;
    }

    if (std::ranges::contains(argv, "--version"sv))
    {
        fmt::print("{} ({})\n", McmVersion(), McmBuildTime());
        cli.m_HelpDisplayed = true;
        return cli;
    }

    const auto next_param{
        [&](size_t& i, std::string_view arg) -> std::optional<std::string_view>
        {
            if (i + 1 >= argv.size())
            {
                LogError("Command line option {} expects a value", arg);
                cli.m_Valid = false;
                return std::nullopt;
            }
            return std::string_view{ argv[++i] };
        }
    };

    for (size_t i = 1; i < argv.size(); i++)
    {
        const std::string_view arg{ argv[i] };
        if (arg == "--deck")
        {
            if (auto param{ next_param(i, arg) })
            {
                cli.m_DeckFile = fs::path{ param.value() };
            }
        }
        else if (arg == "--export")
        {
            if (auto param{ next_param(i, arg) })
            {
                if (auto mode{ magic_enum::enum_cast<ExportMode>(param.value(), magic_enum::case_insensitive) })
                {
                    cli.m_Mode = mode.value();
                }
                else
                {
                    LogError("Unknown export mode {}", param.value());
                    cli.m_Valid = false;
                }
            }
        }
        else if (arg == "--index")
        {
            if (auto param{ next_param(i, arg) })
            {
                size_t index{};
                const auto [ptr, ec]{ std::from_chars(param->data(), param->data() + param->size(), index) };
                if (ec != std::errc{} || ptr != param->data() + param->size())
                {
                    LogError("Expected a card index but got {}", param.value());
                    cli.m_Valid = false;
                }
                else
                {
                    cli.m_Index = index;
                }
            }
        }
        else if (arg == "--out")
        {
            if (auto param{ next_param(i, arg) })
            {
                cli.m_OutputDir = fs::path{ param.value() };
            }
        }
        else if (arg == "--config")
        {
            if (auto param{ next_param(i, arg) })
            {
                cli.m_ConfigFile = fs::path{ param.value() };
            }
        }
        else if (arg == "--backend")
        {
            if (auto param{ next_param(i, arg) })
            {
                if (auto backend{ magic_enum::enum_cast<PdfBackend>(param.value(), magic_enum::case_insensitive) })
                {
                    cli.m_Backend = backend.value();
                }
                else
                {
                    LogError("Unknown backend {}", param.value());
                    cli.m_Valid = false;
                }
            }
        }
        else if (arg == "--verbose")
        {
            // Consumed before the log is created
        }
        else
        {
            LogError("Unknown command line option {}", arg);
            cli.m_Valid = false;
        }
    }

    if (!cli.m_DeckFile.has_value())
    {
        LogError("No deck given, pass one with --deck <file>");
        cli.m_Valid = false;
    }

    if (cli.m_Index.has_value() && cli.m_Mode != ExportMode::Single)
    {
        LogError("--index can only be used with --export single");
        cli.m_Valid = false;
    }

    return cli;
}

namespace
{
std::atomic<ExportJob*> g_RunningJob{ nullptr };

extern "C" void HandleInterrupt(int /*signal*/)
{
    if (ExportJob* job{ g_RunningJob.load() })
    {
        job->Cancel();
    }
}

int ExportSingle(const Deck& deck, const CommandLineOptions& cli, const Config& config, CardRasterizer& rasterizer)
{
    const fs::path& output_dir{ cli.m_OutputDir.value_or(config.m_OutputDir) };

    if (cli.m_Index.has_value())
    {
        const size_t index{ cli.m_Index.value() };
        if (index >= deck.m_Cards.size())
        {
            LogError("Card index {} is out of range, the deck has {} cards", index, deck.m_Cards.size());
            return 1;
        }

        try
        {
            ExportCard(deck.m_Cards[index], index, rasterizer, output_dir, config.m_PngCompression);
        }
        catch (const std::exception& e)
        {
            LogError("Failed exporting card {} \"{}\": {}", index + 1, deck.m_Cards[index].m_Title, e.what());
            return 1;
        }
        return 0;
    }

    int result{ 0 };
    for (size_t i = 0; i < deck.m_Cards.size(); i++)
    {
        try
        {
            ExportCard(deck.m_Cards[i], i, rasterizer, output_dir, config.m_PngCompression);
        }
        catch (const std::exception& e)
        {
            LogError("Failed exporting card {} \"{}\": {}", i + 1, deck.m_Cards[i].m_Title, e.what());
            result = 1;
        }
    }
    return result;
}

int RunJob(QGuiApplication& app, ExportJob& job)
{
    job.SetProgressCallback(
        [](size_t current, size_t total)
        {
            LogInfo("Exported {}/{} cards", current, total);
        });

    g_RunningJob = &job;
    std::signal(SIGINT, HandleInterrupt);

    QTimer step_timer;
    step_timer.setInterval(0);
    QObject::connect(&step_timer,
                     &QTimer::timeout,
                     &app,
                     [&]
                     {
                         if (!job.Step())
                         {
                             step_timer.stop();
                             app.quit();
                         }
                     });
    step_timer.start();
    app.exec();

    std::signal(SIGINT, SIG_DFL);
    g_RunningJob = nullptr;

    if (!job.FailedCards().empty())
    {
        LogWarning("{} card(s) could not be captured and were skipped", job.FailedCards().size());
    }

    switch (job.GetState())
    {
    case ExportJob::State::Done:
        return 0;
    case ExportJob::State::Cancelled:
        LogWarning("Export was cancelled");
        return 1;
    default:
        LogError("Export failed: {}", job.GetError());
        return 1;
    }
}
} // namespace

int main(int argc, char** argv)
{
    LogFlags log_flags{
        LogFlags::Console |
        LogFlags::File |
        LogFlags::FatalQuit |
        LogFlags::DetailTime |
        LogFlags::DetailFile |
        LogFlags::DetailLine |
        LogFlags::DetailCard
    };
    if (std::ranges::contains(std::span{ argv, static_cast<size_t>(argc) }, std::string_view{ "--verbose" }))
    {
        log_flags |= LogFlags::Verbose;
    }
    Log main_log{ log_flags, Log::c_MainLogName };

    const CommandLineOptions cli{ ParseCommandLine(argc, argv) };
    if (cli.m_HelpDisplayed)
    {
        return 0;
    }
    if (!cli.m_Valid)
    {
        fmt::print("{}", c_HelpStr);
        return 2;
    }

    // Cards are painted without a display
    if (!qEnvironmentVariableIsSet("QT_QPA_PLATFORM"))
    {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
    QGuiApplication app{ argc, argv };

    Config config{ LoadConfig(cli.m_ConfigFile) };
    if (cli.m_Backend.has_value())
    {
        config.m_Backend = cli.m_Backend.value();
    }

    try
    {
        Deck deck{ LoadDeck(cli.m_DeckFile.value()) };
        deck.m_RenderConfig.m_AssetRoot = config.m_AssetRoot;

        AssetCache assets{ deck.m_RenderConfig, config.m_ImageLoadTimeout, deck.m_BaseDir };
        CompositingRasterizer rasterizer{ deck.m_RenderConfig, assets };

        const fs::path output_dir{ cli.m_OutputDir.value_or(config.m_OutputDir) };

        switch (cli.m_Mode)
        {
        case ExportMode::Single:
            LoadFonts(config.m_FontDir, config.m_FontLoadTimeout);
            return ExportSingle(deck, cli, config, rasterizer);
        case ExportMode::Archive:
        {
            LoadFonts(config.m_FontDir, config.m_FontLoadTimeout);

            ArchiveExportJob job{
                deck.m_Cards,
                rasterizer,
                ArchiveExportOptions{
                    .m_OutputDir{ output_dir },
                    .m_ChunkSize{ config.m_ArchiveChunkSize },
                    .m_PngCompression{ config.m_PngCompression },
                },
            };
            job.SetSettleDelay(config.m_SettleDelay);
            return RunJob(app, job);
        }
        case ExportMode::Print:
        {
            const PrintLayout layout{};
            PrintExportJob job{
                deck.m_Cards,
                rasterizer,
                assets,
                [&]
                { return CreatePdfDocument(config.m_Backend, layout, config); },
                layout,
                PrintExportOptions{
                    .m_OutputDir{ output_dir },
                    .m_ChunkSize{ config.m_PrintChunkSize },
                    .m_JpgQuality{ config.m_JpgQuality },
                    .m_FontDir{ config.m_FontDir },
                    .m_FontLoadTimeout{ config.m_FontLoadTimeout },
                },
            };
            job.SetSettleDelay(config.m_SettleDelay);
            job.SetPrintProgressCallback(
                [](size_t current, size_t total, ChunkInfo chunk)
                {
                    if (chunk.m_TotalChunks > 1)
                    {
                        LogInfo("Document {}/{}: {}/{} cards", chunk.m_Chunk, chunk.m_TotalChunks, current, total);
                    }
                });
            return RunJob(app, job);
        }
        }
    }
    catch (const std::exception& e)
    {
        LogError("{}", e.what());
        return 1;
    }

    return 0;
}
