#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include <mcm/util.hpp>

enum class PdfBackend
{
    PoDoFo,
    Png,
};

struct Config
{
    fs::path m_AssetRoot{ "."_p };
    fs::path m_FontDir{ "fonts"_p };
    fs::path m_OutputDir{ "."_p };

    PdfBackend m_Backend{ PdfBackend::PoDoFo };
    PixelDensity m_PngDPI{ 300_dpi };
    std::optional<int32_t> m_PngCompression{ std::nullopt };
    int32_t m_JpgQuality{ 85 };

    uint32_t m_PrintChunkSize{ 81 };
    uint32_t m_ArchiveChunkSize{ 0 };

    std::chrono::milliseconds m_ImageLoadTimeout{ 5000 };
    std::chrono::milliseconds m_FontLoadTimeout{ 5000 };
    std::chrono::milliseconds m_SettleDelay{ 0 };
};

Config LoadConfig(const fs::path& path = "config.ini"_p);
void SaveConfig(const Config& config, const fs::path& path = "config.ini"_p);
