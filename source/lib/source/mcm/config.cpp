#include <mcm/config.hpp>

#include <algorithm>

#include <QFile>
#include <QSettings>

#include <magic_enum/magic_enum.hpp>

#include <mcm/qt_util.hpp>
#include <mcm/util/log.hpp>
#include <mcm/version.hpp>

Config LoadConfig(const fs::path& path)
{
    Config config{};
    if (!QFile::exists(ToQString(path)))
    {
        SaveConfig(config, path);
        return config;
    }

    QSettings settings(ToQString(path), QSettings::IniFormat);
    if (settings.status() != QSettings::Status::NoError)
    {
        LogWarning("Could not read {}, using default configuration", path.string());
        return config;
    }

    static constexpr auto c_ToPath{
        [](const QVariant& value, const fs::path& fallback)
        {
            const QString str{ value.toString() };
            return str.isEmpty() ? fallback : fs::path{ str.toStdU16String() };
        }
    };
    static constexpr auto c_ToMilliseconds{
        [](const QVariant& value)
        {
            return std::chrono::milliseconds{ std::max(value.toInt(), 0) };
        }
    };

    settings.beginGroup("DEFAULT");

    if (const auto version{ settings.value("Config.Version").toString().toStdString() };
        !version.empty() && version != ConfigFormatVersion())
    {
        LogWarning("{} was written with config format {}, expected {}", path.string(), version, ConfigFormatVersion());
    }

    config.m_AssetRoot = c_ToPath(settings.value("Asset.Root"), config.m_AssetRoot);
    config.m_FontDir = c_ToPath(settings.value("Font.Dir"), config.m_FontDir);
    config.m_OutputDir = c_ToPath(settings.value("Output.Dir"), config.m_OutputDir);

    {
        const auto pdf_backend{ settings.value("PDF.Backend", "PoDoFo").toString().toStdString() };
        config.m_Backend = magic_enum::enum_cast<PdfBackend>(pdf_backend)
                               .value_or(PdfBackend::PoDoFo);
    }

    config.m_PngDPI = std::max(settings.value("Png.DPI", 300).toInt(), 1) * 1_dpi;

    {
        auto png_compression{ settings.value("Png.Compression") };
        if (png_compression.isValid())
        {
            config.m_PngCompression = std::clamp(png_compression.toInt(), 0, 9);
        }
    }

    config.m_JpgQuality = std::clamp(settings.value("Jpg.Quality", 85).toInt(), 0, 100);

    config.m_PrintChunkSize = static_cast<uint32_t>(std::max(settings.value("Print.Chunk.Size", 81).toInt(), 1));
    config.m_ArchiveChunkSize = static_cast<uint32_t>(std::max(settings.value("Archive.Chunk.Size", 0).toInt(), 0));

    config.m_ImageLoadTimeout = c_ToMilliseconds(settings.value("Image.Load.Timeout.Ms", 5000));
    config.m_FontLoadTimeout = c_ToMilliseconds(settings.value("Font.Load.Timeout.Ms", 5000));
    config.m_SettleDelay = c_ToMilliseconds(settings.value("Settle.Delay.Ms", 0));

    settings.endGroup();

    return config;
}

void SaveConfig(const Config& config, const fs::path& path)
{
    QSettings settings(ToQString(path), QSettings::IniFormat);
    if (settings.status() == QSettings::Status::NoError)
    {
        settings.beginGroup("DEFAULT");

        settings.setValue("Config.Version", ToQString(ConfigFormatVersion()));
        settings.setValue("Asset.Root", ToQString(config.m_AssetRoot));
        settings.setValue("Font.Dir", ToQString(config.m_FontDir));
        settings.setValue("Output.Dir", ToQString(config.m_OutputDir));

        const std::string_view pdf_backend{ magic_enum::enum_name(config.m_Backend) };
        settings.setValue("PDF.Backend", ToQString(pdf_backend));

        settings.setValue("Png.DPI", static_cast<int>(config.m_PngDPI / 1_dpi));
        if (config.m_PngCompression.has_value())
        {
            settings.setValue("Png.Compression", config.m_PngCompression.value());
        }
        settings.setValue("Jpg.Quality", config.m_JpgQuality);

        settings.setValue("Print.Chunk.Size", config.m_PrintChunkSize);
        settings.setValue("Archive.Chunk.Size", config.m_ArchiveChunkSize);

        settings.setValue("Image.Load.Timeout.Ms", static_cast<qlonglong>(config.m_ImageLoadTimeout.count()));
        settings.setValue("Font.Load.Timeout.Ms", static_cast<qlonglong>(config.m_FontLoadTimeout.count()));
        settings.setValue("Settle.Delay.Ms", static_cast<qlonglong>(config.m_SettleDelay.count()));

        settings.endGroup();
    }
    settings.sync();
}
