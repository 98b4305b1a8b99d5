#include <mcm/export/card_export.hpp>

#include <stdexcept>

#include <fmt/format.h>

#include <mcm/card/card_format.hpp>
#include <mcm/util/log.hpp>

fs::path ExportCard(const CardRecord& card,
                    std::optional<size_t> index,
                    CardRasterizer& rasterizer,
                    const fs::path& output_dir,
                    std::optional<int32_t> png_compression)
{
    const Image image{ rasterizer.Capture(card, index.value_or(0)) };

    if (!fs::exists(output_dir))
    {
        fs::create_directories(output_dir);
    }

    const fs::path output_path{ output_dir / GetExportFilename(card, index) };
    LogInfo("Saving card \"{}\" to {}...", card.m_Title, output_path.string());
    if (!image.Write(output_path, png_compression))
    {
        throw std::runtime_error{ fmt::format("Could not write {}", output_path.string()) };
    }
    return output_path;
}
