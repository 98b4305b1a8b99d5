#include <mcm/render/fonts.hpp>

#include <array>

#include <QFontDatabase>

#include <mcm/qt_util.hpp>
#include <mcm/util/log.hpp>

size_t LoadFonts(const fs::path& font_dir, std::chrono::milliseconds timeout)
{
    if (!fs::is_directory(font_dir))
    {
        LogWarning("Font folder {} does not exist, falling back to system fonts", font_dir.string());
        return 0;
    }

    static const std::array c_FontExtensions{ ".ttf"_p, ".otf"_p, ".ttc"_p };

    const auto deadline{ std::chrono::steady_clock::now() + timeout };
    size_t num_loaded{ 0 };
    for (const fs::path& font_file : ListFiles(font_dir, c_FontExtensions))
    {
        if (std::chrono::steady_clock::now() > deadline)
        {
            LogWarning("Loading fonts exceeded {}ms, continuing with {} fonts", timeout.count(), num_loaded);
            break;
        }

        const int font_id{ QFontDatabase::addApplicationFont(ToQString(font_file)) };
        if (font_id == -1)
        {
            LogWarning("Could not load font {}", font_file.string());
            continue;
        }

        LogDebug("Loaded font families {} from {}",
                 QFontDatabase::applicationFontFamilies(font_id).join(", ").toStdString(),
                 font_file.filename().string());
        ++num_loaded;
    }
    return num_loaded;
}
