#include <mcm/util.hpp>

#include <fstream>

#include <mcm/util/log.hpp>

std::vector<fs::path> ListFiles(const fs::path& path, const std::span<const fs::path> extensions)
{
    std::vector<fs::path> files;
    ForEachFile(
        path,
        [&files](const fs::path& file)
        {
            files.push_back(file);
        },
        extensions);
    std::ranges::sort(files);
    return files;
}

bool WriteFileAtomic(const fs::path& path, std::span<const std::byte> data)
{
    fs::path temp_path{ path };
    temp_path += ".part";

    {
        std::ofstream file{ temp_path, std::ios::binary | std::ios::trunc };
        if (!file)
        {
            LogError("Could not open {} for writing", temp_path.string());
            return false;
        }

        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!file)
        {
            LogError("Failed writing {} bytes to {}", data.size(), temp_path.string());
            file.close();

            std::error_code error;
            fs::remove(temp_path, error);
            return false;
        }
    }

    std::error_code error;
    fs::rename(temp_path, path, error);
    if (error)
    {
        LogError("Failed moving {} into place: {}", path.string(), error.message());
        fs::remove(temp_path, error);
        return false;
    }
    return true;
}
