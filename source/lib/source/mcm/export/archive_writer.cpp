#include <mcm/export/archive_writer.hpp>

#include <ctime>
#include <stdexcept>

#include <archive.h>
#include <archive_entry.h>

#include <fmt/format.h>

#include <mcm/util/at_scope_exit.hpp>
#include <mcm/util/log.hpp>

namespace
{
std::string ArchiveErrorString(archive* archive)
{
    const char* error{ archive_error_string(archive) };
    return error != nullptr ? error : "unknown archive error";
}
} // namespace

ArchiveWriter::ArchiveWriter(fs::path path)
    : m_Path{ std::move(path) }
    , m_PartPath{ fs::path{ m_Path } += ".part" }
    , m_Archive{ archive_write_new() }
{
    if (m_Archive == nullptr)
    {
        throw std::runtime_error{ "Could not allocate zip archive" };
    }

    if (archive_write_set_format_zip(m_Archive) != ARCHIVE_OK ||
        archive_write_set_options(m_Archive, "zip:compression=store") != ARCHIVE_OK ||
        archive_write_open_filename(m_Archive, m_PartPath.string().c_str()) != ARCHIVE_OK)
    {
        const std::string error{ ArchiveErrorString(m_Archive) };
        archive_write_free(m_Archive);
        m_Archive = nullptr;
        throw std::runtime_error{ fmt::format("Could not open {}: {}", m_PartPath.string(), error) };
    }

    LogInfo("Writing archive {}...", m_Path.string());
}

ArchiveWriter::~ArchiveWriter()
{
    Discard();
}

void ArchiveWriter::AddEntry(std::string_view name, std::span<const std::byte> data)
{
    if (m_Archive == nullptr)
    {
        throw std::logic_error{ fmt::format("Adding {} to an already closed archive", name) };
    }

    archive_entry* entry{ archive_entry_new() };
    AtScopeExit free_entry{
        [entry]
        {
            archive_entry_free(entry);
        }
    };

    const std::string entry_name{ name };
    archive_entry_set_pathname(entry, entry_name.c_str());
    archive_entry_set_size(entry, static_cast<la_int64_t>(data.size()));
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, 0644);
    archive_entry_set_mtime(entry, std::time(nullptr), 0);

    if (archive_write_header(m_Archive, entry) != ARCHIVE_OK)
    {
        throw std::runtime_error{ fmt::format("Could not add {} to {}: {}", name, m_Path.string(), ArchiveErrorString(m_Archive)) };
    }

    const la_ssize_t written{ archive_write_data(m_Archive, data.data(), data.size()) };
    if (written < 0 || static_cast<size_t>(written) != data.size())
    {
        throw std::runtime_error{ fmt::format("Could not write {} to {}: {}", name, m_Path.string(), ArchiveErrorString(m_Archive)) };
    }

    ++m_EntryCount;
}

size_t ArchiveWriter::EntryCount() const
{
    return m_EntryCount;
}

fs::path ArchiveWriter::Commit()
{
    if (m_Archive == nullptr)
    {
        throw std::logic_error{ fmt::format("Archive {} was already closed", m_Path.string()) };
    }

    const int close_result{ archive_write_close(m_Archive) };
    const std::string error{ close_result != ARCHIVE_OK ? ArchiveErrorString(m_Archive) : std::string{} };
    archive_write_free(m_Archive);
    m_Archive = nullptr;

    AtScopeExit remove_part{
        [this]
        {
            std::error_code remove_error;
            fs::remove(m_PartPath, remove_error);
        }
    };

    if (close_result != ARCHIVE_OK)
    {
        throw std::runtime_error{ fmt::format("Could not finalize {}: {}", m_Path.string(), error) };
    }

    std::error_code error_code;
    fs::rename(m_PartPath, m_Path, error_code);
    if (error_code)
    {
        throw std::runtime_error{ fmt::format("Could not move {} into place: {}", m_Path.string(), error_code.message()) };
    }
    remove_part.Dismiss();

    LogInfo("Wrote {} entries to {}", m_EntryCount, m_Path.string());
    return m_Path;
}

void ArchiveWriter::Discard()
{
    if (m_Archive == nullptr)
    {
        return;
    }

    Close();

    std::error_code error_code;
    fs::remove(m_PartPath, error_code);
    if (error_code)
    {
        LogWarning("Could not remove partial archive {}: {}", m_PartPath.string(), error_code.message());
    }
}

void ArchiveWriter::Close()
{
    if (archive_write_close(m_Archive) != ARCHIVE_OK)
    {
        LogWarning("Closing discarded archive {} reported: {}", m_PartPath.string(), ArchiveErrorString(m_Archive));
    }
    archive_write_free(m_Archive);
    m_Archive = nullptr;
}
