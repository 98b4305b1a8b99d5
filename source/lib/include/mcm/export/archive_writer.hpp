#pragma once

#include <cstddef>
#include <span>
#include <string_view>

#include <mcm/util.hpp>

struct archive;

/*
        Streams stored (uncompressed) zip entries into "<path>.part" and moves the
        archive into place on Commit, an archive that is never committed is removed
*/
class ArchiveWriter
{
  public:
    explicit ArchiveWriter(fs::path path);
    ~ArchiveWriter();

    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator=(const ArchiveWriter&) = delete;

    void AddEntry(std::string_view name, std::span<const std::byte> data);
    size_t EntryCount() const;

    fs::path Commit();
    void Discard();


  private:
    void Close();

    fs::path m_Path;
    fs::path m_PartPath;
    archive* m_Archive{ nullptr };
    size_t m_EntryCount{ 0 };
};
