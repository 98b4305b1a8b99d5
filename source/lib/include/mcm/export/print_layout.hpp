#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <mcm/card/card_record.hpp>
#include <mcm/color.hpp>
#include <mcm/util.hpp>

struct CutLine
{
    Position m_From;
    Position m_To;
};

// Duplex sheet layout, positions are measured from the top left of the page
struct PrintLayout
{
    Size m_PageSize{ 210_mm, 297_mm };
    Size m_CardSize{ 56_mm, 88_mm };
    uint32_t m_Columns{ 3 };
    uint32_t m_Rows{ 3 };

    Length m_CutLineThickness{ 0.1_mm };
    ColorRGB8 m_CutLineColor{ 0xff, 0xff, 0xff };

    ColorRGB8 m_FaceBackground{ 0x0d, 0x08, 0x04 };
    ColorRGB8 m_DonjonBackground{ 0x0d, 0x08, 0x04 };
    ColorRGB8 m_TresorBackground{ 0x05, 0x14, 0x71 };

    size_t CardsPerPage() const;

    Size GridSize() const;
    Size Margins() const;

    Position SlotPosition(size_t slot) const;
    // Same row, column mirrored so backs line up with their faces when printed duplex
    Position MirroredSlotPosition(size_t slot) const;

    // Only inside the margins, never across a card
    std::vector<CutLine> CutLines() const;

    ColorRGB8 BackBackground(BackCategory category) const;
};

// Majority category, a tie goes to the category of the first card
BackCategory DominantBackCategory(std::span<const BackCategory> categories);

size_t GetChunkCount(size_t total, size_t chunk_size);
fs::path GetPrintDocumentName(size_t chunk_index, size_t num_chunks);
