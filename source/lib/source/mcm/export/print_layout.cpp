#include <mcm/export/print_layout.hpp>

#include <algorithm>

#include <fmt/format.h>

size_t PrintLayout::CardsPerPage() const
{
    return static_cast<size_t>(m_Columns) * m_Rows;
}

Size PrintLayout::GridSize() const
{
    return Size{
        m_CardSize.x * static_cast<float>(m_Columns),
        m_CardSize.y * static_cast<float>(m_Rows),
    };
}

Size PrintLayout::Margins() const
{
    return (m_PageSize - GridSize()) / 2.0f;
}

Position PrintLayout::SlotPosition(size_t slot) const
{
    const auto column{ static_cast<float>(slot % m_Columns) };
    const auto row{ static_cast<float>(slot / m_Columns) };
    const Size margins{ Margins() };
    return Position{
        margins.x + m_CardSize.x * column,
        margins.y + m_CardSize.y * row,
    };
}

Position PrintLayout::MirroredSlotPosition(size_t slot) const
{
    const size_t column{ slot % m_Columns };
    const size_t row{ slot / m_Columns };
    const size_t mirrored_column{ (m_Columns - 1) - column };
    return SlotPosition(row * m_Columns + mirrored_column);
}

std::vector<CutLine> PrintLayout::CutLines() const
{
    const Size margins{ Margins() };
    const Length page_width{ m_PageSize.x };
    const Length page_height{ m_PageSize.y };

    std::vector<CutLine> lines;
    for (uint32_t column = 0; column <= m_Columns; column++)
    {
        const Length x{ margins.x + m_CardSize.x * static_cast<float>(column) };
        lines.push_back({ { x, 0_mm }, { x, margins.y } });
        lines.push_back({ { x, page_height - margins.y }, { x, page_height } });
    }
    for (uint32_t row = 0; row <= m_Rows; row++)
    {
        const Length y{ margins.y + m_CardSize.y * static_cast<float>(row) };
        lines.push_back({ { 0_mm, y }, { margins.x, y } });
        lines.push_back({ { page_width - margins.x, y }, { page_width, y } });
    }
    return lines;
}

ColorRGB8 PrintLayout::BackBackground(BackCategory category) const
{
    return category == BackCategory::Donjon ? m_DonjonBackground : m_TresorBackground;
}

BackCategory DominantBackCategory(std::span<const BackCategory> categories)
{
    if (categories.empty())
    {
        return BackCategory::Donjon;
    }

    const auto num_donjon{ std::ranges::count(categories, BackCategory::Donjon) };
    const auto num_tresor{ static_cast<std::ptrdiff_t>(categories.size()) - num_donjon };
    if (num_donjon == num_tresor)
    {
        return categories.front();
    }
    return num_donjon > num_tresor ? BackCategory::Donjon : BackCategory::Tresor;
}

size_t GetChunkCount(size_t total, size_t chunk_size)
{
    if (chunk_size == 0)
    {
        return total == 0 ? 0 : 1;
    }
    return (total + chunk_size - 1) / chunk_size;
}

fs::path GetPrintDocumentName(size_t chunk_index, size_t num_chunks)
{
    if (num_chunks <= 1)
    {
        return "munchkin_bat.pdf"_p;
    }
    return fmt::format("munchkin_bat_partie{}.pdf", chunk_index + 1);
}
