#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <array>

#include <mcm/export/print_layout.hpp>

using Catch::Matchers::WithinAbs;

namespace
{
float ToMm(Length length)
{
    return length / 1_mm;
}
} // namespace

TEST_CASE("Default grid is centered on A4", "[print_layout_grid]")
{
    const PrintLayout layout{};
    REQUIRE(layout.CardsPerPage() == 9);

    const Size margins{ layout.Margins() };
    REQUIRE_THAT(ToMm(margins.x), WithinAbs(21.0f, 0.01f));
    REQUIRE_THAT(ToMm(margins.y), WithinAbs(16.5f, 0.01f));

    const Position first{ layout.SlotPosition(0) };
    REQUIRE_THAT(ToMm(first.x), WithinAbs(21.0f, 0.01f));
    REQUIRE_THAT(ToMm(first.y), WithinAbs(16.5f, 0.01f));

    const Position last{ layout.SlotPosition(8) };
    REQUIRE_THAT(ToMm(last.x), WithinAbs(21.0f + 2 * 56.0f, 0.01f));
    REQUIRE_THAT(ToMm(last.y), WithinAbs(16.5f + 2 * 88.0f, 0.01f));
}

TEST_CASE("Backs mirror the column", "[print_layout_mirror]")
{
    const PrintLayout layout{};
    for (size_t slot = 0; slot < layout.CardsPerPage(); slot++)
    {
        const Position face{ layout.SlotPosition(slot) };
        const Position back{ layout.MirroredSlotPosition(slot) };

        REQUIRE_THAT(ToMm(back.y), WithinAbs(ToMm(face.y), 0.01f));

        const size_t mirrored_column{ 2 - slot % 3 };
        const Position expected{ layout.SlotPosition((slot / 3) * 3 + mirrored_column) };
        REQUIRE_THAT(ToMm(back.x), WithinAbs(ToMm(expected.x), 0.01f));
    }

    // Center column stays in place
    REQUIRE_THAT(ToMm(layout.MirroredSlotPosition(4).x), WithinAbs(ToMm(layout.SlotPosition(4).x), 0.01f));
}

TEST_CASE("Cut lines stay in the margins", "[print_layout_cut_lines]")
{
    const PrintLayout layout{};
    const auto lines{ layout.CutLines() };
    REQUIRE(lines.size() == 2 * 4 + 2 * 4);

    const Size margins{ layout.Margins() };
    const float grid_left{ ToMm(margins.x) };
    const float grid_top{ ToMm(margins.y) };
    const float grid_right{ ToMm(layout.m_PageSize.x - margins.x) };
    const float grid_bottom{ ToMm(layout.m_PageSize.y - margins.y) };

    for (const CutLine& line : lines)
    {
        const float min_x{ std::min(ToMm(line.m_From.x), ToMm(line.m_To.x)) };
        const float max_x{ std::max(ToMm(line.m_From.x), ToMm(line.m_To.x)) };
        const float min_y{ std::min(ToMm(line.m_From.y), ToMm(line.m_To.y)) };
        const float max_y{ std::max(ToMm(line.m_From.y), ToMm(line.m_To.y)) };

        const bool outside_horizontally{ max_x <= grid_left + 0.01f || min_x >= grid_right - 0.01f };
        const bool outside_vertically{ max_y <= grid_top + 0.01f || min_y >= grid_bottom - 0.01f };
        REQUIRE((outside_horizontally || outside_vertically));
    }
}

TEST_CASE("Dominant back category", "[print_layout_dominant]")
{
    using enum BackCategory;

    REQUIRE(DominantBackCategory(std::array{ Donjon, Tresor, Tresor }) == Tresor);
    REQUIRE(DominantBackCategory(std::array{ Donjon, Donjon, Tresor }) == Donjon);

    // Ties go to the first card
    REQUIRE(DominantBackCategory(std::array{ Tresor, Donjon }) == Tresor);
    REQUIRE(DominantBackCategory(std::array{ Donjon, Tresor }) == Donjon);

    REQUIRE(DominantBackCategory({}) == Donjon);

    const PrintLayout layout{};
    REQUIRE(layout.BackBackground(Tresor) == ColorRGB8{ 0x05, 0x14, 0x71 });
    REQUIRE(layout.BackBackground(Donjon) == ColorRGB8{ 0x0d, 0x08, 0x04 });
}

TEST_CASE("Chunk count and document names", "[print_layout_chunks]")
{
    REQUIRE(GetChunkCount(0, 81) == 0);
    REQUIRE(GetChunkCount(1, 81) == 1);
    REQUIRE(GetChunkCount(81, 81) == 1);
    REQUIRE(GetChunkCount(82, 81) == 2);
    REQUIRE(GetChunkCount(200, 81) == 3);

    REQUIRE(GetPrintDocumentName(0, 1) == fs::path{ "munchkin_bat.pdf" });
    REQUIRE(GetPrintDocumentName(0, 3) == fs::path{ "munchkin_bat_partie1.pdf" });
    REQUIRE(GetPrintDocumentName(2, 3) == fs::path{ "munchkin_bat_partie3.pdf" });
}
