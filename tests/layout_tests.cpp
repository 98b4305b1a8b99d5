#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <fstream>

#include <QByteArray>

#include <mcm/layout/card_geometry.hpp>
#include <mcm/layout/coordinate_mapper.hpp>
#include <mcm/layout/layout_resolver.hpp>

using Catch::Matchers::WithinAbs;

TEST_CASE("Coordinate mapping is identity at reference size", "[layout_mapper_identity]")
{
    const CoordinateMapper mapper{ CoordinateMapper::c_ReferenceWidth, CoordinateMapper::c_ReferenceHeight };
    REQUIRE_THAT(mapper.ScaleX(169.0f), WithinAbs(169.0f, 0.001f));
    REQUIRE_THAT(mapper.ScaleY(902.0f), WithinAbs(902.0f, 0.001f));
    REQUIRE_THAT(mapper.ScaleFont(13.0f), WithinAbs(26.0f, 0.001f));
}

TEST_CASE("Coordinate mapping scales per axis", "[layout_mapper_scale]")
{
    const CoordinateMapper mapper{ dla::vec2{ 330.5f, 2056.0f } };
    REQUIRE_THAT(mapper.ScaleX(661.0f), WithinAbs(330.5f, 0.001f));
    REQUIRE_THAT(mapper.ScaleY(1028.0f), WithinAbs(2056.0f, 0.001f));

    const SurfaceRect rect{ mapper.ScaleRect({ { 60.0f, 510.0f }, { 541.0f, 400.0f } }) };
    REQUIRE_THAT(rect.m_Position.x, WithinAbs(30.0f, 0.001f));
    REQUIRE_THAT(rect.m_Position.y, WithinAbs(1020.0f, 0.001f));
    REQUIRE_THAT(rect.m_Size.x, WithinAbs(270.5f, 0.001f));
    REQUIRE_THAT(rect.m_Size.y, WithinAbs(800.0f, 0.001f));

    // Fonts follow the vertical axis
    REQUIRE_THAT(mapper.ScaleFont(10.0f), WithinAbs(40.0f, 0.001f));
}

TEST_CASE("Resolver reports every tried location", "[layout_resolver_missing]")
{
    RenderConfig config{};
    config.m_AssetRoot = fs::path{ "does_not_exist" };

    const AssetResolver resolver{ config };
    const AssetResolution resolution{ resolver.ResolveTemplate(TemplateKind::Monstre) };

    const auto* missing{ std::get_if<AssetMissing>(&resolution) };
    REQUIRE(missing != nullptr);
    REQUIRE(missing->m_Candidates.size() == 3);
    REQUIRE(missing->m_Candidates[0] == fs::path{ "does_not_exist/layouts/layout_monstre.png" });
    REQUIRE(missing->m_Candidates[1] == fs::path{ "does_not_exist/layout_monstre.png" });
    REQUIRE(missing->m_Candidates[2].is_absolute());
}

TEST_CASE("Resolver lists every existing candidate in order", "[layout_resolver_fallback]")
{
    const fs::path root{ fs::temp_directory_path() / "mcm_resolver_fallback" };
    fs::remove_all(root);
    fs::create_directories(root / "layouts");
    {
        std::ofstream file{ root / "layout_race.png" };
        file << "not really a png";
    }

    RenderConfig config{};
    config.m_AssetRoot = root;
    const AssetResolver resolver{ config };

    {
        const AssetResolution resolution{ resolver.ResolveTemplate(TemplateKind::Race) };
        const auto* resolved{ std::get_if<AssetResolved>(&resolution) };
        REQUIRE(resolved != nullptr);
        REQUIRE(resolved->m_Sources.size() == 1);
        REQUIRE(resolved->m_Sources[0].m_Path == root / "layout_race.png");
    }

    {
        std::ofstream file{ root / "layouts" / "layout_race.png" };
        file << "not a png either";
    }

    {
        const AssetResolution resolution{ resolver.ResolveTemplate(TemplateKind::Race) };
        const auto* resolved{ std::get_if<AssetResolved>(&resolution) };
        REQUIRE(resolved != nullptr);
        REQUIRE(resolved->m_Sources.size() == 2);
        REQUIRE(resolved->m_Sources[0].m_Path == root / "layouts" / "layout_race.png");
        REQUIRE(resolved->m_Sources[1].m_Path == root / "layout_race.png");
    }

    fs::remove_all(root);
}

TEST_CASE("Resolver prefers inline overrides", "[layout_resolver_override]")
{
    const QByteArray payload{ "hello" };
    const std::string data_url{ "data:image/png;base64," + payload.toBase64().toStdString() };

    RenderConfig config{};
    config.m_AssetRoot = fs::path{ "does_not_exist" };
    config.m_CustomBacks[BackCategory::Tresor] = data_url;
    config.m_CustomBacks[BackCategory::Donjon] = "does_not_exist/custom.png";

    const AssetResolver resolver{ config };

    const AssetResolution tresor{ resolver.ResolveBack(BackCategory::Tresor) };
    const auto* resolved{ std::get_if<AssetResolved>(&tresor) };
    REQUIRE(resolved != nullptr);
    REQUIRE(resolved->m_Sources.size() == 1);
    REQUIRE(resolved->m_Sources[0].m_InlineData.has_value());
    REQUIRE(resolved->m_Sources[0].m_InlineData->size() == 5);

    // A broken override falls back to the default locations
    const AssetResolution donjon{ resolver.ResolveBack(BackCategory::Donjon) };
    REQUIRE(std::holds_alternative<AssetMissing>(donjon));
}

TEST_CASE("Data urls", "[layout_data_url]")
{
    REQUIRE_FALSE(DecodeDataUrl("layouts/layout_item.png").has_value());
    REQUIRE_FALSE(DecodeDataUrl("data:image/png,raw").has_value());
    REQUIRE_FALSE(DecodeDataUrl("data:image/png;base64,%%%").has_value());

    const auto decoded{ DecodeDataUrl("data:image/png;base64,AAEC") };
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->size() == 3);
    REQUIRE((*decoded)[2] == std::byte{ 2 });
}

TEST_CASE("Monster layout", "[layout_monster]")
{
    CardRecord card{};
    card.m_Type = CardType::Monster;
    card.m_Title = "Gobelin";
    card.m_Level = 4;
    card.m_LevelsGained = 2;
    card.m_Gold = "2";
    card.m_BadStuff = "Perds un niveau";

    const RenderConfig config{};
    const CoordinateMapper mapper{ CoordinateMapper::c_ReferenceWidth, CoordinateMapper::c_ReferenceHeight };
    const ResolvedLayout layout{ ResolveLayout(card, config, mapper) };

    REQUIRE(layout.m_Template == TemplateKind::Monstre);
    REQUIRE(layout.m_BackCategory == BackCategory::Donjon);

    REQUIRE(layout.m_Diamonds.has_value());
    REQUIRE(layout.m_Diamonds->m_Value == "4");
    REQUIRE_FALSE(layout.m_Diamonds->m_IsRange);

    REQUIRE(layout.m_Description.has_value());
    REQUIRE(layout.m_Description->m_BadStuffPrefix == "Incident Fâcheux : ");
    REQUIRE_THAT(layout.m_Description->m_MaxHeight, WithinAbs(650.0f, 0.001f));

    REQUIRE(layout.m_Footer.m_Lines.size() == 1);
    REQUIRE(layout.m_Footer.m_Lines[0].m_Text == "2 niveaux");
    REQUIRE(layout.m_Footer.m_Right.has_value());
    REQUIRE(layout.m_Footer.m_Right->m_Text == "2 trésors");
    REQUIRE_THAT(layout.m_Footer.m_RightAnchor.x, WithinAbs(420.0f, 0.001f));
}

TEST_CASE("Monster without level has no diamonds", "[layout_monster_no_level]")
{
    CardRecord card{};
    card.m_Type = CardType::Monster;
    card.m_Level = 0;

    const CoordinateMapper mapper{ CoordinateMapper::c_ReferenceWidth, CoordinateMapper::c_ReferenceHeight };
    const ResolvedLayout layout{ ResolveLayout(card, RenderConfig{}, mapper) };
    REQUIRE_FALSE(layout.m_Diamonds.has_value());
    REQUIRE_FALSE(layout.m_Description.has_value());
    REQUIRE(layout.m_Footer.m_Lines.empty());
}

TEST_CASE("Item footer", "[layout_item_footer]")
{
    CardRecord card{};
    card.m_Type = CardType::Item;
    card.m_Bonus = "-2/-4";
    card.m_IsBig = true;
    card.m_ItemSlot = c_SlotSteedEnhancement;
    card.m_Gold = "300";

    RenderConfig config{};
    config.m_Language = Language::English;

    const CoordinateMapper mapper{ CoordinateMapper::c_ReferenceWidth, CoordinateMapper::c_ReferenceHeight };
    const ResolvedLayout layout{ ResolveLayout(card, config, mapper) };

    REQUIRE(layout.m_Diamonds.has_value());
    REQUIRE(layout.m_Diamonds->m_Value == "-2/4");
    REQUIRE(layout.m_Diamonds->m_IsRange);

    REQUIRE(layout.m_Footer.m_LinesAbove.size() == 2);
    REQUIRE(layout.m_Footer.m_LinesAbove[0].m_Text == "Enhancement");
    REQUIRE(layout.m_Footer.m_LinesAbove[1].m_Text == "Big");
    REQUIRE(layout.m_Footer.m_Lines.size() == 1);
    REQUIRE(layout.m_Footer.m_Lines[0].m_Text == "for Steed");

    REQUIRE(layout.m_Footer.m_Right.has_value());
    REQUIRE(layout.m_Footer.m_Right->m_Text == "300 gold pieces");
    REQUIRE_THAT(layout.m_Footer.m_RightAnchor.x, WithinAbs(390.0f, 0.001f));
}

TEST_CASE("Enhancement items hide their value", "[layout_enhancement]")
{
    CardRecord card{};
    card.m_Type = CardType::Item;
    card.m_ItemSlot = c_SlotEnhancement;
    card.m_Gold = "300";

    const CoordinateMapper mapper{ CoordinateMapper::c_ReferenceWidth, CoordinateMapper::c_ReferenceHeight };
    const ResolvedLayout layout{ ResolveLayout(card, RenderConfig{}, mapper) };
    REQUIRE(layout.m_Template == TemplateKind::Malediction);
    REQUIRE_FALSE(layout.m_Footer.m_Right.has_value());
    REQUIRE(layout.m_Footer.m_Lines.empty());
}

TEST_CASE("Long slot names shrink", "[layout_long_slot]")
{
    CardRecord card{};
    card.m_Type = CardType::Item;
    card.m_ItemSlot = "Chaussures de course";

    const CoordinateMapper mapper{ CoordinateMapper::c_ReferenceWidth, CoordinateMapper::c_ReferenceHeight };
    const ResolvedLayout layout{ ResolveLayout(card, RenderConfig{}, mapper) };
    REQUIRE(layout.m_Footer.m_Lines.size() == 1);
    REQUIRE_THAT(layout.m_Footer.m_Lines[0].m_FontSize, WithinAbs(1.4f * 16.0f, 0.001f));
}

TEST_CASE("Description box scale", "[layout_description_scale]")
{
    CardRecord card{};
    card.m_Type = CardType::Curse;
    card.m_Description = "Perds ton couvre-chef";
    card.m_DescriptionBoxScale = 50.0f;

    const CoordinateMapper mapper{ CoordinateMapper::c_ReferenceWidth, CoordinateMapper::c_ReferenceHeight };
    const ResolvedLayout layout{ ResolveLayout(card, RenderConfig{}, mapper) };
    REQUIRE(layout.m_Description.has_value());
    REQUIRE_THAT(layout.m_Description->m_MaxHeight, WithinAbs(325.0f, 0.001f));
    REQUIRE_FALSE(layout.m_Description->m_BadStuffPrefix.has_value());
}
