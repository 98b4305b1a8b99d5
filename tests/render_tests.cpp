#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <string>
#include <thread>

#include <opencv2/core.hpp>

#include <mcm/render/asset_cache.hpp>
#include <mcm/render/compositor.hpp>
#include <mcm/render/rasterizer.hpp>

namespace
{
// 1x1 png
constexpr const char c_PixelDataUrl[]{
    "data:image/png;base64,"
    "iVBORw0KGgoAAAANSUhEUgAAAAEAAAABCAYAAAAfFcSJAAAADUlEQVR42mNkYPhfDwAChwGA60e6kgAAAABJRU5ErkJggg=="
};

RenderConfig MakeConfigWithoutAssets()
{
    RenderConfig config{};
    config.m_AssetRoot = fs::path{ "mcm_no_assets_here" };
    return config;
}

void WriteFile(const fs::path& path, std::string_view content)
{
    fs::create_directories(path.parent_path());
    std::ofstream file{ path, std::ios::binary };
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
}

void WritePixelPng(const fs::path& path)
{
    const auto png{ DecodeDataUrl(c_PixelDataUrl) };
    REQUIRE(png.has_value());
    WriteFile(path, std::string_view{ reinterpret_cast<const char*>(png->data()), png->size() });
}

CardRecord MakeMonster(std::string description)
{
    CardRecord card{};
    card.m_Type = CardType::Monster;
    card.m_Title = "Plante en Pot";
    card.m_Level = 1;
    card.m_Gold = "1";
    card.m_Description = std::move(description);
    card.m_BadStuff = "Aucun.";
    return card;
}
} // namespace

TEST_CASE("Cards compose without any assets", "[render_compose_missing_assets]")
{
    const RenderConfig config{ MakeConfigWithoutAssets() };
    AssetCache assets{ config, std::chrono::milliseconds{ 5000 } };

    const RenderUnit unit{ Compose(MakeMonster("Les elfes ont +1."), config, assets) };
    REQUIRE(unit.m_Template == nullptr);
    REQUIRE(unit.m_DescriptionTexture == nullptr);
    REQUIRE_FALSE(unit.m_Art.has_value());
    REQUIRE(unit.m_Layout.m_Description.has_value());
    REQUIRE(unit.m_DescriptionFontSize >= 16.0f);
    REQUIRE(unit.m_DescriptionFontSize <= 26.0f);
}

TEST_CASE("Long descriptions shrink", "[render_compose_fit]")
{
    const RenderConfig config{ MakeConfigWithoutAssets() };
    AssetCache assets{ config, std::chrono::milliseconds{ 5000 } };

    std::string long_text;
    for (int i = 0; i < 60; i++)
    {
        long_text += "Ce monstre dévore tout ce qui se trouve sur son chemin. ";
    }

    const RenderUnit short_unit{ Compose(MakeMonster("Court."), config, assets) };
    const RenderUnit long_unit{ Compose(MakeMonster(long_text), config, assets) };
    REQUIRE(long_unit.m_DescriptionFontSize < short_unit.m_DescriptionFontSize);
    REQUIRE(long_unit.m_DescriptionFontSize >= 16.0f);
}

TEST_CASE("Rasterized cards match the export surface", "[render_rasterize]")
{
    const RenderConfig config{ MakeConfigWithoutAssets() };
    AssetCache assets{ config, std::chrono::milliseconds{ 5000 } };

    const RenderUnit unit{ Compose(MakeMonster("Les elfes ont +1."), config, assets) };

    const Image image{ Rasterize(unit) };
    REQUIRE(image.Valid());
    REQUIRE(image.Width() == 661_pix);
    REQUIRE(image.Height() == 1028_pix);

    // Rounded corners stay transparent, the center is opaque
    const cv::Mat& mat{ image.GetUnderlying() };
    REQUIRE(mat.channels() == 4);
    REQUIRE(mat.at<cv::Vec4b>(0, 0)[3] == 0);
    REQUIRE(mat.at<cv::Vec4b>(514, 330)[3] == 255);

    const Image hi_dpi{ Rasterize(unit, RasterOptions{ .m_PixelRatio = 2.0f }) };
    REQUIRE(hi_dpi.Width() == 1322_pix);
    REQUIRE(hi_dpi.Height() == 2056_pix);
}

TEST_CASE("Compositing rasterizer captures every card type", "[render_capture]")
{
    const RenderConfig config{ MakeConfigWithoutAssets() };
    AssetCache assets{ config, std::chrono::milliseconds{ 5000 } };
    CompositingRasterizer rasterizer{ config, assets };

    for (const CardType type : { CardType::Monster, CardType::Curse, CardType::Item, CardType::Class, CardType::Race, CardType::LevelUp, CardType::FaithfulServant, CardType::DungeonTrap, CardType::DungeonBonus, CardType::TreasureTrap, CardType::Other })
    {
        CardRecord card{};
        card.m_Type = type;
        card.m_Title = "Titre assez long pour passer sur deux lignes";
        card.m_Bonus = "2/4";
        card.m_Gold = "200";
        card.m_ItemSlot = "Couvre-chef";
        card.m_IsBig = true;
        card.m_Restrictions = "Réservé aux Nains";
        card.m_Description = "Description";

        const Image image{ rasterizer.Capture(card, 0) };
        REQUIRE(image.Width() == 661_pix);
    }
}

TEST_CASE("Art loading", "[render_art]")
{
    const RenderConfig config{ MakeConfigWithoutAssets() };
    AssetCache assets{ config, std::chrono::milliseconds{ 5000 } };

    REQUIRE_FALSE(assets.LoadArt(ArtReference{}).has_value());

    {
        const auto art{ assets.LoadArt(ArtReference{ .m_InlineData{ c_PixelDataUrl } }) };
        REQUIRE(art.has_value());
        REQUIRE(art->m_Image.Width() == 1_pix);
        REQUIRE_FALSE(art->m_Painted.isNull());
    }

    {
        const std::string raw_base64{ std::string{ c_PixelDataUrl }.substr(std::string_view{ "data:image/png;base64," }.size()) };
        REQUIRE(assets.LoadArt(ArtReference{ .m_InlineData{ raw_base64 } }).has_value());
    }

    REQUIRE(assets.LoadArt(ArtReference{ .m_Url{ c_PixelDataUrl } }).has_value());
    REQUIRE_FALSE(assets.LoadArt(ArtReference{ .m_Url{ "https://example.com/art.png" } }).has_value());
    REQUIRE_FALSE(assets.LoadArt(ArtReference{ .m_Url{ "missing/art.png" } }).has_value());
}

TEST_CASE("Exhausted load budget skips images", "[render_budget]")
{
    const RenderConfig config{ MakeConfigWithoutAssets() };
    AssetCache assets{ config, std::chrono::milliseconds{ 0 } };

    std::this_thread::sleep_for(std::chrono::milliseconds{ 2 });
    REQUIRE(assets.BudgetExhausted());
    REQUIRE_FALSE(assets.LoadArt(ArtReference{ .m_InlineData{ c_PixelDataUrl } }).has_value());
}

TEST_CASE("Undecodable assets give way to later locations", "[render_asset_fallback]")
{
    const fs::path root{ fs::temp_directory_path() / "mcm_asset_fallback" };
    fs::remove_all(root);
    WriteFile(root / "layouts" / "layout_monstre.png", "garbage");
    WritePixelPng(root / "layout_monstre.png");
    WriteFile(root / "layouts" / "layout_item.png", "garbage");

    RenderConfig config{};
    config.m_AssetRoot = root;
    AssetCache assets{ config, std::chrono::milliseconds{ 5000 }, root };

    const LoadedAsset* monster{ assets.GetTemplate(TemplateKind::Monstre) };
    REQUIRE(monster != nullptr);
    REQUIRE(monster->m_Image.Width() == 1_pix);

    // Cached after the first successful decode
    REQUIRE(assets.GetTemplate(TemplateKind::Monstre) == monster);

    // No location decodes
    REQUIRE(assets.GetTemplate(TemplateKind::Item) == nullptr);

    // Card art moves on to the asset root when the deck-relative file is broken
    WriteFile(root / "deck" / "art.png", "garbage");
    WritePixelPng(root / "assets" / "deck" / "art.png");
    config.m_AssetRoot = root / "assets";
    AssetCache art_assets{ config, std::chrono::milliseconds{ 5000 }, root };
    REQUIRE(art_assets.LoadArt(ArtReference{ .m_Url{ "deck/art.png" } }).has_value());

    fs::remove_all(root);
}
