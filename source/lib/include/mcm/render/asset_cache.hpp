#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include <QImage>

#include <mcm/card/card_record.hpp>
#include <mcm/image.hpp>
#include <mcm/layout/layout_resolver.hpp>
#include <mcm/render_config.hpp>

struct LoadedAsset
{
    Image m_Image;
    QImage m_Painted;
};

/*
        Loads templates, backs and textures once per job and art once per card,
        every card gets a fresh time budget for its loads
*/
class AssetCache
{
  public:
    AssetCache(const RenderConfig& config, std::chrono::milliseconds load_timeout, fs::path deck_dir = {});

    AssetCache(const AssetCache&) = delete;
    AssetCache& operator=(const AssetCache&) = delete;

    void ResetBudget();
    bool BudgetExhausted() const;

    const LoadedAsset* GetTemplate(TemplateKind kind);
    const LoadedAsset* GetBack(BackCategory category);
    const LoadedAsset* GetDescriptionTexture();

    std::optional<LoadedAsset> LoadArt(const ArtReference& art);


  private:
    const LoadedAsset* Load(const AssetResolution& resolution);
    bool ConsumeBudget(std::string_view what);

    static std::optional<LoadedAsset> MakeAsset(Image image);

    const RenderConfig& m_Config;
    AssetResolver m_Resolver;
    fs::path m_DeckDir;

    std::chrono::milliseconds m_LoadTimeout;
    std::chrono::steady_clock::time_point m_Deadline;
    bool m_TimeoutReported{ false };

    std::map<std::string, std::optional<LoadedAsset>> m_Assets;
};
