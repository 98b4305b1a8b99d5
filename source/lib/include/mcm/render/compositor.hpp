#pragma once

#include <optional>
#include <string>

#include <mcm/card/card_record.hpp>
#include <mcm/layout/card_geometry.hpp>
#include <mcm/render/asset_cache.hpp>
#include <mcm/render_config.hpp>

// Everything needed to draw a single card, lives for one export step only
struct RenderUnit
{
    ResolvedLayout m_Layout;
    FontFamilies m_Fonts;

    // Owned by the asset cache, null when the asset is missing
    const LoadedAsset* m_Template{ nullptr };
    const LoadedAsset* m_DescriptionTexture{ nullptr };
    std::optional<LoadedAsset> m_Art;

    // Fitted description size in surface pixels
    float m_DescriptionFontSize{ 0.0f };
};

// Surface used for exports, matches the native template resolution
inline constexpr dla::vec2 c_ExportSurfaceSize{ CoordinateMapper::c_ReferenceWidth, CoordinateMapper::c_ReferenceHeight };

RenderUnit Compose(const CardRecord& card,
                   const RenderConfig& config,
                   AssetCache& assets,
                   dla::vec2 surface_size = c_ExportSurfaceSize);
