#pragma once

#include <cstddef>

#include <mcm/card/card_record.hpp>
#include <mcm/image.hpp>
#include <mcm/render/asset_cache.hpp>
#include <mcm/render/compositor.hpp>
#include <mcm/render_config.hpp>

struct RasterOptions
{
    float m_PixelRatio{ 1.0f };
};

// Drawn onto a transparent surface, everything outside the rounded card stays transparent
Image Rasterize(const RenderUnit& unit, const RasterOptions& options = {});

class CardRasterizer
{
  public:
    virtual ~CardRasterizer() = default;

    // Throws when the card can not be captured
    virtual Image Capture(const CardRecord& card, size_t index) = 0;
};

class CompositingRasterizer final : public CardRasterizer
{
  public:
    CompositingRasterizer(const RenderConfig& config, AssetCache& assets, RasterOptions options = {});
    virtual ~CompositingRasterizer() override = default;

    virtual Image Capture(const CardRecord& card, size_t index) override;

  private:
    const RenderConfig& m_Config;
    AssetCache& m_Assets;
    RasterOptions m_Options;
};
