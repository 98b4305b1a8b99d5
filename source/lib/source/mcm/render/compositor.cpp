#include <mcm/render/compositor.hpp>

#include <mcm/render/text_block.hpp>
#include <mcm/render/text_fit.hpp>
#include <mcm/util/log.hpp>

RenderUnit Compose(const CardRecord& card,
                   const RenderConfig& config,
                   AssetCache& assets,
                   dla::vec2 surface_size)
{
    const CoordinateMapper mapper{ surface_size };

    RenderUnit unit{
        .m_Layout{ ResolveLayout(card, config, mapper) },
        .m_Fonts{ config.m_Fonts },
    };

    unit.m_Template = assets.GetTemplate(unit.m_Layout.m_Template);
    if (unit.m_Template == nullptr)
    {
        LogWarning("Card \"{}\" is drawn without its template", card.m_Title);
    }

    unit.m_Art = assets.LoadArt(card.m_Art);

    if (unit.m_Layout.m_Description.has_value())
    {
        const DescriptionLayout& description{ unit.m_Layout.m_Description.value() };
        unit.m_DescriptionTexture = assets.GetDescriptionTexture();

        const auto measure{
            [&](float points)
            {
                return DescriptionContent{ description, config.m_Fonts, mapper.ScaleFont(points) }.Height();
            }
        };
        const float fitted_points{ FitFontSize(measure, description.m_MaxHeight) };
        unit.m_DescriptionFontSize = mapper.ScaleFont(fitted_points);
    }

    return unit;
}
