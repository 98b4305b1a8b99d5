#include <mcm/layout/card_geometry.hpp>

#include <algorithm>

#include <fmt/format.h>

#include <mcm/card/card_format.hpp>
#include <mcm/layout/layout_resolver.hpp>

namespace
{
bool IsBlank(std::string_view str)
{
    return str.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

// Character count rather than byte count, slot names carry accents
size_t Utf8Length(std::string_view str)
{
    return static_cast<size_t>(std::ranges::count_if(str, [](char c)
                                                     { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; }));
}
} // namespace

std::string GetDiamondValue(const CardRecord& card)
{
    switch (card.m_Type)
    {
    case CardType::Monster:
        if (card.m_Level.has_value() && card.m_Level.value() != 0)
        {
            return fmt::format("{}", card.m_Level.value());
        }
        return {};
    case CardType::Item:
    case CardType::LevelUp:
    case CardType::FaithfulServant:
    case CardType::DungeonTrap:
    case CardType::DungeonBonus:
    case CardType::TreasureTrap:
        return FormatBonus(card.m_Bonus);
    default:
        return {};
    }
}

ResolvedLayout ResolveLayout(const CardRecord& card, const RenderConfig& config, const CoordinateMapper& mapper)
{
    using namespace CardGeometry;

    const auto rem{
        [&mapper](float rems)
        {
            return mapper.ScaleY(rems * c_RemSize);
        }
    };
    const bool english{ config.m_Language == Language::English };

    ResolvedLayout layout{
        .m_Template{ GetTemplateKind(card) },
        .m_BackCategory{ GetBackCategory(card.m_Type) },
        .m_SurfaceSize{ mapper.SurfaceSize() },
        .m_CornerRadius{ mapper.ScaleX(c_CardCornerRadius) },
    };

    if (std::string diamond_value{ GetDiamondValue(card) }; !diamond_value.empty())
    {
        const bool is_range{ diamond_value.contains('/') };
        const dla::vec2 offset{ is_range ? c_DiamondRangeOffset : dla::vec2{ 0.0f, 0.0f } };
        layout.m_Diamonds = DiamondLayout{
            .m_Value{ std::move(diamond_value) },
            .m_IsRange = is_range,
            .m_Centers{
                mapper.Scale(c_DiamondCenters[0] + offset),
                mapper.Scale(c_DiamondCenters[1] + offset),
            },
            .m_FontSize{ rem(is_range ? c_DiamondRangeFontRem : c_DiamondFontRem) },
        };
    }

    const bool lowered_title{ card.m_Type == CardType::Class || card.m_Type == CardType::Race };
    layout.m_Title = TitleLayout{
        .m_Text{ card.m_Title },
        .m_Left{ mapper.ScaleX(c_TitleLeft) },
        .m_Width{ mapper.ScaleX(c_TitleWidth) },
        .m_CenterY{ mapper.ScaleY(lowered_title ? c_TitleCenterYLowered : c_TitleCenterY) },
        .m_FontSize{ rem(c_TitleFontRem) },
    };

    if (card.HasDescriptionBox())
    {
        const float box_scale{ (card.m_DescriptionBoxScale > 0.0f ? card.m_DescriptionBoxScale : 100.0f) / 100.0f };
        const float max_height{ mapper.ScaleFont(c_DescriptionBaseMaxHeight * box_scale) };

        DescriptionLayout description{
            .m_Box{
                mapper.Scale(c_DescriptionPosition),
                dla::vec2{ mapper.ScaleX(c_DescriptionWidth), max_height },
            },
            .m_MaxHeight = max_height,
            .m_Padding{ mapper.ScaleX(c_DescriptionPadding) },
            .m_Border{ mapper.ScaleX(c_DescriptionBorder) },
            .m_Radius{ mapper.ScaleX(c_DescriptionRadius) },
            .m_RestrictionsMargin{ mapper.ScaleY(c_RestrictionsMargin) },
            .m_BadStuffMargin{ mapper.ScaleY(c_BadStuffMargin) },
            .m_BadStuffPadding{ mapper.ScaleY(c_BadStuffPadding) },
            .m_BadStuffSeparator{ mapper.ScaleY(c_BadStuffSeparator) },
            .m_Restrictions{ card.m_Restrictions },
            .m_Body{ IsBlank(card.m_Description) ? std::string{} : card.m_Description },
        };

        if (card.m_Type == CardType::Monster && !card.m_BadStuff.empty())
        {
            description.m_BadStuffPrefix = english ? "Bad Stuff: " : "Incident Fâcheux : ";
            description.m_BadStuff = card.m_BadStuff;
        }

        layout.m_Description = std::move(description);
    }

    layout.m_Art = ArtLayout{
        .m_Slot{ mapper.ScaleRect({ c_ArtPosition, c_ArtSize }) },
        .m_Scale{ (card.m_ImageScale > 0.0f ? card.m_ImageScale : 100.0f) / 100.0f * c_ArtBaseScale },
        .m_Translation{ card.m_ImageOffsetX / 100.0f, card.m_ImageOffsetY / 100.0f },
    };

    FooterLayout& footer{ layout.m_Footer };
    footer.m_LeftAnchor = mapper.Scale(c_FooterLeft);
    footer.m_StackOverlap = rem(c_FooterStackOverlapRem);

    const float footer_font_size{ rem(c_FooterFontRem) };
    if (card.m_Type == CardType::Monster && card.m_LevelsGained.has_value())
    {
        const int32_t levels_gained{ card.m_LevelsGained.value() };
        if (levels_gained != 0 && levels_gained != 1)
        {
            footer.m_Lines.push_back({
                fmt::format("{} {}", levels_gained, english ? "levels" : "niveaux"),
                footer_font_size,
            });
        }
    }

    if (card.m_Type == CardType::Item)
    {
        if (card.m_ItemSlot == c_SlotSteedEnhancement)
        {
            footer.m_LinesAbove.push_back({ english ? "Enhancement" : "Amélioration", footer_font_size });
            footer.m_Lines.push_back({ english ? "for Steed" : "de Monture", footer_font_size });
        }
        else if (card.HasItemSlot() && card.m_ItemSlot != c_SlotEnhancement)
        {
            const bool long_slot{ Utf8Length(card.m_ItemSlot) > c_FooterLongSlotLength };
            footer.m_Lines.push_back({
                TranslateItemSlot(card.m_ItemSlot, config.m_Language),
                long_slot ? rem(c_FooterSmallFontRem) : footer_font_size,
            });
        }

        if (card.m_IsBig)
        {
            footer.m_LinesAbove.push_back({ english ? "Big" : "Gros", footer_font_size });
        }
    }

    const float right_x{ card.m_Type == CardType::Monster ? c_FooterRightMonster : c_FooterRight };
    footer.m_RightAnchor = mapper.Scale({ right_x, c_FooterLeft.y });

    const bool enhancement_item{ card.m_Type == CardType::Item && card.m_ItemSlot == c_SlotEnhancement };
    if (!enhancement_item)
    {
        if (auto gold{ FormatGoldDisplay(card.m_Type, card.m_Gold, config.m_Language) })
        {
            footer.m_Right = FooterLine{ std::move(gold).value(), footer_font_size };
        }
    }

    return layout;
}
