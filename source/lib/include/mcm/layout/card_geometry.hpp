#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include <mcm/card/card_record.hpp>
#include <mcm/color.hpp>
#include <mcm/layout/coordinate_mapper.hpp>
#include <mcm/render_config.hpp>

// clang-format off
namespace CardGeometry
{
inline constexpr float c_RemSize{ 16.0f };

inline constexpr float c_CardCornerRadius{ 20.0f };
inline constexpr ColorRGB8 c_CardBackground{ 0x10, 0x0c, 0x08 };

inline constexpr std::array c_DiamondCenters{ dla::vec2{ 108.0f, 119.0f }, dla::vec2{ 550.0f, 119.0f } };
inline constexpr dla::vec2 c_DiamondRangeOffset{ -6.0f, 4.0f };
inline constexpr float c_DiamondFontRem{ 2.8f };
inline constexpr float c_DiamondRangeFontRem{ 2.4f };

inline constexpr float c_TitleLeft{ 169.0f };
inline constexpr float c_TitleWidth{ 319.0f };
inline constexpr float c_TitleCenterY{ 133.0f };
inline constexpr float c_TitleCenterYLowered{ 158.0f };
inline constexpr float c_TitleFontRem{ 2.2f };
inline constexpr float c_TitleLineHeight{ 1.15f };
inline constexpr ColorRGB8 c_TitleColor{ 0x5C, 0x1B, 0x15 };

inline constexpr dla::vec2 c_DescriptionPosition{ 60.0f, 229.0f };
inline constexpr float c_DescriptionWidth{ 541.0f };
inline constexpr float c_DescriptionBaseMaxHeight{ 325.0f };
inline constexpr float c_DescriptionPadding{ 16.0f };
inline constexpr float c_DescriptionBorder{ 4.0f };
inline constexpr float c_DescriptionRadius{ 8.0f };
inline constexpr float c_DescriptionLineHeight{ 1.1f };
inline constexpr float c_RestrictionsMargin{ 8.0f };
inline constexpr float c_BadStuffMargin{ 12.0f };
inline constexpr float c_BadStuffPadding{ 8.0f };
inline constexpr float c_BadStuffSeparator{ 2.0f };
inline constexpr ColorRGB8 c_DescriptionBorderColor{ 0x5a, 0x4a, 0x3a };

inline constexpr dla::vec2 c_ArtPosition{ 60.0f, 510.0f };
inline constexpr dla::vec2 c_ArtSize{ 541.0f, 400.0f };
inline constexpr float c_ArtBaseScale{ 1.3f };

inline constexpr dla::vec2 c_FooterLeft{ 90.0f, 902.0f };
inline constexpr float c_FooterRightMonster{ 420.0f };
inline constexpr float c_FooterRight{ 390.0f };
inline constexpr float c_FooterFontRem{ 1.8f };
inline constexpr float c_FooterSmallFontRem{ 1.4f };
inline constexpr float c_FooterStackOverlapRem{ 0.2f };
inline constexpr size_t c_FooterLongSlotLength{ 15 };
inline constexpr ColorRGB8 c_FooterColor{ 0x68, 0x2A, 0x22 };
} // namespace CardGeometry
// clang-format on

struct DiamondLayout
{
    std::string m_Value;
    bool m_IsRange{ false };
    std::array<dla::vec2, 2> m_Centers;
    float m_FontSize;
};

struct TitleLayout
{
    std::string m_Text;
    float m_Left;
    float m_Width;
    float m_CenterY;
    float m_FontSize;
};

struct DescriptionLayout
{
    SurfaceRect m_Box;
    float m_MaxHeight;
    float m_Padding;
    float m_Border;
    float m_Radius;
    float m_RestrictionsMargin;
    float m_BadStuffMargin;
    float m_BadStuffPadding;
    float m_BadStuffSeparator;

    std::string m_Restrictions;
    std::string m_Body;
    // Only set for monsters
    std::optional<std::string> m_BadStuffPrefix;
    std::string m_BadStuff;
};

struct ArtLayout
{
    SurfaceRect m_Slot;
    float m_Scale;
    // Fraction of the slot size, applied after scaling
    dla::vec2 m_Translation;
};

struct FooterLine
{
    std::string m_Text;
    float m_FontSize;
};

struct FooterLayout
{
    dla::vec2 m_LeftAnchor;
    // Grows upwards from the anchor, nearest line first
    std::vector<FooterLine> m_LinesAbove;
    // Grows downwards from the anchor
    std::vector<FooterLine> m_Lines;
    float m_StackOverlap;

    dla::vec2 m_RightAnchor;
    std::optional<FooterLine> m_Right;
};

struct ResolvedLayout
{
    TemplateKind m_Template;
    BackCategory m_BackCategory;

    dla::vec2 m_SurfaceSize;
    float m_CornerRadius;

    std::optional<DiamondLayout> m_Diamonds;
    TitleLayout m_Title;
    std::optional<DescriptionLayout> m_Description;
    ArtLayout m_Art;
    FooterLayout m_Footer;
};

std::string GetDiamondValue(const CardRecord& card);

ResolvedLayout ResolveLayout(const CardRecord& card, const RenderConfig& config, const CoordinateMapper& mapper);
