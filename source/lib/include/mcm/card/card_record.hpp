#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

enum class CardType
{
    Monster,
    Curse,
    Item,
    Class,
    Race,
    LevelUp,
    FaithfulServant,
    DungeonTrap,
    DungeonBonus,
    TreasureTrap,
    Other,
};

// Which of the two card backs a card is printed with
enum class BackCategory
{
    Donjon,
    Tresor,
};

// Display name as written by the editor, e.g. "Gain de niveau"
std::string_view GetCardTypeName(CardType type);
std::optional<CardType> ParseCardType(std::string_view name);

BackCategory GetBackCategory(CardType type);

inline constexpr std::string_view c_SlotEnhancement{ "Amélioration" };
inline constexpr std::string_view c_SlotSteedEnhancement{ "Amélioration de Monture" };
inline constexpr std::string_view c_SlotNone{ "NoSlot" };

struct ArtReference
{
    // Base64 encoded image, takes precedence over the url
    std::string m_InlineData;
    std::string m_Url;

    bool Empty() const
    {
        return m_InlineData.empty() && m_Url.empty();
    }
};

struct CardRecord
{
    std::string m_Id;
    std::string m_Title;
    CardType m_Type{ CardType::Monster };

    std::optional<int32_t> m_Level;
    std::string m_Bonus;
    std::string m_Gold;

    std::string m_Description;
    std::string m_BadStuff;
    std::string m_Restrictions;

    std::string m_ItemSlot;
    bool m_IsBig{ false };
    std::optional<int32_t> m_LevelsGained{ 1 };

    ArtReference m_Art;

    float m_ImageScale{ 100.0f };
    float m_ImageOffsetX{ 0.0f };
    float m_ImageOffsetY{ 0.0f };
    float m_DescriptionBoxScale{ 100.0f };

    bool HasItemSlot() const;
    bool HasDescriptionBox() const;
};
