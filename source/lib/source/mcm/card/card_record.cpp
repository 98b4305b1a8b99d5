#include <mcm/card/card_record.hpp>

#include <array>
#include <utility>

#include <magic_enum/magic_enum.hpp>

namespace
{
// clang-format off
constexpr std::array<std::pair<CardType, std::string_view>, magic_enum::enum_count<CardType>()> c_CardTypeNames{{
    { CardType::Monster,         "Monstre" },
    { CardType::Curse,           "Malédiction" },
    { CardType::Item,            "Objet" },
    { CardType::Class,           "Classe" },
    { CardType::Race,            "Race" },
    { CardType::LevelUp,         "Gain de niveau" },
    { CardType::FaithfulServant, "Fidèle serviteur" },
    { CardType::DungeonTrap,     "Piège Donjon" },
    { CardType::DungeonBonus,    "Bonus Donjon" },
    { CardType::TreasureTrap,    "Piège Trésor" },
    { CardType::Other,           "Autre" },
}};
// clang-format on

bool IsBlank(std::string_view str)
{
    return str.find_first_not_of(" \t\r\n") == std::string_view::npos;
}
} // namespace

std::string_view GetCardTypeName(CardType type)
{
    for (const auto& [card_type, name] : c_CardTypeNames)
    {
        if (card_type == type)
        {
            return name;
        }
    }
    std::unreachable();
}

std::optional<CardType> ParseCardType(std::string_view name)
{
    for (const auto& [card_type, display_name] : c_CardTypeNames)
    {
        if (display_name == name)
        {
            return card_type;
        }
    }
    return magic_enum::enum_cast<CardType>(name);
}

BackCategory GetBackCategory(CardType type)
{
    switch (type)
    {
    case CardType::Monster:
    case CardType::FaithfulServant:
    case CardType::DungeonTrap:
    case CardType::DungeonBonus:
    case CardType::Class:
    case CardType::Race:
    case CardType::Curse:
        return BackCategory::Donjon;
    default:
        return BackCategory::Tresor;
    }
}

bool CardRecord::HasItemSlot() const
{
    return !m_ItemSlot.empty() && m_ItemSlot != c_SlotNone;
}

bool CardRecord::HasDescriptionBox() const
{
    return !IsBlank(m_Description) ||
           !IsBlank(m_Restrictions) ||
           (m_Type == CardType::Monster && !IsBlank(m_BadStuff));
}
