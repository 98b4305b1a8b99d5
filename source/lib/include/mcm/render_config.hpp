#pragma once

#include <map>
#include <string>

#include <mcm/card/card_record.hpp>
#include <mcm/util.hpp>

enum class Language
{
    French,
    English,
};

enum class TemplateKind
{
    Class,
    Race,
    Malediction,
    Equipement,
    Item,
    Lvlup,
    Monstre,
};

struct FontFamilies
{
    std::string m_Title{ "Windlass" };
    std::string m_Description{ "Caslon Antique" };
    std::string m_Meta{ "MedievalSharp" };
};

// Everything that styles a card besides the card itself, passed explicitly into layout and compositing
struct RenderConfig
{
    FontFamilies m_Fonts{};
    Language m_Language{ Language::French };

    fs::path m_AssetRoot{ "."_p };

    // Either a data url or a file path
    std::map<TemplateKind, std::string> m_CustomLayouts{};
    std::map<BackCategory, std::string> m_CustomBacks{};
};
