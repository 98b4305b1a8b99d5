#include <mcm/card/deck.hpp>

#include <array>
#include <charconv>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <mcm/util/log.hpp>

namespace
{
std::string ToString(const nlohmann::json& json)
{
    if (json.is_string())
    {
        return json.get<std::string>();
    }
    if (json.is_number_integer())
    {
        return fmt::format("{}", json.get<int64_t>());
    }
    if (json.is_number())
    {
        return fmt::format("{}", json.get<double>());
    }
    return {};
}

std::optional<int32_t> ToOptionalInt(const nlohmann::json& json)
{
    if (json.is_number_unsigned())
    {
        const auto value{ json.get<uint64_t>() };
        if (std::in_range<int32_t>(value))
        {
            return static_cast<int32_t>(value);
        }
    }
    else if (json.is_number_integer())
    {
        const auto value{ json.get<int64_t>() };
        if (std::in_range<int32_t>(value))
        {
            return static_cast<int32_t>(value);
        }
    }
    else if (json.is_number_float())
    {
        const auto value{ std::trunc(json.get<double>()) };
        if (std::isfinite(value) &&
            value >= static_cast<double>(std::numeric_limits<int32_t>::min()) &&
            value <= static_cast<double>(std::numeric_limits<int32_t>::max()))
        {
            return static_cast<int32_t>(value);
        }
    }

    if (json.is_number())
    {
        LogWarning("Number {} is out of range, ignoring it", json.dump());
        return std::nullopt;
    }

    if (json.is_string())
    {
        const auto& str{ json.get_ref<const std::string&>() };
        int32_t value{};
        const auto [ptr, ec]{ std::from_chars(str.data(), str.data() + str.size(), value) };
        if (ec == std::errc{})
        {
            return value;
        }
    }
    return std::nullopt;
}

float ToFloat(const nlohmann::json& json, float fallback)
{
    if (json.is_number())
    {
        const auto value{ json.get<double>() };
        if (std::isfinite(value) && std::abs(value) <= static_cast<double>(std::numeric_limits<float>::max()))
        {
            return static_cast<float>(value);
        }
        LogWarning("Number {} is out of range, using {} instead", json.dump(), fallback);
    }
    return fallback;
}

const nlohmann::json& Get(const nlohmann::json& object, std::string_view key)
{
    static const nlohmann::json c_Null{};
    const auto it{ object.find(std::string{ key }) };
    return it != object.end() ? *it : c_Null;
}

std::string ResolveAssetSource(const nlohmann::json& json, const fs::path& base_dir)
{
    std::string source{ ToString(json) };
    if (source.empty() || source.starts_with("data:"))
    {
        return source;
    }

    const fs::path path{ source };
    return path.is_relative() && !base_dir.empty()
               ? (base_dir / path).string()
               : source;
}

CardRecord ParseCard(const nlohmann::json& card_json, size_t index)
{
    CardRecord card{};
    card.m_Id = ToString(Get(card_json, "id"));
    card.m_Title = ToString(Get(card_json, "title"));

    const std::string type_name{ ToString(Get(card_json, "type")) };
    if (auto type{ ParseCardType(type_name) })
    {
        card.m_Type = type.value();
    }
    else
    {
        LogWarning("Card {} \"{}\" has unknown type \"{}\", treating it as {}", index + 1, card.m_Title, type_name, GetCardTypeName(CardType::Other));
        card.m_Type = CardType::Other;
    }

    card.m_Level = ToOptionalInt(Get(card_json, "level"));
    card.m_Bonus = ToString(Get(card_json, "bonus"));
    card.m_Gold = ToString(Get(card_json, "gold"));

    card.m_Description = ToString(Get(card_json, "description"));
    card.m_BadStuff = ToString(Get(card_json, "badStuff"));
    card.m_Restrictions = ToString(Get(card_json, "restrictions"));

    card.m_ItemSlot = ToString(Get(card_json, "itemSlot"));
    card.m_IsBig = Get(card_json, "isBig").is_boolean() && Get(card_json, "isBig").get<bool>();
    if (card_json.contains("levelsGained"))
    {
        card.m_LevelsGained = ToOptionalInt(card_json["levelsGained"]);
    }

    card.m_Art.m_InlineData = ToString(Get(card_json, "imageData"));
    card.m_Art.m_Url = ToString(Get(card_json, "storedImageUrl"));

    card.m_ImageScale = ToFloat(Get(card_json, "imageScale"), 100.0f);
    card.m_ImageOffsetX = ToFloat(Get(card_json, "imageOffsetX"), 0.0f);
    card.m_ImageOffsetY = ToFloat(Get(card_json, "imageOffsetY"), 0.0f);
    card.m_DescriptionBoxScale = ToFloat(Get(card_json, "descriptionBoxScale"), 100.0f);

    return card;
}

void ParseSettings(const nlohmann::json& settings, const fs::path& base_dir, RenderConfig& config)
{
    // clang-format off
    static constexpr std::array<std::pair<std::string_view, TemplateKind>, 7> c_LayoutKeys{{
        { "customLayoutClass",       TemplateKind::Class },
        { "customLayoutRace",        TemplateKind::Race },
        { "customLayoutMalediction", TemplateKind::Malediction },
        { "customLayoutEquipement",  TemplateKind::Equipement },
        { "customLayoutItem",        TemplateKind::Item },
        { "customLayoutLvlup",       TemplateKind::Lvlup },
        { "customLayoutMonstre",     TemplateKind::Monstre },
    }};
    // clang-format on

    for (const auto& [key, kind] : c_LayoutKeys)
    {
        std::string source{ ResolveAssetSource(Get(settings, key), base_dir) };
        if (!source.empty())
        {
            config.m_CustomLayouts[kind] = std::move(source);
        }
    }

    if (std::string source{ ResolveAssetSource(Get(settings, "customBackDonjon"), base_dir) }; !source.empty())
    {
        config.m_CustomBacks[BackCategory::Donjon] = std::move(source);
    }
    if (std::string source{ ResolveAssetSource(Get(settings, "customBackTresor"), base_dir) }; !source.empty())
    {
        config.m_CustomBacks[BackCategory::Tresor] = std::move(source);
    }

    const auto set_font{
        [&](std::string_view key, std::string& family)
        {
            if (std::string value{ ToString(Get(settings, key)) }; !value.empty())
            {
                family = std::move(value);
            }
        }
    };
    set_font("fontTitle", config.m_Fonts.m_Title);
    set_font("fontDescription", config.m_Fonts.m_Description);
    set_font("fontMeta", config.m_Fonts.m_Meta);

    const std::string language{ ToString(Get(settings, "language")) };
    config.m_Language = language == "en" ? Language::English : Language::French;
}
} // namespace

Deck LoadDeckFromJson(std::string_view json_text, const fs::path& base_dir)
{
    Deck deck{};
    deck.m_BaseDir = base_dir;

    try
    {
        const nlohmann::json json{ nlohmann::json::parse(json_text) };

        const nlohmann::json* cards_json{ nullptr };
        if (json.is_array())
        {
            cards_json = &json;
        }
        else if (json.is_object())
        {
            if (json.contains("settings") && json["settings"].is_object())
            {
                ParseSettings(json["settings"], base_dir, deck.m_RenderConfig);
            }
            if (json.contains("cards"))
            {
                cards_json = &json["cards"];
            }
        }

        if (cards_json == nullptr || !cards_json->is_array())
        {
            throw std::runtime_error{ "Deck has no array of cards" };
        }

        deck.m_Cards.reserve(cards_json->size());
        for (const nlohmann::json& card_json : *cards_json)
        {
            if (!card_json.is_object())
            {
                LogWarning("Skipping deck entry {}, it is not a card", deck.m_Cards.size() + 1);
                continue;
            }
            deck.m_Cards.push_back(ParseCard(card_json, deck.m_Cards.size()));
        }
    }
    catch (const nlohmann::json::exception& e)
    {
        throw std::runtime_error{ fmt::format("Failed parsing deck: {}", e.what()) };
    }

    return deck;
}

Deck LoadDeck(const fs::path& path)
{
    std::ifstream file{ path, std::ios::binary };
    if (!file)
    {
        throw std::runtime_error{ fmt::format("Could not open deck {}", path.string()) };
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    LogInfo("Loading deck {}...", path.string());
    Deck deck{ LoadDeckFromJson(buffer.str(), fs::absolute(path).parent_path()) };
    LogInfo("Loaded {} cards", deck.m_Cards.size());
    return deck;
}
