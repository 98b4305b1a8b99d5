#include <mcm/card/card_format.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <ranges>
#include <utility>
#include <vector>

#include <QString>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <magic_enum/magic_enum.hpp>

#include <mcm/qt_util.hpp>

namespace
{
std::string_view Trim(std::string_view str)
{
    const auto first{ str.find_first_not_of(" \t\r\n") };
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last{ str.find_last_not_of(" \t\r\n") };
    return str.substr(first, last - first + 1);
}

// Parses the longest numeric prefix, "3 PO" yields 3 and "abc" yields nothing
std::optional<double> ParseLeadingNumber(std::string_view str)
{
    str = Trim(str);
    if (str.starts_with('+'))
    {
        str.remove_prefix(1);
    }
    if (str.empty())
    {
        return std::nullopt;
    }

#ifdef __clang__
    // Clang and AppleClang do not support std::from_chars overloads with floating points
    const std::string null_terminated{ str };
    char* end{ nullptr };
    const double value{ std::strtod(null_terminated.c_str(), &end) };
    if (end == null_terminated.c_str())
    {
        return std::nullopt;
    }
    return value;
#else
    double value{};
    const auto [ptr, ec]{ std::from_chars(str.data(), str.data() + str.size(), value) };
    if (ec != std::errc{})
    {
        return std::nullopt;
    }
    return value;
#endif
}

std::string FormatNumber(double value)
{
    return fmt::format("{}", value);
}
} // namespace

std::string FormatBonus(std::string_view bonus)
{
    bonus = Trim(bonus);
    if (bonus.empty())
    {
        return {};
    }

    if (bonus.contains('/'))
    {
        std::vector<std::string> formatted_parts;
        size_t i{ 0 };
        for (const auto part_range : bonus | std::views::split('/'))
        {
            const bool is_first{ i++ == 0 };
            const std::string_view part{ Trim(std::string_view{ part_range.begin(), part_range.end() }) };
            if (part.empty())
            {
                formatted_parts.emplace_back();
                continue;
            }

            const auto number{ ParseLeadingNumber(part) };
            if (!number.has_value())
            {
                formatted_parts.emplace_back(part);
            }
            else if (is_first)
            {
                formatted_parts.push_back(number.value() > 0.0 ? "+" + FormatNumber(number.value())
                                                               : FormatNumber(number.value()));
            }
            else
            {
                formatted_parts.push_back(FormatNumber(std::abs(number.value())));
            }
        }
        return fmt::format("{}", fmt::join(formatted_parts, "/"));
    }

    const auto number{ ParseLeadingNumber(bonus) };
    if (!number.has_value() || number.value() == 0.0)
    {
        return {};
    }
    if (number.value() > 0.0)
    {
        return "+" + FormatNumber(number.value());
    }
    return FormatNumber(number.value());
}

std::optional<uint32_t> ExtractGoldValue(std::string_view gold)
{
    const auto is_digit{ [](char c)
                         { return c >= '0' && c <= '9'; } };

    const auto first_digit{ std::ranges::find_if(gold, is_digit) };
    if (first_digit == gold.end())
    {
        return std::nullopt;
    }
    const auto last_digit{ std::find_if_not(first_digit, gold.end(), is_digit) };

    uint32_t value{};
    const auto [ptr, ec]{ std::from_chars(&*first_digit, &*first_digit + (last_digit - first_digit), value) };
    if (ec != std::errc{})
    {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> FormatGoldDisplay(CardType type, std::string_view gold, Language language)
{
    switch (type)
    {
    case CardType::Curse:
    case CardType::Race:
    case CardType::Class:
    case CardType::LevelUp:
    case CardType::FaithfulServant:
        return std::nullopt;
    default:
        break;
    }

    const auto value{ ExtractGoldValue(gold) };
    if (!value.has_value())
    {
        return std::nullopt;
    }

    const bool english{ language == Language::English };
    const bool plural{ value.value() > 1 };
    if (type == CardType::Monster)
    {
        return english ? fmt::format("{} treasure{}", value.value(), plural ? "s" : "")
                       : fmt::format("{} trésor{}", value.value(), plural ? "s" : "");
    }

    if (type == CardType::Item)
    {
        if (value.value() == 0)
        {
            return english ? "No value" : "Aucune valeur";
        }
        return english ? fmt::format("{} gold piece{}", value.value(), plural ? "s" : "")
                       : fmt::format("{} pièce{} d'or", value.value(), plural ? "s" : "");
    }

    return std::string{ gold };
}

std::string TranslateItemSlot(std::string_view slot, Language language)
{
    if (language != Language::English)
    {
        return std::string{ slot };
    }

    // clang-format off
    static constexpr std::array<std::pair<std::string_view, std::string_view>, 8> c_SlotNames{{
        { "1 Main",                  "1 Hand" },
        { "2 Mains",                 "2 Hands" },
        { "Couvre-chef",             "Headgear" },
        { "Chaussures",              "Footgear" },
        { "Armure",                  "Armor" },
        { "Monture",                 "Steed" },
        { c_SlotEnhancement,         "Enhancement" },
        { c_SlotSteedEnhancement,    "Steed Enhancement" },
    }};
    // clang-format on

    for (const auto& [french, english] : c_SlotNames)
    {
        if (french == slot)
        {
            return std::string{ english };
        }
    }
    return std::string{ slot };
}

std::string StripAccents(std::string_view text)
{
    const QString decomposed{ ToQString(text).normalized(QString::NormalizationForm_D) };

    QString stripped;
    stripped.reserve(decomposed.size());
    for (const QChar c : decomposed)
    {
        if (c.category() != QChar::Mark_NonSpacing)
        {
            stripped.append(c);
        }
    }
    return ToStdString(stripped);
}

std::string GetExportFilename(const CardRecord& card, std::optional<size_t> index)
{
    const std::string_view category{ magic_enum::enum_name(GetBackCategory(card.m_Type)) };

    std::string type_slug;
    for (const char c : StripAccents(GetCardTypeName(card.m_Type)))
    {
        const bool is_space{ c == ' ' || c == '\t' };
        if (!is_space)
        {
            type_slug += c;
        }
        else if (!type_slug.ends_with('-'))
        {
            type_slug += '-';
        }
    }

    const std::string number{
        index.has_value() ? fmt::format("{:03}", index.value() + 1)
                          : std::string{ "XXX" }
    };

    std::string title_slug;
    for (const char c : StripAccents(card.m_Title))
    {
        const bool keep{
            (c >= 'a' && c <= 'z') ||
            (c >= 'A' && c <= 'Z') ||
            (c >= '0' && c <= '9') ||
            c == '_'
        };
        if (keep)
        {
            title_slug += static_cast<char>(c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c);
        }
        else if (!title_slug.empty() && !title_slug.ends_with('-'))
        {
            title_slug += '-';
        }
    }
    while (title_slug.ends_with('-'))
    {
        title_slug.pop_back();
    }
    if (title_slug.empty())
    {
        title_slug = "carte";
    }

    return fmt::format("{}_{}_{}_{}.png", category, type_slug, number, title_slug);
}
