#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <mcm/card/card_record.hpp>
#include <mcm/render_config.hpp>

// Sign and range formatting for the diamond badges, e.g. "3" -> "+3", "-2/-4" -> "-2/4"
std::string FormatBonus(std::string_view bonus);

std::optional<uint32_t> ExtractGoldValue(std::string_view gold);

// Footer value label, nullopt when the card type does not show one
std::optional<std::string> FormatGoldDisplay(CardType type, std::string_view gold, Language language);

std::string TranslateItemSlot(std::string_view slot, Language language);

std::string StripAccents(std::string_view text);

// <category>_<type>_<NNN|XXX>_<title>.png, index is zero based
std::string GetExportFilename(const CardRecord& card, std::optional<size_t> index = std::nullopt);
