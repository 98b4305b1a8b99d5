#pragma once

#include <string_view>
#include <vector>

#include <mcm/card/card_record.hpp>
#include <mcm/render_config.hpp>
#include <mcm/util.hpp>

struct Deck
{
    std::vector<CardRecord> m_Cards;
    RenderConfig m_RenderConfig;
    // Relative art and asset paths are resolved against this folder
    fs::path m_BaseDir;
};

// Both throw std::runtime_error when the deck can not be read or parsed
Deck LoadDeck(const fs::path& path);
Deck LoadDeckFromJson(std::string_view json_text, const fs::path& base_dir = {});
