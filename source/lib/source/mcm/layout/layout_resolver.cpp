#include <mcm/layout/layout_resolver.hpp>

#include <QByteArray>

#include <fmt/format.h>

#include <mcm/util/log.hpp>

TemplateKind GetTemplateKind(const CardRecord& card)
{
    switch (card.m_Type)
    {
    case CardType::Class:
        return TemplateKind::Class;
    case CardType::Race:
        return TemplateKind::Race;
    case CardType::Curse:
        return TemplateKind::Malediction;
    case CardType::Item:
        if (card.m_ItemSlot == c_SlotEnhancement)
        {
            return TemplateKind::Malediction;
        }
        if (card.HasItemSlot() || card.m_IsBig)
        {
            return TemplateKind::Equipement;
        }
        return TemplateKind::Item;
    case CardType::LevelUp:
        return TemplateKind::Lvlup;
    case CardType::FaithfulServant:
    case CardType::DungeonTrap:
    case CardType::DungeonBonus:
    case CardType::TreasureTrap:
        return TemplateKind::Malediction;
    case CardType::Monster:
    case CardType::Other:
    default:
        return TemplateKind::Monstre;
    }
}

std::string_view GetTemplateFilename(TemplateKind kind)
{
    switch (kind)
    {
    case TemplateKind::Class:
        return "layout_class.png";
    case TemplateKind::Race:
        return "layout_race.png";
    case TemplateKind::Malediction:
        return "layout_malediction.png";
    case TemplateKind::Equipement:
        return "layout_equipement.png";
    case TemplateKind::Item:
        return "layout_item.png";
    case TemplateKind::Lvlup:
        return "layout_lvlup.png";
    case TemplateKind::Monstre:
    default:
        return "layout_monstre.png";
    }
}

std::string_view GetLayoutFilename(const CardRecord& card)
{
    return GetTemplateFilename(GetTemplateKind(card));
}

std::string_view GetBackFilename(BackCategory category)
{
    return category == BackCategory::Donjon
               ? "layout_back_donjon.png"
               : "layout_back_tresors.png";
}

std::optional<EncodedImage> DecodeDataUrl(std::string_view url)
{
    if (!url.starts_with("data:"))
    {
        return std::nullopt;
    }

    const auto comma{ url.find(',') };
    if (comma == std::string_view::npos)
    {
        return std::nullopt;
    }

    const std::string_view header{ url.substr(0, comma) };
    const std::string_view payload{ url.substr(comma + 1) };
    if (!header.ends_with(";base64"))
    {
        return std::nullopt;
    }

    const auto decoded{
        QByteArray::fromBase64Encoding(QByteArray{ payload.data(), static_cast<qsizetype>(payload.size()) })
    };
    if (!decoded)
    {
        return std::nullopt;
    }

    const auto* data{ reinterpret_cast<const std::byte*>(decoded->constData()) };
    return EncodedImage{ data, data + decoded->size() };
}

AssetResolver::AssetResolver(const RenderConfig& config)
    : AssetResolver{ config, DefaultCandidates(config.m_AssetRoot) }
{
}

AssetResolver::AssetResolver(const RenderConfig& config, std::vector<Candidate> candidates)
    : m_Config{ config }
    , m_Candidates{ std::move(candidates) }
{
}

std::vector<AssetResolver::Candidate> AssetResolver::DefaultCandidates(const fs::path& asset_root)
{
    return {
        [asset_root](std::string_view directory, std::string_view file)
        {
            return asset_root / directory / file;
        },
        [asset_root](std::string_view /*directory*/, std::string_view file)
        {
            return asset_root / file;
        },
        [](std::string_view directory, std::string_view file)
        {
            return fs::absolute(fs::path{ directory } / file);
        },
    };
}

AssetResolution AssetResolver::Resolve(const AssetRequest& request) const
{
    std::string key{ fmt::format("{}/{}", request.m_Directory, request.m_File) };

    std::vector<AssetSource> sources{};
    bool has_override{ false };
    if (request.m_Override.has_value() && !request.m_Override->empty())
    {
        const std::string_view override_source{ request.m_Override.value() };
        if (auto inline_data{ DecodeDataUrl(override_source) })
        {
            sources.push_back(AssetSource{ .m_Path{}, .m_InlineData{ std::move(inline_data) } });
            has_override = true;
        }
        else if (const fs::path override_path{ override_source }; fs::is_regular_file(override_path))
        {
            sources.push_back(AssetSource{ .m_Path{ override_path } });
            has_override = true;
        }
        else
        {
            LogWarning("Custom asset {} for {} could not be loaded, falling back to the default", override_source.substr(0, 64), key);
        }
    }

    AssetMissing missing{};
    for (const Candidate& candidate : m_Candidates)
    {
        fs::path candidate_path{ candidate(request.m_Directory, request.m_File) };
        if (fs::is_regular_file(candidate_path))
        {
            sources.push_back(AssetSource{ .m_Path{ candidate_path } });
        }
        missing.m_Candidates.push_back(std::move(candidate_path));
    }

    if (sources.empty())
    {
        missing.m_Key = std::move(key);
        return missing;
    }

    return AssetResolved{
        .m_Key{ has_override ? fmt::format("custom:{}", key) : std::move(key) },
        .m_Sources{ std::move(sources) },
    };
}

AssetResolution AssetResolver::ResolveTemplate(TemplateKind kind) const
{
    const auto it{ m_Config.m_CustomLayouts.find(kind) };
    return Resolve(AssetRequest{
        .m_Directory{ c_LayoutDirectory },
        .m_File{ GetTemplateFilename(kind) },
        .m_Override{ it != m_Config.m_CustomLayouts.end()
                         ? std::optional<std::string_view>{ it->second }
                         : std::nullopt },
    });
}

AssetResolution AssetResolver::ResolveBack(BackCategory category) const
{
    const auto it{ m_Config.m_CustomBacks.find(category) };
    return Resolve(AssetRequest{
        .m_Directory{ c_LayoutDirectory },
        .m_File{ GetBackFilename(category) },
        .m_Override{ it != m_Config.m_CustomBacks.end()
                         ? std::optional<std::string_view>{ it->second }
                         : std::nullopt },
    });
}

AssetResolution AssetResolver::ResolveDescriptionTexture() const
{
    return Resolve(AssetRequest{
        .m_Directory{ c_TextureDirectory },
        .m_File{ c_DescriptionTexture },
    });
}
