#include <mcm/render/asset_cache.hpp>

#include <array>

#include <QByteArray>

#include <mcm/qt_util.hpp>
#include <mcm/util/log.hpp>

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
} // namespace

AssetCache::AssetCache(const RenderConfig& config, std::chrono::milliseconds load_timeout, fs::path deck_dir)
    : m_Config{ config }
    , m_Resolver{ config }
    , m_DeckDir{ std::move(deck_dir) }
    , m_LoadTimeout{ load_timeout }
{
    ResetBudget();
}

void AssetCache::ResetBudget()
{
    m_Deadline = std::chrono::steady_clock::now() + m_LoadTimeout;
    m_TimeoutReported = false;
}

bool AssetCache::BudgetExhausted() const
{
    return std::chrono::steady_clock::now() > m_Deadline;
}

bool AssetCache::ConsumeBudget(std::string_view what)
{
    if (!BudgetExhausted())
    {
        return true;
    }

    if (!m_TimeoutReported)
    {
        LogWarning("Image loading exceeded {}ms, skipping {} and remaining images", m_LoadTimeout.count(), what);
        m_TimeoutReported = true;
    }
    return false;
}

std::optional<LoadedAsset> AssetCache::MakeAsset(Image image)
{
    if (!image.Valid())
    {
        return std::nullopt;
    }

    QImage painted{ image.ToQImage() };
    return LoadedAsset{
        std::move(image),
        std::move(painted),
    };
}

const LoadedAsset* AssetCache::GetTemplate(TemplateKind kind)
{
    return Load(m_Resolver.ResolveTemplate(kind));
}

const LoadedAsset* AssetCache::GetBack(BackCategory category)
{
    return Load(m_Resolver.ResolveBack(category));
}

const LoadedAsset* AssetCache::GetDescriptionTexture()
{
    return Load(m_Resolver.ResolveDescriptionTexture());
}

const LoadedAsset* AssetCache::Load(const AssetResolution& resolution)
{
    if (const auto* missing{ std::get_if<AssetMissing>(&resolution) })
    {
        if (!m_Assets.contains(missing->m_Key))
        {
            LogWarning("Asset {} not found after trying {} locations", missing->m_Key, missing->m_Candidates.size());
            m_Assets[missing->m_Key] = std::nullopt;
        }
        return nullptr;
    }

    const auto& resolved{ std::get<AssetResolved>(resolution) };
    if (const auto it{ m_Assets.find(resolved.m_Key) }; it != m_Assets.end())
    {
        return it->second.has_value() ? &it->second.value() : nullptr;
    }

    if (!ConsumeBudget(resolved.m_Key))
    {
        // Not cached, a later card with a fresh budget may still load it
        return nullptr;
    }

    auto& entry{ m_Assets[resolved.m_Key] };
    for (const AssetSource& source : resolved.m_Sources)
    {
        entry = MakeAsset(source.m_InlineData.has_value()
                              ? Image::Decode(source.m_InlineData.value())
                              : Image::Read(source.m_Path));
        if (entry.has_value())
        {
            return &entry.value();
        }

        LogWarning("Failed decoding asset {} from {}",
                   resolved.m_Key,
                   source.m_InlineData.has_value() ? "inline data" : source.m_Path.string());
    }

    LogWarning("Asset {} could not be decoded from any of {} locations", resolved.m_Key, resolved.m_Sources.size());
    return nullptr;
}

std::optional<LoadedAsset> AssetCache::LoadArt(const ArtReference& art)
{
    if (art.Empty())
    {
        return std::nullopt;
    }

    if (!ConsumeBudget("card art"))
    {
        return std::nullopt;
    }

    if (!art.m_InlineData.empty())
    {
        const std::string_view inline_data{ Trim(art.m_InlineData) };
        if (auto decoded{ DecodeDataUrl(inline_data) })
        {
            return MakeAsset(Image::Decode(decoded.value()));
        }

        const auto raw{
            QByteArray::fromBase64Encoding(QByteArray{ inline_data.data(), static_cast<qsizetype>(inline_data.size()) })
        };
        if (!raw)
        {
            LogWarning("Card art is not valid base64");
            return std::nullopt;
        }
        return MakeAsset(Image::Decode(ToByteSpan(*raw)));
    }

    const std::string_view url{ Trim(art.m_Url) };
    if (auto decoded{ DecodeDataUrl(url) })
    {
        return MakeAsset(Image::Decode(decoded.value()));
    }

    if (url.starts_with("http://") || url.starts_with("https://"))
    {
        LogWarning("Remote card art {} can not be fetched, rendering without art", url);
        return std::nullopt;
    }

    std::string_view local{ url };
    if (local.starts_with("file://"))
    {
        local.remove_prefix(7);
    }

    const fs::path art_path{ local };
    const std::array candidates{
        m_DeckDir / art_path.relative_path(),
        art_path,
        m_Config.m_AssetRoot / art_path.relative_path(),
    };
    for (const fs::path& candidate : candidates)
    {
        if (fs::is_regular_file(candidate))
        {
            if (auto asset{ MakeAsset(Image::Read(candidate)) })
            {
                return asset;
            }
            LogWarning("Failed decoding card art {}", candidate.string());
        }
    }

    LogWarning("Card art {} not found", url);
    return std::nullopt;
}
