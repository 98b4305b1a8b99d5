#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <mcm/card/card_record.hpp>
#include <mcm/image.hpp>
#include <mcm/render_config.hpp>
#include <mcm/util.hpp>

TemplateKind GetTemplateKind(const CardRecord& card);

std::string_view GetTemplateFilename(TemplateKind kind);
std::string_view GetLayoutFilename(const CardRecord& card);
std::string_view GetBackFilename(BackCategory category);

inline constexpr std::string_view c_LayoutDirectory{ "layouts" };
inline constexpr std::string_view c_TextureDirectory{ "texture" };
inline constexpr std::string_view c_DescriptionTexture{ "texture_description.png" };

struct AssetSource
{
    fs::path m_Path;
    std::optional<EncodedImage> m_InlineData{ std::nullopt };
};

struct AssetResolved
{
    // Unique per asset, used as cache key
    std::string m_Key;
    // Every usable source in order of preference, never empty
    std::vector<AssetSource> m_Sources;
};

struct AssetMissing
{
    std::string m_Key;
    std::vector<fs::path> m_Candidates;
};

using AssetResolution = std::variant<AssetResolved, AssetMissing>;

struct AssetRequest
{
    std::string_view m_Directory;
    std::string_view m_File;
    // Data url or path that is tried before any of the default locations
    std::optional<std::string_view> m_Override{ std::nullopt };
};

/*
        Resolves asset file names through an ordered list of candidate locations,
        all candidates that exist on disk are returned so that a loader can move on
        to the next one when decoding fails
*/
class AssetResolver
{
  public:
    using Candidate = std::function<fs::path(std::string_view directory, std::string_view file)>;

    explicit AssetResolver(const RenderConfig& config);
    AssetResolver(const RenderConfig& config, std::vector<Candidate> candidates);

    AssetResolution Resolve(const AssetRequest& request) const;

    AssetResolution ResolveTemplate(TemplateKind kind) const;
    AssetResolution ResolveBack(BackCategory category) const;
    AssetResolution ResolveDescriptionTexture() const;

    static std::vector<Candidate> DefaultCandidates(const fs::path& asset_root);

  private:
    const RenderConfig& m_Config;
    std::vector<Candidate> m_Candidates;
};

// Decodes "data:<mime>;base64,<payload>", nullopt when not a data url
std::optional<EncodedImage> DecodeDataUrl(std::string_view url);
