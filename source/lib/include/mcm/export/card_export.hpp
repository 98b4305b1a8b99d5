#pragma once

#include <cstddef>
#include <optional>

#include <mcm/card/card_record.hpp>
#include <mcm/render/rasterizer.hpp>
#include <mcm/util.hpp>

// Captures a single card into "<output_dir>/<export filename>", throws std::runtime_error on failure
fs::path ExportCard(const CardRecord& card,
                    std::optional<size_t> index,
                    CardRasterizer& rasterizer,
                    const fs::path& output_dir,
                    std::optional<int32_t> png_compression = std::nullopt);
