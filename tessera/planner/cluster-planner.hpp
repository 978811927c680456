/******************************************************************************
* Copyright (c) 2026, Tessera Contributors
*
* Tessera -- Point cloud catalog tiling
*
* Tessera is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#pragma once

#include <string>

#include <tessera/index/tile-index.hpp>
#include <tessera/types/work-unit.hpp>

namespace tessera
{

struct RetileOptions
{
    // Margin added on every side of each output tile.
    double buffer = 0;

    // Edge length of the output grid cells, used unless byFile is set.
    double tilingSize = 0;

    // One output per source file instead of a regular grid.
    bool byFile = false;

    std::string prefix;
    std::string extension = "las";
};

namespace planner
{

// Throws ValidationError on a negative buffer, a non-positive tiling size in
// grid mode, or an extension other than las/laz.
void validate(const RetileOptions& options);

// Normalizes ".LAZ", "laz" etc. to "laz".  Throws ValidationError.
std::string normalizeExtension(std::string extension);

// Zero-padded 1-based sequential name for cluster i of count.
std::string sequentialName(std::size_t i, std::size_t count);

Clusters planByFile(const TileIndex& index, const RetileOptions& options);
Clusters planGrid(const TileIndex& index, const RetileOptions& options);

// Dispatches on options.byFile.
Clusters planClusters(const TileIndex& index, const RetileOptions& options);

} // namespace planner
} // namespace tessera
