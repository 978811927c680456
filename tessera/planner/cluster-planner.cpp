/******************************************************************************
* Copyright (c) 2026, Tessera Contributors
*
* Tessera -- Point cloud catalog tiling
*
* Tessera is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <tessera/planner/cluster-planner.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>

#include <arbiter/arbiter.hpp>

#include <tessera/builder/heuristics.hpp>
#include <tessera/types/exceptions.hpp>

namespace tessera
{
namespace planner
{

namespace
{

Cluster makeCluster(
    const TileIndex& index,
    const Bounds& window,
    const RetileOptions& options)
{
    Cluster cluster;
    cluster.geometry = Geometry::rectangle(window).grow(options.buffer);
    cluster.buffer = options.buffer;
    cluster.tiles = index.intersecting(cluster.geometry);
    cluster.extension = normalizeExtension(options.extension);
    return cluster;
}

// Cells needed to cover span.  Rounding noise in the division never adds a
// cell lying wholly outside the span.
std::size_t cellCount(const double span, const double size)
{
    const double cells(span / size);
    return std::max<std::size_t>(
        1,
        std::ceil(cells - cells * heuristics::gridTolerance));
}

} // unnamed namespace

void validate(const RetileOptions& options)
{
    if (options.buffer < 0)
    {
        throw ValidationError("Buffer size must be a positive value");
    }

    if (!options.byFile && !(options.tilingSize > 0))
    {
        throw ValidationError("Tiling size must be a positive value");
    }

    normalizeExtension(options.extension);
}

std::string normalizeExtension(std::string ext)
{
    if (!ext.empty() && ext.front() == '.') ext = ext.substr(1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
    {
        return std::tolower(c);
    });

    if (ext != "las" && ext != "laz")
    {
        throw ValidationError("Invalid output extension, must be las or laz");
    }
    return ext;
}

std::string sequentialName(const std::size_t i, const std::size_t count)
{
    const std::size_t digits(std::ceil(std::log10(count + 1.0)));
    const std::size_t width(std::max(heuristics::minNameWidth, digits));

    std::ostringstream ss;
    ss << std::setw(width) << std::setfill('0') << (i + 1);
    return ss.str();
}

Clusters planByFile(const TileIndex& index, const RetileOptions& options)
{
    Clusters clusters;

    std::vector<std::string> basenames;
    for (const TileRecord& tile : index)
    {
        clusters.push_back(makeCluster(index, tile.bounds, options));
        basenames.push_back(
            arbiter::stripExtension(arbiter::getBasename(tile.path)));
    }

    const std::set<std::string> unique(basenames.begin(), basenames.end());
    const bool keepNames(
        options.prefix.empty() && unique.size() == basenames.size());

    for (std::size_t i(0); i < clusters.size(); ++i)
    {
        clusters[i].name = keepNames
            ? basenames[i]
            : sequentialName(i, clusters.size());
    }

    return clusters;
}

Clusters planGrid(const TileIndex& index, const RetileOptions& options)
{
    Clusters clusters;
    if (index.empty()) return clusters;

    const Bounds& extent(index.bounds());
    const double size(options.tilingSize);
    const std::size_t nx(cellCount(extent.width(), size));
    const std::size_t ny(cellCount(extent.height(), size));

    for (std::size_t row(0); row < ny; ++row)
    {
        const double ymin(extent.ymin() + row * size);
        for (std::size_t col(0); col < nx; ++col)
        {
            const double xmin(extent.xmin() + col * size);
            const Bounds cell(xmin, xmin + size, ymin, ymin + size);
            clusters.push_back(makeCluster(index, cell, options));
        }
    }

    for (std::size_t i(0); i < clusters.size(); ++i)
    {
        clusters[i].name = sequentialName(i, clusters.size());
    }

    return clusters;
}

Clusters planClusters(const TileIndex& index, const RetileOptions& options)
{
    validate(options);
    return options.byFile
        ? planByFile(index, options)
        : planGrid(index, options);
}

} // namespace planner
} // namespace tessera
