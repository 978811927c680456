/******************************************************************************
* Copyright (c) 2026, Tessera Contributors
*
* Tessera -- Point cloud catalog tiling
*
* Tessera is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <tessera/index/tile-index.hpp>

#include <set>
#include <sstream>
#include <utility>

#include <tessera/types/exceptions.hpp>

namespace tessera
{

TileIndex::TileIndex(TileList tiles)
    : m_tiles(std::move(tiles))
{
    std::set<std::string> paths;

    for (const TileRecord& tile : m_tiles)
    {
        if (!paths.insert(tile.path).second)
        {
            throw IndexError("Duplicate tile path: " + tile.path);
        }

        if (tile.bounds.degenerate())
        {
            std::ostringstream ss;
            ss << "Degenerate tile bounds " << tile.bounds << ": " <<
                tile.path;
            throw IndexError(ss.str());
        }

        m_bounds.grow(tile.bounds);
    }
}

TileList TileIndex::intersecting(const Geometry& geometry) const
{
    TileList result;
    if (!geometry.bounds().overlaps(m_bounds)) return result;

    for (const TileRecord& tile : m_tiles)
    {
        if (geometry.overlaps(tile.bounds)) result.push_back(tile);
    }
    return result;
}

} // namespace tessera
