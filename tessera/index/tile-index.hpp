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

#include <cstddef>

#include <tessera/types/bounds.hpp>
#include <tessera/types/geometry.hpp>
#include <tessera/types/tile.hpp>

namespace tessera
{

// Immutable spatial lookup over the tiles of a catalog.  Safe to share
// between threads once constructed.
class TileIndex
{
public:
    TileIndex() = default;

    // Throws IndexError on duplicate paths or degenerate bounds.
    explicit TileIndex(TileList tiles);

    // Tiles whose bounds intersect the geometry, in catalog order.  Tiles
    // that only touch the geometry are excluded.
    TileList intersecting(const Geometry& geometry) const;

    // Union of all tile bounds.  Empty (inverted) when there are no tiles.
    const Bounds& bounds() const { return m_bounds; }

    const TileList& tiles() const { return m_tiles; }
    const TileRecord& at(std::size_t i) const { return m_tiles.at(i); }
    std::size_t size() const { return m_tiles.size(); }
    bool empty() const { return m_tiles.empty(); }

    TileList::const_iterator begin() const { return m_tiles.begin(); }
    TileList::const_iterator end() const { return m_tiles.end(); }

private:
    TileList m_tiles;
    Bounds m_bounds = Bounds::expander();
};

} // namespace tessera
