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

namespace tessera
{
namespace heuristics
{

// Sequential cluster names are zero-padded to at least this many digits, and
// more if the cluster count needs them.
const std::size_t minNameWidth(5);

// Work units queued ahead of the workers, per worker thread.
const std::size_t queuedUnitsPerThread(2);

// Relative slack when dividing a catalog extent into grid cells.
const double gridTolerance(1e-9);

// Default thread count for catalog analysis and batch dispatch.
const unsigned defaultThreads(8);

// Catalogs with more tiles than this get a compact sidecar index.
const std::size_t maxPrettyIndexTiles(1000);

} // namespace heuristics
} // namespace tessera
