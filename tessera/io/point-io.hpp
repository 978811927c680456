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

#include <cstdint>
#include <string>

#include <tessera/types/bounds.hpp>
#include <tessera/types/filter.hpp>
#include <tessera/types/point-batch.hpp>
#include <tessera/types/tile.hpp>
#include <tessera/types/work-unit.hpp>
#include <tessera/util/json.hpp>

namespace tessera
{

// Header-level summary of one point cloud file.
struct SourceInfo
{
    Bounds bounds;
    uint64_t points = 0;
};

struct WriteReport
{
    uint64_t points = 0;
};

// Point cloud reading service.  Implementations must tolerate concurrent
// calls from several threads on the same files.
class Reader
{
public:
    virtual ~Reader() { }

    // Points of all tiles matching the filter, merged in tile order.  Extra
    // holds implementation-specific reader options.
    virtual PointBatch read(
        const TileList& tiles,
        const Filter& filter,
        const json& extra) const = 0;

    virtual SourceInfo inspect(const std::string& path) const = 0;
};

// Point cloud writing service.
class Writer
{
public:
    virtual ~Writer() { }

    // Writes the points of the cluster's tiles falling inside its window to
    // path.  The report reflects what was actually written to disk.
    virtual WriteReport write(
        const Cluster& cluster,
        const std::string& path) const = 0;

    // Writes already extracted points, buffer zones included, to path.
    virtual WriteReport write(
        const PointBatch& batch,
        const std::string& path) const = 0;
};

} // namespace tessera
