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
#include <vector>

#include <tessera/types/bounds.hpp>
#include <tessera/util/json.hpp>

namespace tessera
{

// One physical point cloud file of a catalog.
struct TileRecord
{
    TileRecord() = default;
    TileRecord(std::string path, Bounds bounds, uint64_t points = 0)
        : path(path)
        , bounds(bounds)
        , points(points)
    { }

    std::string path;
    Bounds bounds;
    uint64_t points = 0;
    uint64_t size = 0;
};

using TileList = std::vector<TileRecord>;

inline void to_json(json& j, const TileRecord& t)
{
    j = {
        { "path", t.path },
        { "bounds", t.bounds },
        { "points", t.points },
        { "size", t.size }
    };
}

inline void from_json(const json& j, TileRecord& t)
{
    t.path = j.at("path").get<std::string>();
    t.bounds = j.at("bounds").get<Bounds>();
    t.points = j.value<uint64_t>("points", 0);
    t.size = j.value<uint64_t>("size", 0);
}

} // namespace tessera
