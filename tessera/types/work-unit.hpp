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
#include <vector>

#include <tessera/types/filter.hpp>
#include <tessera/types/geometry.hpp>
#include <tessera/types/tile.hpp>
#include <tessera/util/json.hpp>

namespace tessera
{

// One independently dispatchable job.  The geometry is the buffered window:
// it already includes the buffer margin.
struct WorkUnit
{
    std::string name;
    Geometry geometry;
    double buffer = 0;
    TileList tiles;
    Clauses clauses;
    DimList dims;
    json extra;

    Filter filter() const { return Filter { geometry, clauses, dims }; }
};

using WorkUnits = std::vector<WorkUnit>;

// A re-tiling output unit.
struct Cluster : public WorkUnit
{
    std::string extension = "las";

    std::string filename(const std::string& prefix) const
    {
        return prefix + name + "." + extension;
    }
};

using Clusters = std::vector<Cluster>;

template <typename Unit>
std::vector<std::string> getNames(const std::vector<Unit>& units)
{
    std::vector<std::string> names;
    names.reserve(units.size());
    for (const auto& u : units) names.push_back(u.name);
    return names;
}

} // namespace tessera
