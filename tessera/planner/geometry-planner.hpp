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

#include <tessera/index/tile-index.hpp>
#include <tessera/types/filter.hpp>
#include <tessera/types/work-unit.hpp>
#include <tessera/util/json.hpp>

namespace tessera
{

// A batch of regions of interest as parallel arrays.  r, r2 and buffer may
// hold either a single value shared by every ROI or one value per ROI.  A
// non-empty r2 turns every ROI into a rectangle of half sizes r by r2.
struct RoiRequest
{
    std::vector<double> x;
    std::vector<double> y;
    std::vector<double> r;
    std::vector<double> r2;
    std::vector<double> buffer { 0 };
    std::vector<std::string> names;

    // Attribute restrictions, dimensions to load (all if empty) and reader
    // options applied to every ROI.
    Clauses clauses;
    DimList dims;
    json extra;
};

namespace planner
{

// Throws ValidationError if the request is malformed.
void validate(const RoiRequest& request);

// Names of the request, defaulting to ROI1, ROI2, ...
std::vector<std::string> getNames(const RoiRequest& request);

// Validates, then builds one unit per ROI that intersects at least one tile,
// preserving request order.  ROIs that intersect nothing are dropped.
WorkUnits plan(const TileIndex& index, const RoiRequest& request);

} // namespace planner
} // namespace tessera
