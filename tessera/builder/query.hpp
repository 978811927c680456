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

#include <tessera/builder/catalog.hpp>
#include <tessera/builder/dispatcher.hpp>
#include <cstdint>
#include <string>

#include <tessera/io/point-io.hpp>
#include <tessera/planner/geometry-planner.hpp>
#include <tessera/types/options.hpp>
#include <tessera/types/point-batch.hpp>

namespace tessera
{

using QueryResults = OrderedResults<PointBatch>;

// Extracts the points of each ROI from the catalog.  Results follow the
// request order, minus the ROIs that intersect no tile.  When a ROI is
// buffered, its batch carries a buffer zone per point.
//
// Throws ValidationError for a malformed request, before any reading.  A ROI
// whose extraction fails is reported in its result and does not affect the
// others.
QueryResults query(
    const Catalog& catalog,
    const RoiRequest& request,
    const Reader& reader,
    const Options& options);

// Extraction of a single planned unit, buffer tagging included.
PointBatch extract(const WorkUnit& unit, const Reader& reader);

// Writes each extracted ROI to <dir>/<name>.<extension> and reports the
// points written per ROI, in result order.  Failed ROIs keep their error
// and write nothing.
//
// Throws ValidationError for an extension other than las/laz and
// ConflictError if dir already holds LAS/LAZ files, before any write.
OrderedResults<uint64_t> save(
    const QueryResults& results,
    const std::string& dir,
    const std::string& extension,
    const Writer& writer,
    const Options& options);

} // namespace tessera
