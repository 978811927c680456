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

#include <tessera/builder/catalog.hpp>
#include <tessera/builder/dispatcher.hpp>
#include <tessera/io/point-io.hpp>
#include <tessera/planner/cluster-planner.hpp>
#include <tessera/types/options.hpp>

namespace tessera
{

struct RetileResult
{
    // The freshly scanned output catalog.
    Catalog catalog;

    // Per cluster, in cluster order: true if an output file was kept, false
    // if it held no points and was deleted.
    OrderedResults<bool> clusters;
};

// Rewrites the catalog as a new set of tiles in dir.  The output directory
// is created if needed.
//
// Throws ValidationError for bad options and ConflictError if dir already
// holds LAS/LAZ files, in both cases before anything is written.
RetileResult retile(
    const Catalog& catalog,
    const std::string& dir,
    const RetileOptions& retileOptions,
    const Reader& reader,
    const Writer& writer,
    const Options& options);

// Retiling to a regular grid of the given size, without buffer.
RetileResult reshape(
    const Catalog& catalog,
    double size,
    const std::string& dir,
    const std::string& prefix,
    const std::string& extension,
    const Reader& reader,
    const Writer& writer,
    const Options& options);

// Writes one cluster into dir.  Returns false, leaving no file behind, if
// the written output holds no points.  A failing write also leaves no file
// behind and rethrows.
bool writeCluster(
    const Cluster& cluster,
    const std::string& dir,
    const std::string& prefix,
    const Writer& writer);

} // namespace tessera
