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
#include <utility>

#include <arbiter/arbiter.hpp>

#include <tessera/index/tile-index.hpp>
#include <tessera/io/point-io.hpp>
#include <tessera/types/options.hpp>
#include <tessera/util/fs.hpp>

namespace tessera
{

// A directory of point cloud tiles and its spatial index.
class Catalog
{
public:
    Catalog(std::string path, TileIndex index)
        : m_path(path)
        , m_index(std::move(index))
    { }

    const std::string& path() const { return m_path; }
    const TileIndex& index() const { return m_index; }
    std::size_t size() const { return m_index.size(); }

private:
    std::string m_path;
    TileIndex m_index;
};

namespace catalog
{

// Sidecar index written inside every opened catalog directory.
const std::string indexFilename("tessera-index.json");

// Inspects each file, in parallel, returning one record per path.  Any file
// that cannot be inspected fails the whole analysis with an IndexError.
TileList analyze(
    const StringList& paths,
    const Reader& reader,
    const Options& options,
    const arbiter::Arbiter& a = { });

// Creates dir for new point cloud files.  Throws ConflictError, creating
// nothing, if it already holds LAS/LAZ files.
void prepareOutput(const std::string& dir);

// Scans dir for LAS/LAZ files and indexes those holding points, reusing
// entries of the sidecar index whose path and size still match unless rebuild
// is set.  The sidecar is rewritten when anything changed.
Catalog open(
    std::string dir,
    const Reader& reader,
    const Options& options,
    bool rebuild = false);

} // namespace catalog
} // namespace tessera
