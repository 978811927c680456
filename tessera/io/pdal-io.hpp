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

#include <tessera/io/point-io.hpp>

namespace tessera
{

// Reader and writer backed by PDAL pipelines.  Spatial and attribute
// filters are translated to filters.crop and filters.range stages.
class PdalIo : public Reader, public Writer
{
public:
    PdalIo() = default;

    PointBatch read(
        const TileList& tiles,
        const Filter& filter,
        const json& extra) const override;

    SourceInfo inspect(const std::string& path) const override;

    WriteReport write(
        const Cluster& cluster,
        const std::string& path) const override;

    WriteReport write(
        const PointBatch& batch,
        const std::string& path) const override;
};

namespace pdalio
{

// Pipeline stages, exposed for testing.
json readerStages(const TileList& tiles, const json& extra);
json cropStage(const Geometry& geometry);
json rangeStage(const Clause& clause);
json filterPipeline(
    const TileList& tiles,
    const Filter& filter,
    const json& extra);

} // namespace pdalio
} // namespace tessera
