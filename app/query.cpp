/******************************************************************************
* Copyright (c) 2026, Tessera Contributors
*
* Tessera -- Point cloud catalog tiling
*
* Tessera is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include "commands.hpp"

#include <cstdint>
#include <iostream>

#include <tessera/builder/catalog.hpp>
#include <tessera/builder/query.hpp>
#include <tessera/io/pdal-io.hpp>
#include <tessera/util/config.hpp>

namespace tessera
{
namespace app
{

void Query::addArgs()
{
    m_ap.setUsage("Usage: tessera query <args>");

    addConfig();
    addInput("Directory of the LAS/LAZ catalog to query.");

    m_ap.add("--x", "-x", "ROI centre X coordinates.", [this](json j)
    {
        m_json["x"] = extractNumbers(j);
    });
    m_ap.add("--y", "-y", "ROI centre Y coordinates.", [this](json j)
    {
        m_json["y"] = extractNumbers(j);
    });
    m_ap.add(
        "--radius",
        "-r",
        "ROI radius, shared or one per ROI.  Without --radius2 the ROIs are "
        "discs.",
        [this](json j) { m_json["r"] = extractNumbers(j); });
    m_ap.add(
        "--radius2",
        "Second ROI half size, shared or one per ROI.  Makes the ROIs "
        "rectangles of half sizes radius by radius2.",
        [this](json j) { m_json["r2"] = extractNumbers(j); });
    m_ap.add(
        "--buffer",
        "-b",
        "Buffer added around each ROI, shared or one per ROI.",
        [this](json j) { m_json["buffer"] = extractNumbers(j); });
    m_ap.add("--names", "Names of the ROIs.", [this](json j)
    {
        m_json["names"] = extractStrings(j);
    });

    addFilter();
    m_ap.add(
        "--dims",
        "Dimensions to load besides X, Y and Z.  All are loaded by default.\n"
        "\t\tExample: --dims Intensity Classification",
        [this](json j) { m_json["dims"] = extractStrings(j); });

    addOutput(
        "Directory to write one file per ROI into.  Without it, only point "
        "counts are reported.");
    m_ap.add(
        "--extension",
        "-e",
        "Output format, las or laz.",
        [this](json j) { m_json["extension"] = j; });

    addThreads();
    addProgress();
    addRebuild();
    addVerbose();
}

void Query::run()
{
    const Options options(getOptions());
    const PdalIo io;

    const Catalog catalog(
        catalog::open(
            config::getInput(m_json),
            io,
            options,
            config::getRebuild(m_json)));

    const RoiRequest request(config::getRoiRequest(m_json));

    // Fail before extracting anything if the results could not be written.
    if (m_json.count("output"))
    {
        planner::normalizeExtension(config::getExtension(m_json));
        catalog::prepareOutput(config::getOutput(m_json));
    }

    const QueryResults results(query(catalog, request, io, options));

    std::cout << results.size() << " of " << request.x.size() <<
        " ROIs intersect the catalog" << std::endl;

    for (const auto& p : results)
    {
        const std::string& name(p.first);
        const UnitResult<PointBatch>& result(p.second);

        if (!result.ok())
        {
            std::cout << "\t" << name << ": failed - " << result.error <<
                std::endl;
            continue;
        }

        const PointBatch& batch(*result.value);
        uint64_t buffered(0);
        for (const BufferZone z : batch.buffer)
        {
            if (z != BufferZone::None) ++buffered;
        }

        std::cout << "\t" << name << ": " << batch.size() << " points";
        if (!batch.buffer.empty()) std::cout << " (" << buffered << " buffer)";
        std::cout << std::endl;
    }

    if (!m_json.count("output")) return;

    const std::string output(config::getOutput(m_json));
    const OrderedResults<uint64_t> saved(
        save(results, output, config::getExtension(m_json), io, options));

    std::size_t files(0);
    for (const auto& p : saved)
    {
        if (p.second.ok()) ++files;
        else
        {
            std::cout << "\t" << p.first << ": not written - " <<
                p.second.error << std::endl;
        }
    }

    std::cout << "Wrote " << files << " files to " << output << std::endl;
}

} // namespace app
} // namespace tessera
