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

#include <iostream>

#include <tessera/builder/catalog.hpp>
#include <tessera/builder/retile.hpp>
#include <tessera/io/pdal-io.hpp>
#include <tessera/util/config.hpp>

namespace tessera
{
namespace app
{

void Retile::addArgs()
{
    m_ap.setUsage("Usage: tessera retile <args>");

    addConfig();
    addInput("Directory of the LAS/LAZ catalog to retile.");
    addOutput("Output directory, which must not hold LAS/LAZ files yet.");

    m_ap.add(
        "--size",
        "-s",
        "Edge length of the output tiles.",
        [this](json j) { m_json["tilingSize"] = extractNumber(j); });
    m_ap.add(
        "--buffer",
        "-b",
        "Buffer added on every side of each output tile.",
        [this](json j) { m_json["buffer"] = extractNumber(j); });
    m_ap.add(
        "--by-file",
        "Write one output per input file instead of a regular grid.",
        [this](json j) { checkEmpty(j); m_json["byFile"] = true; });
    m_ap.add(
        "--prefix",
        "-p",
        "Prefix of the output filenames.",
        [this](json j) { m_json["prefix"] = j; });
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

void Retile::run()
{
    const Options options(getOptions());
    const RetileOptions retileOptions(config::getRetileOptions(m_json));
    const std::string output(config::getOutput(m_json));
    const PdalIo io;

    const Catalog catalog(
        catalog::open(
            config::getInput(m_json),
            io,
            options,
            config::getRebuild(m_json)));

    std::cout << "Retiling " << catalog.size() << " files" << std::endl;
    std::cout << "\tMode: " <<
        (retileOptions.byFile ? "by file" : "regular grid") << std::endl;
    if (!retileOptions.byFile)
    {
        std::cout << "\tTile size: " << retileOptions.tilingSize << std::endl;
    }
    std::cout << "\tBuffer: " << retileOptions.buffer << std::endl;
    std::cout << "\tOutput: " << output << std::endl;

    const RetileResult result(
        retile(catalog, output, retileOptions, io, io, options));

    std::size_t written(0);
    std::size_t empty(0);
    for (const auto& p : result.clusters)
    {
        if (!p.second.ok())
        {
            std::cout << "\t" << p.first << ": failed - " << p.second.error <<
                std::endl;
        }
        else if (*p.second.value) ++written;
        else ++empty;
    }

    std::cout << "Wrote " << written << " tiles, skipped " << empty <<
        " empty, " << result.catalog.size() << " in the new catalog" <<
        std::endl;
}

} // namespace app
} // namespace tessera
