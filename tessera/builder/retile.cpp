/******************************************************************************
* Copyright (c) 2026, Tessera Contributors
*
* Tessera -- Point cloud catalog tiling
*
* Tessera is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <tessera/builder/retile.hpp>

#include <iostream>

#include <arbiter/arbiter.hpp>

#include <tessera/util/fs.hpp>

namespace tessera
{

bool writeCluster(
    const Cluster& cluster,
    const std::string& dir,
    const std::string& prefix,
    const Writer& writer)
{
    const std::string path(arbiter::join(dir, cluster.filename(prefix)));
    arbiter::Arbiter a;

    WriteReport report;

    try
    {
        report = writer.write(cluster, path);
    }
    catch (...)
    {
        // A partial output must not end up in the new catalog.
        if (fs::fileSize(a, path)) fs::ensureRemove(path);
        throw;
    }

    if (report.points) return true;

    if (fs::fileSize(a, path)) fs::ensureRemove(path);
    return false;
}

RetileResult retile(
    const Catalog& catalog,
    const std::string& dir,
    const RetileOptions& retileOptions,
    const Reader& reader,
    const Writer& writer,
    const Options& options)
{
    const Clusters clusters(
        planner::planClusters(catalog.index(), retileOptions));

    catalog::prepareOutput(dir);

    if (options.verbose)
    {
        std::cout << "Writing " << clusters.size() << " tiles to " << dir <<
            std::endl;
    }

    const std::string prefix(retileOptions.prefix);

    Dispatcher dispatcher(options);
    const ResultMap<bool> results(
        dispatcher.run(clusters, [&](const Cluster& cluster)
        {
            return writeCluster(cluster, dir, prefix, writer);
        }));

    if (options.verbose) std::cout << "Done" << std::endl;

    return RetileResult {
        catalog::open(dir, reader, options, true),
        ordered(results, getNames(clusters))
    };
}

RetileResult reshape(
    const Catalog& catalog,
    const double size,
    const std::string& dir,
    const std::string& prefix,
    const std::string& extension,
    const Reader& reader,
    const Writer& writer,
    const Options& options)
{
    RetileOptions retileOptions;
    retileOptions.buffer = 0;
    retileOptions.byFile = false;
    retileOptions.tilingSize = size;
    retileOptions.prefix = prefix;
    retileOptions.extension = extension;

    return retile(catalog, dir, retileOptions, reader, writer, options);
}

} // namespace tessera
