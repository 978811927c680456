/******************************************************************************
* Copyright (c) 2026, Tessera Contributors
*
* Tessera -- Point cloud catalog tiling
*
* Tessera is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <tessera/builder/query.hpp>

#include <iostream>
#include <vector>

#include <arbiter/arbiter.hpp>

#include <tessera/planner/buffer-classifier.hpp>
#include <tessera/planner/cluster-planner.hpp>
#include <tessera/util/fs.hpp>

namespace tessera
{

namespace
{

struct Output
{
    std::string name;
    const PointBatch* batch;
};

} // unnamed namespace

PointBatch extract(const WorkUnit& unit, const Reader& reader)
{
    PointBatch batch(reader.read(unit.tiles, unit.filter(), unit.extra));

    if (unit.buffer > 0)
    {
        batch.buffer = buffer::classify(batch, unit.geometry, unit.buffer);
    }

    return batch;
}

QueryResults query(
    const Catalog& catalog,
    const RoiRequest& request,
    const Reader& reader,
    const Options& options)
{
    if (options.verbose) std::cout << "Indexing files..." << std::endl;

    const WorkUnits units(planner::plan(catalog.index(), request));
    const std::vector<std::string> names(getNames(units));

    if (options.verbose)
    {
        for (const WorkUnit& unit : units)
        {
            std::cout << "\t" << unit.name << ": " <<
                toString(unit.geometry) << " - " << unit.tiles.size() <<
                " tiles" << std::endl;
        }
        for (const Clause& c : request.clauses)
        {
            std::cout << "\tFilter: " << toString(c) << std::endl;
        }

        std::cout << "Extracting data for " << units.size() << " of " <<
            request.x.size() << " ROIs..." << std::endl;
    }

    Dispatcher dispatcher(options);
    const ResultMap<PointBatch> results(
        dispatcher.run(units, [&reader](const WorkUnit& unit)
        {
            return extract(unit, reader);
        }));

    return ordered(results, names);
}

OrderedResults<uint64_t> save(
    const QueryResults& results,
    const std::string& dir,
    const std::string& extension,
    const Writer& writer,
    const Options& options)
{
    const std::string ext(planner::normalizeExtension(extension));
    catalog::prepareOutput(dir);

    std::vector<Output> outputs;
    std::vector<std::string> names;
    for (const auto& p : results)
    {
        names.push_back(p.first);
        if (p.second.ok())
        {
            outputs.push_back(Output { p.first, &*p.second.value });
        }
    }

    if (options.verbose)
    {
        std::cout << "Writing " << outputs.size() << " ROIs to " << dir <<
            std::endl;
    }

    Dispatcher dispatcher(options);
    ResultMap<uint64_t> written(
        dispatcher.run(outputs, [&](const Output& output)
        {
            const std::string path(
                arbiter::join(dir, output.name + "." + ext));

            try
            {
                return writer.write(*output.batch, path).points;
            }
            catch (...)
            {
                arbiter::Arbiter a;
                if (fs::fileSize(a, path)) fs::ensureRemove(path);
                throw;
            }
        }));

    for (const auto& p : results)
    {
        if (!p.second.ok()) written[p.first].error = p.second.error;
    }

    return ordered(written, names);
}

} // namespace tessera
