/******************************************************************************
* Copyright (c) 2026, Tessera Contributors
*
* Tessera -- Point cloud catalog tiling
*
* Tessera is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <tessera/builder/catalog.hpp>

#include <algorithm>
#include <iostream>
#include <map>

#include <tessera/builder/heuristics.hpp>
#include <tessera/types/exceptions.hpp>
#include <tessera/util/io.hpp>
#include <tessera/util/json.hpp>
#include <tessera/util/pool.hpp>

namespace tessera
{
namespace catalog
{

namespace
{

using TileMap = std::map<std::string, TileRecord>;

TileMap loadIndex(const arbiter::Endpoint& ep, const bool verbose)
{
    TileMap tiles;
    if (!ep.tryGetSize(indexFilename)) return tiles;

    const optional<std::string> data(getWithRetry(ep, indexFilename));
    if (!data) return tiles;

    try
    {
        const json j = json::parse(*data);
        for (const json& t : j.at("tiles"))
        {
            const TileRecord tile(t.get<TileRecord>());
            tiles[tile.path] = tile;
        }
    }
    catch (const std::exception& e)
    {
        if (verbose)
        {
            std::cout << "Ignoring unreadable " << indexFilename << ": " <<
                e.what() << std::endl;
        }
        tiles.clear();
    }

    return tiles;
}

void saveIndex(const arbiter::Endpoint& ep, const TileList& tiles)
{
    const bool pretty(tiles.size() <= heuristics::maxPrettyIndexTiles);
    const json j { { "tiles", tiles } };
    ensurePut(ep, indexFilename, j.dump(getIndent(pretty)));
}

} // unnamed namespace

TileList analyze(
    const StringList& paths,
    const Reader& reader,
    const Options& options,
    const arbiter::Arbiter& a)
{
    std::vector<TileRecord> tiles(paths.size());
    std::vector<std::string> errors(paths.size());

    const auto analyzeOne = [&](const std::size_t i)
    {
        const std::string& path(paths[i]);
        try
        {
            const SourceInfo info(reader.inspect(path));
            TileRecord& tile(tiles[i]);
            tile.path = path;
            tile.bounds = info.bounds;
            tile.points = info.points;
            if (const auto size = fs::fileSize(a, path)) tile.size = *size;
        }
        catch (const std::exception& e)
        {
            errors[i] = e.what();
        }
    };

    const std::size_t threads(
        std::min<std::size_t>(options.threads, paths.size()));

    if (threads <= 1)
    {
        for (std::size_t i(0); i < paths.size(); ++i) analyzeOne(i);
    }
    else
    {
        Pool pool(threads, threads, options.verbose);
        for (std::size_t i(0); i < paths.size(); ++i)
        {
            if (options.verbose)
            {
                std::cout << "Analyzing " << i << " - " << paths[i] <<
                    std::endl;
            }
            pool.add([&analyzeOne, i]() { analyzeOne(i); });
        }
        pool.join();
    }

    for (std::size_t i(0); i < paths.size(); ++i)
    {
        if (!errors[i].empty())
        {
            throw IndexError(
                "Failed to analyze " + paths[i] + ": " + errors[i]);
        }
    }

    return tiles;
}

void prepareOutput(const std::string& dir)
{
    arbiter::Arbiter a;
    if (!fs::listPointClouds(a, dir).empty())
    {
        throw ConflictError(
            "The output folder already contains .las or .laz files. "
            "Operation aborted.");
    }

    fs::ensureDirectory(dir);
}

Catalog open(
    const std::string dir,
    const Reader& reader,
    const Options& options,
    const bool rebuild)
{
    arbiter::Arbiter a;
    const arbiter::Endpoint ep(a.getEndpoint(dir));

    const StringList paths(fs::listPointClouds(a, dir));
    const TileMap existing(
        rebuild ? TileMap() : loadIndex(ep, options.verbose));

    StringList pending;
    for (const std::string& path : paths)
    {
        const auto it = existing.find(path);
        const auto size = fs::fileSize(a, path);
        if (it == existing.end() || !size || it->second.size != *size)
        {
            pending.push_back(path);
        }
    }

    if (options.verbose)
    {
        std::cout << "Catalog " << dir << ": " << paths.size() << " files, " <<
            pending.size() << " to analyze" << std::endl;
    }

    TileMap current(existing);
    for (const TileRecord& tile : analyze(pending, reader, options, a))
    {
        current[tile.path] = tile;
    }

    // Everything listed is recorded in the sidecar, including empty files so
    // that they are not analyzed again, but only tiles with points are indexed.
    TileList recorded;
    TileList tiles;
    for (const std::string& path : paths)
    {
        const TileRecord& tile(current.at(path));
        recorded.push_back(tile);

        if (tile.points) tiles.push_back(tile);
        else if (options.verbose)
        {
            std::cout << "Skipping empty file " << path << std::endl;
        }
    }

    const bool changed(!pending.empty() || existing.size() != paths.size());
    if (changed) saveIndex(ep, recorded);

    return Catalog(dir, TileIndex(tiles));
}

} // namespace catalog
} // namespace tessera
