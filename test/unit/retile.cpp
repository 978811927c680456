/******************************************************************************
* Copyright (c) 2026, Tessera Contributors
*
* Tessera -- Point cloud catalog tiling
*
* Tessera is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <gtest/gtest.h>

#include <tessera/builder/retile.hpp>
#include <tessera/types/exceptions.hpp>

#include "fakes.hpp"

using namespace tessera;

namespace
{

Catalog gridCatalog(test::FakeReader& reader, TileList tiles)
{
    test::fillGrid(reader, tiles);
    return Catalog("grid", TileIndex(tiles));
}

RetileOptions gridOptions(const double size, const double buffer = 0)
{
    RetileOptions options;
    options.tilingSize = size;
    options.buffer = buffer;
    return options;
}

// Leaves a truncated file behind for one cluster before failing, as a writer
// that opens its output before reading its sources does.
class TruncatingWriter : public test::FakeWriter
{
public:
    TruncatingWriter(const test::FakeReader& reader, std::string broken)
        : test::FakeWriter(reader)
        , m_broken(broken)
    { }

    using test::FakeWriter::write;

    WriteReport write(
        const Cluster& cluster,
        const std::string& path) const override
    {
        if (cluster.name != m_broken)
        {
            return test::FakeWriter::write(cluster, path);
        }

        std::ofstream file(path);
        file << "garbage" << std::endl;
        throw std::runtime_error("Write interrupted");
    }

private:
    const std::string m_broken;
};

} // unnamed namespace

TEST(retile, grid)
{
    const test::TempDir tmp("retile-grid");
    const std::string out(tmp.file("out"));

    test::FakeReader reader;
    const test::FakeWriter writer(reader);
    const Catalog source(gridCatalog(reader, test::gridTiles()));

    const RetileResult result(
        retile(source, out, gridOptions(100), reader, writer, Options(4)));

    EXPECT_EQ(writer.writes.load(), 4);
    ASSERT_EQ(result.clusters.size(), 4u);
    for (const auto& c : result.clusters)
    {
        ASSERT_TRUE(c.second.ok()) << c.second.error;
        EXPECT_TRUE(*c.second.value);
    }

    const Catalog& output(result.catalog);
    EXPECT_EQ(output.path(), out);
    ASSERT_EQ(output.size(), 4u);
    EXPECT_EQ(output.index().bounds(), source.index().bounds());
    EXPECT_EQ(output.index().at(0).path, out + "/00001.las");
    EXPECT_EQ(output.index().at(0).points, 100u);
    EXPECT_EQ(output.index().at(3).bounds, Bounds(100, 200, 100, 200));
}

TEST(retile, emptyClusterLeavesNoFile)
{
    const test::TempDir tmp("retile-empty");

    // No data in the north-east quadrant.
    TileList tiles(test::gridTiles());
    tiles.pop_back();

    test::FakeReader reader;
    const test::FakeWriter writer(reader);
    const Catalog source(gridCatalog(reader, tiles));

    const RetileResult result(
        retile(
            source,
            tmp.path(),
            gridOptions(100),
            reader,
            writer,
            Options(2)));

    EXPECT_EQ(writer.writes.load(), 4);
    ASSERT_EQ(result.clusters.size(), 4u);
    EXPECT_EQ(result.clusters[3].first, "00004");
    ASSERT_TRUE(result.clusters[3].second.ok());
    EXPECT_FALSE(*result.clusters[3].second.value);

    const std::set<std::string> expected {
        "00001.las", "00002.las", "00003.las", catalog::indexFilename
    };
    EXPECT_EQ(tmp.list(), expected);
    EXPECT_EQ(result.catalog.size(), 3u);
}

TEST(retile, buffered)
{
    const test::TempDir tmp("retile-buffered");

    test::FakeReader reader;
    const test::FakeWriter writer(reader);
    const Catalog source(gridCatalog(reader, test::gridTiles()));

    const RetileResult result(
        retile(
            source,
            tmp.path(),
            gridOptions(100, 10),
            reader,
            writer,
            Options(4)));

    const Catalog& output(result.catalog);
    ASSERT_EQ(output.size(), 4u);

    // Cell centres from 5 to 105 on both axes.
    EXPECT_EQ(output.index().at(0).points, 121u);
    EXPECT_EQ(output.index().at(0).bounds, Bounds(-10, 110, -10, 110));
    EXPECT_EQ(output.index().bounds(), Bounds(-10, 210, -10, 210));
}

TEST(retile, byFile)
{
    const test::TempDir tmp("retile-by-file");

    test::FakeReader reader;
    const test::FakeWriter writer(reader);
    const Catalog source(gridCatalog(reader, test::gridTiles()));

    RetileOptions options;
    options.byFile = true;
    options.extension = ".LAZ";

    const RetileResult result(
        retile(source, tmp.path(), options, reader, writer, Options(3)));

    const std::set<std::string> expected {
        "a.laz", "b.laz", "c.laz", "d.laz", catalog::indexFilename
    };
    EXPECT_EQ(tmp.list(), expected);
    EXPECT_EQ(result.clusters.front().first, "a");
    EXPECT_EQ(result.catalog.size(), 4u);
}

TEST(retile, reshape)
{
    const test::TempDir tmp("retile-reshape");

    test::FakeReader reader;
    const test::FakeWriter writer(reader);
    const Catalog source(gridCatalog(reader, test::gridTiles()));

    const RetileResult result(
        reshape(
            source,
            500,
            tmp.path(),
            "tile_",
            "laz",
            reader,
            writer,
            Options(2)));

    ASSERT_EQ(result.clusters.size(), 1u);
    ASSERT_EQ(result.catalog.size(), 1u);
    EXPECT_EQ(result.catalog.index().at(0).path, tmp.file("tile_00001.laz"));
    EXPECT_EQ(result.catalog.index().at(0).points, 400u);
}

TEST(retile, conflict)
{
    const test::TempDir tmp("retile-conflict");
    test::writeSummary(tmp.file("existing.LAS"), 1, Bounds(0, 1, 0, 1));

    test::FakeReader reader;
    const test::FakeWriter writer(reader);
    const Catalog source(gridCatalog(reader, test::gridTiles()));

    EXPECT_THROW(
        retile(
            source,
            tmp.path(),
            gridOptions(100),
            reader,
            writer,
            Options(2)),
        ConflictError);

    EXPECT_EQ(writer.writes.load(), 0);
    EXPECT_EQ(tmp.list(), std::set<std::string> { "existing.LAS" });
}

TEST(retile, invalidOptionsWriteNothing)
{
    const test::TempDir tmp("retile-invalid");
    const std::string out(tmp.file("out"));

    test::FakeReader reader;
    const test::FakeWriter writer(reader);
    const Catalog source(gridCatalog(reader, test::gridTiles()));

    EXPECT_THROW(
        retile(source, out, gridOptions(0), reader, writer, Options(2)),
        ValidationError);
    EXPECT_THROW(
        retile(source, out, gridOptions(100, -5), reader, writer, Options(2)),
        ValidationError);

    EXPECT_EQ(writer.writes.load(), 0);
    EXPECT_FALSE(std::filesystem::exists(out));
}

TEST(retile, failedWriteLeavesNoFile)
{
    const test::TempDir tmp("retile-failed-write");

    test::FakeReader reader;
    const TruncatingWriter writer(reader, "00002");
    const Catalog source(gridCatalog(reader, test::gridTiles()));

    const RetileResult result(
        retile(
            source,
            tmp.path(),
            gridOptions(100),
            reader,
            writer,
            Options(2)));

    ASSERT_EQ(result.clusters.size(), 4u);
    EXPECT_TRUE(result.clusters[0].second.ok());
    EXPECT_EQ(result.clusters[1].first, "00002");
    EXPECT_FALSE(result.clusters[1].second.ok());
    EXPECT_EQ(result.clusters[1].second.error, "Write interrupted");
    EXPECT_TRUE(result.clusters[2].second.ok());
    EXPECT_TRUE(result.clusters[3].second.ok());

    const std::set<std::string> expected {
        "00001.las", "00003.las", "00004.las", catalog::indexFilename
    };
    EXPECT_EQ(tmp.list(), expected);
    EXPECT_EQ(result.catalog.size(), 3u);
}
