/******************************************************************************
* Copyright (c) 2026, Tessera Contributors
*
* Tessera -- Point cloud catalog tiling
*
* Tessera is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <cmath>

#include <gtest/gtest.h>

#include <tessera/builder/query.hpp>
#include <tessera/types/exceptions.hpp>

#include "fakes.hpp"

using namespace tessera;

namespace
{

Catalog gridCatalog(test::FakeReader& reader)
{
    const TileList tiles(test::gridTiles());
    test::fillGrid(reader, tiles);
    return Catalog("grid", TileIndex(tiles));
}

RoiRequest scatteredRequest()
{
    RoiRequest request;
    request.x = { 150, 50, 101, 20, 180, 100, 75, 130 };
    request.y = { 150, 50, 99, 170, 20, 100, 140, 60 };
    request.r = { 12 };
    request.buffer = { 3 };
    return request;
}

void expectSameBatches(const QueryResults& a, const QueryResults& b)
{
    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i(0); i < a.size(); ++i)
    {
        EXPECT_EQ(a[i].first, b[i].first);
        ASSERT_TRUE(a[i].second.ok());
        ASSERT_TRUE(b[i].second.ok());

        const PointBatch& pa(*a[i].second.value);
        const PointBatch& pb(*b[i].second.value);
        EXPECT_EQ(pa.values(), pb.values());
        EXPECT_EQ(pa.buffer, pb.buffer);
    }
}

} // unnamed namespace

TEST(query, resultsFollowRequestOrder)
{
    test::FakeReader reader;
    reader.delay = true;
    const Catalog catalog(gridCatalog(reader));
    const RoiRequest request(scatteredRequest());

    const QueryResults sequential(query(catalog, request, reader, Options(1)));
    const QueryResults parallel(query(catalog, request, reader, Options(4)));

    ASSERT_EQ(sequential.size(), request.x.size());
    for (std::size_t i(0); i < sequential.size(); ++i)
    {
        EXPECT_EQ(sequential[i].first, "ROI" + std::to_string(i + 1));
    }

    expectSameBatches(sequential, parallel);
}

TEST(query, idempotent)
{
    test::FakeReader reader;
    const Catalog catalog(gridCatalog(reader));
    const RoiRequest request(scatteredRequest());

    const QueryResults first(query(catalog, request, reader, Options(3)));
    const QueryResults second(query(catalog, request, reader, Options(3)));
    expectSameBatches(first, second);
}

TEST(query, extractsAcrossTiles)
{
    test::FakeReader reader;
    const Catalog catalog(gridCatalog(reader));

    RoiRequest request;
    request.x = { 100 };
    request.y = { 100 };
    request.r = { 10 };
    request.r2 = { 10 };

    const QueryResults results(query(catalog, request, reader, Options(2)));
    ASSERT_EQ(results.size(), 1u);
    ASSERT_TRUE(results[0].second.ok());

    // The four cell centres around the shared corner, one per tile.
    const PointBatch& batch(*results[0].second.value);
    EXPECT_EQ(batch.size(), 4u);
    EXPECT_TRUE(batch.buffer.empty());
}

TEST(query, bufferZones)
{
    test::FakeReader reader;
    const Catalog catalog(gridCatalog(reader));

    RoiRequest request;
    request.x = { 50 };
    request.y = { 50 };
    request.r = { 20 };
    request.buffer = { 5 };

    const QueryResults results(query(catalog, request, reader, Options(1)));
    ASSERT_EQ(results.size(), 1u);
    ASSERT_TRUE(results[0].second.ok());

    const PointBatch& batch(*results[0].second.value);
    ASSERT_FALSE(batch.empty());
    ASSERT_EQ(batch.buffer.size(), batch.size());

    std::size_t edge(0);
    for (std::size_t i(0); i < batch.size(); ++i)
    {
        const double d(std::hypot(batch.x(i) - 50, batch.y(i) - 50));
        EXPECT_LE(d, 25);

        const BufferZone expected(
            d > 20 ? BufferZone::CircleEdge : BufferZone::None);
        EXPECT_EQ(batch.buffer[i], expected) << "at distance " << d;
        if (d > 20) ++edge;
    }
    EXPECT_GT(edge, 0u);
    EXPECT_LT(edge, batch.size());
}

TEST(query, invalidRequestReadsNothing)
{
    test::FakeReader reader;
    const Catalog catalog(gridCatalog(reader));

    RoiRequest request;
    request.x = { 10, 20, 30 };
    request.y = { 10, 20 };
    request.r = { 5 };

    EXPECT_THROW(query(catalog, request, reader, Options(4)), ValidationError);
    EXPECT_EQ(reader.reads.load(), 0);

    request.y.push_back(30);
    request.buffer = { -1 };
    EXPECT_THROW(query(catalog, request, reader, Options(4)), ValidationError);
    EXPECT_EQ(reader.reads.load(), 0);
}

TEST(query, dropsRoisOutsideCatalog)
{
    test::FakeReader reader;
    const Catalog catalog(gridCatalog(reader));

    RoiRequest request;
    request.x = { 50, 1000, 150 };
    request.y = { 50, 1000, 150 };
    request.r = { 5 };
    request.names = { "near", "far", "other" };

    const QueryResults results(query(catalog, request, reader, Options(2)));
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].first, "near");
    EXPECT_EQ(results[1].first, "other");
    EXPECT_EQ(reader.reads.load(), 2);
}

TEST(query, failureIsolation)
{
    test::FakeReader reader;
    const Catalog catalog(gridCatalog(reader));
    reader.failing.insert("b.las");

    RoiRequest request;
    request.x = { 50, 150, 50 };
    request.y = { 50, 50, 150 };
    request.r = { 10 };

    const QueryResults results(query(catalog, request, reader, Options(3)));
    ASSERT_EQ(results.size(), 3u);

    EXPECT_TRUE(results[0].second.ok());
    EXPECT_FALSE(results[1].second.ok());
    EXPECT_EQ(results[1].first, "ROI2");
    EXPECT_NE(results[1].second.error.find("b.las"), std::string::npos);
    EXPECT_TRUE(results[2].second.ok());
}

TEST(query, progress)
{
    test::FakeReader reader;
    const Catalog catalog(gridCatalog(reader));
    const RoiRequest request(scatteredRequest());

    std::vector<uint64_t> reported;
    Options options(4);
    options.progress = [&reported](uint64_t current, uint64_t total)
    {
        EXPECT_EQ(total, 8u);
        reported.push_back(current);
    };

    query(catalog, request, reader, options);

    ASSERT_FALSE(reported.empty());
    EXPECT_EQ(reported.back(), 8u);
    for (std::size_t i(1); i < reported.size(); ++i)
    {
        EXPECT_GT(reported[i], reported[i - 1]);
    }
}

TEST(query, dimensionSelection)
{
    test::FakeReader reader;
    const Catalog catalog(gridCatalog(reader));

    RoiRequest request;
    request.x = { 50 };
    request.y = { 50 };
    request.r = { 10 };

    QueryResults results(query(catalog, request, reader, Options(1)));
    ASSERT_TRUE(results.at(0).second.ok());
    EXPECT_EQ(
        results[0].second.value->dims(),
        test::FakeReader::available());

    request.dims = { "Intensity" };
    results = query(catalog, request, reader, Options(1));
    ASSERT_TRUE(results.at(0).second.ok());

    const PointBatch& batch(*results[0].second.value);
    EXPECT_EQ(batch.dims(), (DimList { "X", "Y", "Z", "Intensity" }));
    ASSERT_FALSE(batch.empty());
    for (std::size_t i(0); i < batch.size(); ++i)
    {
        EXPECT_EQ(batch.get(i, "Intensity"), batch.x(i) + batch.y(i));
    }

    request.dims = { "Z", "X", "Y" };
    results = query(catalog, request, reader, Options(1));
    ASSERT_TRUE(results.at(0).second.ok());
    EXPECT_EQ(results[0].second.value->numDims(), 3u);

    request.dims = { "GpsTime" };
    results = query(catalog, request, reader, Options(1));
    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].second.ok());
    EXPECT_NE(results[0].second.error.find("GpsTime"), std::string::npos);
}

TEST(query, save)
{
    const test::TempDir tmp("query-save");
    const std::string out(tmp.file("rois"));

    test::FakeReader reader;
    const test::FakeWriter writer(reader);
    const Catalog catalog(gridCatalog(reader));
    reader.failing.insert("b.las");

    RoiRequest request;
    request.x = { 50, 150, 50 };
    request.y = { 50, 50, 150 };
    request.r = { 10 };
    request.buffer = { 2 };

    const QueryResults results(query(catalog, request, reader, Options(2)));
    const OrderedResults<uint64_t> saved(
        save(results, out, ".LAZ", writer, Options(2)));

    ASSERT_EQ(saved.size(), 3u);
    EXPECT_EQ(saved[0].first, "ROI1");
    ASSERT_TRUE(saved[0].second.ok());
    EXPECT_EQ(*saved[0].second.value, results[0].second.value->size());
    EXPECT_FALSE(saved[1].second.ok());
    EXPECT_EQ(saved[1].second.error, results[1].second.error);
    EXPECT_TRUE(saved[2].second.ok());

    EXPECT_EQ(writer.writes.load(), 2);
    EXPECT_TRUE(std::filesystem::exists(out + "/ROI1.laz"));
    EXPECT_FALSE(std::filesystem::exists(out + "/ROI2.laz"));
    EXPECT_TRUE(std::filesystem::exists(out + "/ROI3.laz"));
}

TEST(query, saveRefusesOccupiedOutput)
{
    const test::TempDir tmp("query-save-conflict");
    test::writeSummary(tmp.file("old.laz"), 1, Bounds(0, 1, 0, 1));

    test::FakeReader reader;
    const test::FakeWriter writer(reader);
    const Catalog catalog(gridCatalog(reader));
    const QueryResults results(
        query(catalog, scatteredRequest(), reader, Options(2)));

    EXPECT_THROW(
        save(results, tmp.path(), "las", writer, Options(2)),
        ConflictError);
    EXPECT_THROW(
        save(results, tmp.file("other"), "xyz", writer, Options(2)),
        ValidationError);

    EXPECT_EQ(writer.writes.load(), 0);
    EXPECT_EQ(tmp.list(), std::set<std::string> { "old.laz" });
}
