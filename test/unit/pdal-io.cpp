/******************************************************************************
* Copyright (c) 2026, Tessera Contributors
*
* Tessera -- Point cloud catalog tiling
*
* Tessera is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <gtest/gtest.h>

#include <tessera/io/pdal-io.hpp>

using namespace tessera;

namespace
{

TileList tiles()
{
    return TileList {
        TileRecord("/data/a.las", Bounds(0, 100, 0, 100)),
        TileRecord("/data/b.laz", Bounds(100, 200, 0, 100))
    };
}

} // unnamed namespace

TEST(pdalIo, readerStages)
{
    const json stages(pdalio::readerStages(tiles(), json::object()));
    ASSERT_EQ(stages.size(), 2u);
    EXPECT_EQ(stages[0], (json { { "filename", "/data/a.las" } }));
    EXPECT_EQ(stages[1].at("filename"), "/data/b.laz");

    const json extra { { "spatialreference", "EPSG:2154" } };
    const json withOptions(pdalio::readerStages(tiles(), extra));
    EXPECT_EQ(withOptions[1].at("spatialreference"), "EPSG:2154");
    EXPECT_EQ(withOptions[1].at("filename"), "/data/b.laz");
}

TEST(pdalIo, cropStage)
{
    const json circle(pdalio::cropStage(Geometry::circle(10.5, -3, 12)));
    EXPECT_EQ(circle.at("type"), "filters.crop");
    EXPECT_EQ(circle.at("point"), "POINT(10.5 -3)");
    EXPECT_EQ(circle.at("distance"), 12);
    EXPECT_FALSE(circle.count("bounds"));

    const json rect(pdalio::cropStage(Geometry::rectangle(50, 60, 10, 5)));
    EXPECT_EQ(rect.at("type"), "filters.crop");
    EXPECT_EQ(rect.at("bounds"), "([40, 60], [55, 65])");
    EXPECT_FALSE(rect.count("point"));
}

TEST(pdalIo, rangeStage)
{
    const auto limits = [](const std::string s)
    {
        return pdalio::rangeStage(parseClause(s)).at("limits")
            .get<std::string>();
    };

    EXPECT_EQ(pdalio::rangeStage(parseClause("Z<1")).at("type"),
        "filters.range");

    EXPECT_EQ(limits("Z<1"), "Z[:1)");
    EXPECT_EQ(limits("Z<=1"), "Z[:1]");
    EXPECT_EQ(limits("Z>1.5"), "Z(1.5:]");
    EXPECT_EQ(limits("Z>=0"), "Z[0:]");
    EXPECT_EQ(limits("Classification==2"), "Classification[2:2]");
    EXPECT_EQ(limits("Classification!=7"), "Classification![7:7]");
}

TEST(pdalIo, filterPipeline)
{
    const Filter filter {
        Geometry::circle(100, 50, 20),
        parseClauses(json::array({ "Z>=0", "Z<40" }))
    };

    const json pipeline(pdalio::filterPipeline(tiles(), filter, json()));
    ASSERT_EQ(pipeline.size(), 6u);
    EXPECT_EQ(pipeline[0].at("filename"), "/data/a.las");
    EXPECT_EQ(pipeline[1].at("filename"), "/data/b.laz");
    EXPECT_EQ(pipeline[2].at("type"), "filters.merge");
    EXPECT_EQ(pipeline[3].at("type"), "filters.crop");
    EXPECT_EQ(pipeline[4].at("limits"), "Z[0:]");
    EXPECT_EQ(pipeline[5].at("limits"), "Z[:40)");

    // A single source needs no merge.
    const TileList one(1, tiles().front());
    const json single(pdalio::filterPipeline(one, filter, json()));
    ASSERT_EQ(single.size(), 4u);
    for (const json& stage : single)
    {
        EXPECT_NE(stage.value("type", ""), "filters.merge");
    }
}
