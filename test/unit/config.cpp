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

#include <tessera/types/exceptions.hpp>
#include <tessera/util/config.hpp>

using namespace tessera;

TEST(config, defaults)
{
    const json j = json::object();

    EXPECT_EQ(config::getThreads(j), 8u);
    EXPECT_FALSE(config::getVerbose(j));
    EXPECT_FALSE(config::getProgress(j));
    EXPECT_FALSE(config::getRebuild(j));
    EXPECT_EQ(config::getBuffer(j), 0);
    EXPECT_EQ(config::getExtension(j), "las");
    EXPECT_TRUE(config::getFilter(j).empty());
    EXPECT_EQ(config::getReader(j), json::object());

    EXPECT_THROW(config::getInput(j), ValidationError);
    EXPECT_THROW(config::getOutput(j), ValidationError);
}

TEST(config, options)
{
    const json j {
        { "threads", 3 },
        { "verbose", true }
    };

    const Options options(config::getOptions(j));
    EXPECT_EQ(options.threads, 3u);
    EXPECT_TRUE(options.verbose);
    EXPECT_FALSE(static_cast<bool>(options.progress));

    EXPECT_THROW(
        config::getThreads(json { { "threads", 0 } }),
        ValidationError);
}

TEST(config, retileOptions)
{
    const json j {
        { "input", "/data/in" },
        { "output", "/data/out" },
        { "buffer", 15 },
        { "tilingSize", 500 },
        { "prefix", "plot_" },
        { "extension", "laz" }
    };

    EXPECT_EQ(config::getInput(j), "/data/in");
    EXPECT_EQ(config::getOutput(j), "/data/out");

    const RetileOptions options(config::getRetileOptions(j));
    EXPECT_EQ(options.buffer, 15);
    EXPECT_EQ(options.tilingSize, 500);
    EXPECT_FALSE(options.byFile);
    EXPECT_EQ(options.prefix, "plot_");
    EXPECT_EQ(options.extension, "laz");
}

TEST(config, roiRequest)
{
    const json j {
        { "x", { 10, 20 } },
        { "y", { 30, 40 } },
        { "r", 5 },
        { "buffer", 2 },
        { "names", { "north", "south" } },
        { "filter", { "Z>=0", "Classification==2" } },
        { "dims", { "Intensity", "Classification" } },
        { "reader", { { "spatialreference", "EPSG:2154" } } }
    };

    const RoiRequest request(config::getRoiRequest(j));
    EXPECT_EQ(request.x, (std::vector<double> { 10, 20 }));
    EXPECT_EQ(request.y, (std::vector<double> { 30, 40 }));
    EXPECT_EQ(request.r, std::vector<double>(1, 5));
    EXPECT_TRUE(request.r2.empty());
    EXPECT_EQ(request.buffer, std::vector<double>(1, 2));
    EXPECT_EQ(request.names.at(1), "south");
    ASSERT_EQ(request.clauses.size(), 2u);
    EXPECT_EQ(request.clauses[1].dimension, "Classification");
    EXPECT_EQ(request.dims, (DimList { "Intensity", "Classification" }));
    EXPECT_EQ(request.extra.at("spatialreference"), "EPSG:2154");

    EXPECT_NO_THROW(planner::validate(request));
}

TEST(config, roiRequestDefaults)
{
    const json j {
        { "x", 10 },
        { "y", 30 },
        { "r", 5 },
        { "r2", 8 }
    };

    const RoiRequest request(config::getRoiRequest(j));
    EXPECT_EQ(request.buffer, std::vector<double>(1, 0));
    EXPECT_EQ(request.r2, std::vector<double>(1, 8));
    EXPECT_TRUE(request.names.empty());
    EXPECT_TRUE(request.clauses.empty());
    EXPECT_TRUE(request.dims.empty());

    EXPECT_EQ(
        config::getDims(json { { "dims", "Intensity" } }),
        DimList(1, "Intensity"));
}

TEST(config, invalid)
{
    EXPECT_THROW(
        config::getRoiRequest(json { { "x", "ten" } }),
        ValidationError);
    EXPECT_THROW(
        config::getReader(json { { "reader", "readers.las" } }),
        ValidationError);
    EXPECT_THROW(
        config::getFilter(json { { "filter", "Z" } }),
        ValidationError);
    EXPECT_THROW(
        config::getDims(json { { "dims", { 1, 2 } } }),
        ValidationError);
}
