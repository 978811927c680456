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
#include <vector>

#include <tessera/planner/cluster-planner.hpp>
#include <tessera/planner/geometry-planner.hpp>
#include <tessera/types/filter.hpp>
#include <tessera/types/options.hpp>
#include <tessera/util/json.hpp>

namespace tessera
{
namespace config
{

std::string getInput(const json& j);
std::string getOutput(const json& j);

unsigned getThreads(const json& j);
inline bool getVerbose(const json& j) { return j.value("verbose", false); }
inline bool getProgress(const json& j) { return j.value("progress", false); }
inline bool getRebuild(const json& j) { return j.value("rebuild", false); }

inline double getBuffer(const json& j) { return j.value("buffer", 0.0); }
inline double getTilingSize(const json& j)
{
    return j.value("tilingSize", 0.0);
}
inline bool getByFile(const json& j) { return j.value("byFile", false); }
inline std::string getPrefix(const json& j)
{
    return j.value("prefix", std::string());
}
inline std::string getExtension(const json& j)
{
    return j.value("extension", std::string("las"));
}

// Attribute clauses, from a string or an array of strings like "Z>=0".
Clauses getFilter(const json& j);

// Dimensions to load, from a string or an array of strings.  Empty for all.
DimList getDims(const json& j);

// Options passed through to every point cloud reader stage.
json getReader(const json& j);

// Threads and verbosity.  The progress sink is left for the caller to set.
Options getOptions(const json& j);

RetileOptions getRetileOptions(const json& j);

// ROI arrays "x", "y", "r", "r2", "buffer" (each a number or an array) and
// "names", plus "filter", "dims" and "reader".
RoiRequest getRoiRequest(const json& j);

} // namespace config
} // namespace tessera
