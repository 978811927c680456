/******************************************************************************
* Copyright (c) 2026, Tessera Contributors
*
* Tessera -- Point cloud catalog tiling
*
* Tessera is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <tessera/util/fs.hpp>

#include <algorithm>
#include <regex>
#include <stdexcept>

namespace tessera
{
namespace fs
{

bool isPointCloud(const std::string& path)
{
    static const std::regex pattern(
        R"(\.la(s|z)$)",
        std::regex::ECMAScript | std::regex::icase);
    return std::regex_search(path, pattern);
}

StringList listPointClouds(const arbiter::Arbiter& a, const std::string& dir)
{
    StringList paths;
    for (const std::string& path : a.resolve(arbiter::join(dir, "*")))
    {
        if (isPointCloud(path)) paths.push_back(path);
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

optional<uint64_t> fileSize(const arbiter::Arbiter& a, const std::string& path)
{
    if (const auto size = a.tryGetSize(path)) return uint64_t(*size);
    return { };
}

void ensureDirectory(const std::string& dir)
{
    if (!arbiter::mkdirp(dir))
    {
        throw std::runtime_error("Could not create directory: " + dir);
    }
}

void ensureRemove(const std::string& path)
{
    if (!arbiter::remove(path))
    {
        throw std::runtime_error("Could not remove file: " + path);
    }
}

} // namespace fs
} // namespace tessera
