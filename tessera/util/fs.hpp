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

#include <cstdint>
#include <string>
#include <vector>

#include <arbiter/arbiter.hpp>

#include <tessera/util/optional.hpp>

namespace tessera
{

using StringList = std::vector<std::string>;

namespace fs
{

// True for .las and .laz paths, case-insensitively.
bool isPointCloud(const std::string& path);

// The LAS/LAZ files directly inside dir, sorted.
StringList listPointClouds(const arbiter::Arbiter& a, const std::string& dir);

optional<uint64_t> fileSize(const arbiter::Arbiter& a, const std::string& path);

// Throws if the directory cannot be created.
void ensureDirectory(const std::string& dir);

// Throws if the file cannot be removed.
void ensureRemove(const std::string& path);

} // namespace fs
} // namespace tessera
