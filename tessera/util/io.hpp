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

#include <arbiter/arbiter.hpp>

#include <tessera/util/optional.hpp>

namespace tessera
{

static constexpr int defaultTries = 8;

bool putWithRetry(
    const arbiter::Endpoint& ep,
    const std::string& path,
    const std::string& s,
    int tries = defaultTries);

void ensurePut(
    const arbiter::Endpoint& ep,
    const std::string& path,
    const std::string& s,
    int tries = defaultTries);

optional<std::string> getWithRetry(
    const arbiter::Endpoint& ep,
    const std::string& path,
    int tries = defaultTries);

} // namespace tessera
