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
#include <functional>
#include <string>

namespace tessera
{

using ProgressSink = std::function<void(uint64_t current, uint64_t total)>;

// Execution settings threaded explicitly through every batch call.
struct Options
{
    Options() = default;
    Options(unsigned threads, bool verbose = false)
        : threads(threads)
        , verbose(verbose)
    { }

    unsigned threads = 1;
    bool verbose = false;
    ProgressSink progress;
};

} // namespace tessera
