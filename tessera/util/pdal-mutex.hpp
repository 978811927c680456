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

#include <mutex>

namespace tessera
{

// PDAL's stage creation and pipeline parsing are not thread-safe.
class PdalMutex
{
public:
    static std::mutex& get()
    {
        static std::mutex m;
        return m;
    }
};

} // namespace tessera
