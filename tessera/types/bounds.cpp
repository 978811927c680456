/******************************************************************************
* Copyright (c) 2026, Tessera Contributors
*
* Tessera -- Point cloud catalog tiling
*
* Tessera is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <tessera/types/bounds.hpp>

namespace tessera
{

std::ostream& operator<<(std::ostream& os, const Bounds& b)
{
    os << "[(" << b.xmin() << ", " << b.ymin() << "), (" <<
        b.xmax() << ", " << b.ymax() << ")]";
    return os;
}

} // namespace tessera
