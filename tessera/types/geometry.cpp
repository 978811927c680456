/******************************************************************************
* Copyright (c) 2026, Tessera Contributors
*
* Tessera -- Point cloud catalog tiling
*
* Tessera is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <tessera/types/geometry.hpp>

#include <algorithm>
#include <sstream>

namespace tessera
{

bool Geometry::overlaps(const Bounds& b) const
{
    if (!bounds().overlaps(b)) return false;
    if (shape == Shape::Rectangle) return true;

    // Nearest point of the box to the centre must lie strictly inside the
    // disc.
    const double nx(std::max(b.xmin(), std::min(x, b.xmax())));
    const double ny(std::max(b.ymin(), std::min(y, b.ymax())));
    const double dx(nx - x);
    const double dy(ny - y);
    return dx * dx + dy * dy < rx * rx;
}

std::string toString(const Geometry& g)
{
    std::ostringstream ss;
    ss.precision(15);
    if (g.isCircle())
    {
        ss << "circle(" << g.x << ", " << g.y << ", " << g.rx << ")";
    }
    else
    {
        const Bounds b(g.bounds());
        ss << "rectangle(" << b.xmin() << ", " << b.ymin() << ", " <<
            b.xmax() << ", " << b.ymax() << ")";
    }
    return ss.str();
}

} // namespace tessera
