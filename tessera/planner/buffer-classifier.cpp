/******************************************************************************
* Copyright (c) 2026, Tessera Contributors
*
* Tessera -- Point cloud catalog tiling
*
* Tessera is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <tessera/planner/buffer-classifier.hpp>

namespace tessera
{
namespace buffer
{

BufferZone classify(
    const double x,
    const double y,
    const Geometry& g,
    const double b)
{
    if (g.isCircle())
    {
        const double inner(g.rx - b);
        if (inner <= 0) return BufferZone::CircleEdge;

        const double dx(x - g.x);
        const double dy(y - g.y);
        return dx * dx + dy * dy > inner * inner
            ? BufferZone::CircleEdge
            : BufferZone::None;
    }

    const Bounds bounds(g.bounds());
    BufferZone zone(BufferZone::None);

    if (y < bounds.ymin() + b) zone = BufferZone::Bottom;
    if (x < bounds.xmin() + b) zone = BufferZone::Left;
    if (y > bounds.ymax() - b) zone = BufferZone::Top;
    if (x > bounds.xmax() - b) zone = BufferZone::Right;

    return zone;
}

BufferZones classify(
    const std::vector<Xy>& points,
    const Geometry& geometry,
    const double b)
{
    BufferZones zones;
    zones.reserve(points.size());
    for (const Xy& p : points) zones.push_back(classify(p.x, p.y, geometry, b));
    return zones;
}

BufferZones classify(
    const PointBatch& points,
    const Geometry& geometry,
    const double b)
{
    BufferZones zones;
    zones.reserve(points.size());
    for (std::size_t i(0); i < points.size(); ++i)
    {
        zones.push_back(classify(points.x(i), points.y(i), geometry, b));
    }
    return zones;
}

} // namespace buffer
} // namespace tessera
