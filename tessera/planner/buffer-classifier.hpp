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

#include <vector>

#include <tessera/types/geometry.hpp>
#include <tessera/types/point-batch.hpp>

namespace tessera
{
namespace buffer
{

// Tags each point with the buffer zone it falls in, for a unit whose
// (buffered) window is the given geometry.  The result is parallel to the
// input, which is left untouched.
//
// Circle: CircleEdge beyond a distance of r - buffer from the centre.
//
// Rectangle: the bottom, left, top and right strips of width buffer are
// tested in that order and the last matching test wins, so a point in the
// bottom-left corner is Left and one in the top-left corner is Top.
BufferZones classify(
    const std::vector<Xy>& points,
    const Geometry& geometry,
    double buffer);

BufferZones classify(
    const PointBatch& points,
    const Geometry& geometry,
    double buffer);

BufferZone classify(double x, double y, const Geometry& geometry, double b);

} // namespace buffer
} // namespace tessera
