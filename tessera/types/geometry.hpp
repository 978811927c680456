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

#include <tessera/types/bounds.hpp>

namespace tessera
{

enum class Shape
{
    Circle,
    Rectangle
};

// A query window: a disc of radius rx, or a rectangle of half sizes rx by ry,
// centred on (x, y).
struct Geometry
{
    static Geometry circle(double x, double y, double r)
    {
        return Geometry { Shape::Circle, x, y, r, r };
    }

    static Geometry rectangle(double x, double y, double hw, double hh)
    {
        return Geometry { Shape::Rectangle, x, y, hw, hh };
    }

    static Geometry rectangle(const Bounds& b)
    {
        return rectangle(b.midX(), b.midY(), b.width() / 2, b.height() / 2);
    }

    bool isCircle() const { return shape == Shape::Circle; }
    double radius() const { return rx; }

    Bounds bounds() const { return Bounds(x - rx, x + rx, y - ry, y + ry); }

    // Same centre, every radius extended by d.
    Geometry grow(double d) const
    {
        return Geometry { shape, x, y, rx + d, ry + d };
    }

    // True if the interiors of this geometry and the box intersect.
    bool overlaps(const Bounds& b) const;

    Shape shape = Shape::Circle;
    double x = 0;
    double y = 0;
    double rx = 0;
    double ry = 0;
};

std::string toString(const Geometry& g);

} // namespace tessera
