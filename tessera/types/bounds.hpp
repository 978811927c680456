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

#include <algorithm>
#include <limits>
#include <ostream>

#include <tessera/util/json.hpp>

namespace tessera
{

// Planar axis-aligned extent.  Overlap is strict: boxes that only share an
// edge or a corner do not overlap.
class Bounds
{
public:
    Bounds() = default;
    Bounds(double xmin, double xmax, double ymin, double ymax)
        : m_xmin(xmin)
        , m_xmax(xmax)
        , m_ymin(ymin)
        , m_ymax(ymax)
    { }

    static Bounds expander()
    {
        const double big(std::numeric_limits<double>::max());
        return Bounds(big, -big, big, -big);
    }

    double xmin() const { return m_xmin; }
    double xmax() const { return m_xmax; }
    double ymin() const { return m_ymin; }
    double ymax() const { return m_ymax; }

    double width() const { return m_xmax - m_xmin; }
    double height() const { return m_ymax - m_ymin; }
    double midX() const { return m_xmin + width() / 2.0; }
    double midY() const { return m_ymin + height() / 2.0; }

    bool empty() const { return m_xmin > m_xmax || m_ymin > m_ymax; }
    bool degenerate() const { return m_xmin >= m_xmax || m_ymin >= m_ymax; }

    bool overlaps(const Bounds& other) const
    {
        return
            m_xmin < other.m_xmax && m_xmax > other.m_xmin &&
            m_ymin < other.m_ymax && m_ymax > other.m_ymin;
    }

    void grow(const Bounds& other)
    {
        m_xmin = std::min(m_xmin, other.m_xmin);
        m_xmax = std::max(m_xmax, other.m_xmax);
        m_ymin = std::min(m_ymin, other.m_ymin);
        m_ymax = std::max(m_ymax, other.m_ymax);
    }

    Bounds growBy(double d) const
    {
        return Bounds(m_xmin - d, m_xmax + d, m_ymin - d, m_ymax + d);
    }

private:
    double m_xmin = 0;
    double m_xmax = 0;
    double m_ymin = 0;
    double m_ymax = 0;
};

inline bool operator==(const Bounds& a, const Bounds& b)
{
    return
        a.xmin() == b.xmin() && a.xmax() == b.xmax() &&
        a.ymin() == b.ymin() && a.ymax() == b.ymax();
}

inline bool operator!=(const Bounds& a, const Bounds& b) { return !(a == b); }

// Serialized as [xmin, ymin, xmax, ymax], matching PDAL's 2D bounds order.
inline void to_json(json& j, const Bounds& b)
{
    j = json::array({ b.xmin(), b.ymin(), b.xmax(), b.ymax() });
}

inline void from_json(const json& j, Bounds& b)
{
    b = Bounds(
        j.at(0).get<double>(),
        j.at(2).get<double>(),
        j.at(1).get<double>(),
        j.at(3).get<double>());
}

std::ostream& operator<<(std::ostream& os, const Bounds& b);

} // namespace tessera
