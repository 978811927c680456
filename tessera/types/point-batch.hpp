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

namespace tessera
{

// Codes are positional: rectangle corners are never combined.
enum class BufferZone : uint8_t
{
    None = 0,
    CircleEdge = 1,
    Bottom = 1,
    Left = 2,
    Top = 3,
    Right = 4
};

using BufferZones = std::vector<BufferZone>;

struct Xy
{
    double x = 0;
    double y = 0;
};

using DimList = std::vector<std::string>;

// X, Y and Z followed by the other requested dimensions, without repeats.
DimList selectDims(const DimList& requested);

// Points of one work unit, stored row-major over a list of dimensions.  The
// first three dimensions are always X, Y and Z.
class PointBatch
{
public:
    PointBatch() : m_dims { "X", "Y", "Z" } { }
    explicit PointBatch(DimList dims);

    const DimList& dims() const { return m_dims; }
    std::size_t numDims() const { return m_dims.size(); }
    std::size_t size() const { return m_values.size() / m_dims.size(); }
    bool empty() const { return m_values.empty(); }

    void reserve(std::size_t n) { m_values.reserve(n * m_dims.size()); }

    // Appends one point; values must follow dims().
    void push(const std::vector<double>& values);
    void push(double x, double y, double z);

    double x(std::size_t i) const { return m_values[i * numDims()]; }
    double y(std::size_t i) const { return m_values[i * numDims() + 1]; }
    double z(std::size_t i) const { return m_values[i * numDims() + 2]; }
    Xy xy(std::size_t i) const { return Xy { x(i), y(i) }; }

    double get(std::size_t i, std::size_t dim) const
    {
        return m_values[i * numDims() + dim];
    }
    double get(std::size_t i, const std::string& dim) const;

    const std::vector<double>& values() const { return m_values; }

    // Parallel to the points, present only for buffered units.
    BufferZones buffer;

private:
    DimList m_dims;
    std::vector<double> m_values;
};

} // namespace tessera
