/******************************************************************************
* Copyright (c) 2026, Tessera Contributors
*
* Tessera -- Point cloud catalog tiling
*
* Tessera is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <tessera/types/point-batch.hpp>

#include <algorithm>
#include <stdexcept>

namespace tessera
{

PointBatch::PointBatch(DimList dims)
    : m_dims(dims)
{
    if (m_dims.size() < 3 ||
        m_dims[0] != "X" || m_dims[1] != "Y" || m_dims[2] != "Z")
    {
        throw std::runtime_error("Point dimensions must start with X, Y, Z");
    }
}

void PointBatch::push(const std::vector<double>& values)
{
    if (values.size() != numDims())
    {
        throw std::runtime_error("Point has the wrong number of dimensions");
    }
    m_values.insert(m_values.end(), values.begin(), values.end());
}

void PointBatch::push(const double x, const double y, const double z)
{
    m_values.push_back(x);
    m_values.push_back(y);
    m_values.push_back(z);
    m_values.resize(m_values.size() + numDims() - 3, 0.0);
}

DimList selectDims(const DimList& requested)
{
    DimList dims { "X", "Y", "Z" };
    for (const std::string& d : requested)
    {
        if (std::find(dims.begin(), dims.end(), d) == dims.end())
        {
            dims.push_back(d);
        }
    }
    return dims;
}

double PointBatch::get(const std::size_t i, const std::string& dim) const
{
    const auto it = std::find(m_dims.begin(), m_dims.end(), dim);
    if (it == m_dims.end()) throw std::runtime_error("No dimension: " + dim);
    return get(i, std::distance(m_dims.begin(), it));
}

} // namespace tessera
