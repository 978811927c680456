/******************************************************************************
* Copyright (c) 2026, Tessera Contributors
*
* Tessera -- Point cloud catalog tiling
*
* Tessera is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <tessera/planner/geometry-planner.hpp>

#include <set>

#include <tessera/types/exceptions.hpp>

namespace tessera
{
namespace planner
{

namespace
{

void checkLength(
    const std::vector<double>& v,
    const std::size_t n,
    const std::string name)
{
    if (v.size() > 1 && v.size() != n)
    {
        throw ValidationError(
            "x is not same length as " + name + " (" +
            std::to_string(n) + " != " + std::to_string(v.size()) + ")");
    }
}

double pick(const std::vector<double>& v, const std::size_t i)
{
    return v.size() == 1 ? v.front() : v.at(i);
}

} // unnamed namespace

void validate(const RoiRequest& req)
{
    const std::size_t n(req.x.size());

    if (req.x.size() != req.y.size())
    {
        throw ValidationError(
            "x is not same length as y (" +
            std::to_string(req.x.size()) + " != " +
            std::to_string(req.y.size()) + ")");
    }

    if (req.r.empty()) throw ValidationError("No ROI radius supplied");
    if (req.buffer.empty()) throw ValidationError("No buffer supplied");

    checkLength(req.r, n, "r");
    checkLength(req.r2, n, "r2");
    checkLength(req.buffer, n, "buffer");

    for (const double b : req.buffer)
    {
        if (b < 0)
        {
            throw ValidationError("Buffer size must be a positive value");
        }
    }

    for (const double r : req.r)
    {
        if (!(r > 0)) throw ValidationError("ROI radius must be positive");
    }
    for (const double r : req.r2)
    {
        if (!(r > 0)) throw ValidationError("ROI radius must be positive");
    }

    for (const std::string& d : req.dims)
    {
        if (d.empty()) throw ValidationError("Empty dimension name");
    }

    if (!req.names.empty())
    {
        if (req.names.size() != n)
        {
            throw ValidationError("x is not same length as names");
        }

        const std::set<std::string> unique(req.names.begin(), req.names.end());
        if (unique.size() != req.names.size())
        {
            throw ValidationError("ROI names must be unique");
        }
    }
}

std::vector<std::string> getNames(const RoiRequest& req)
{
    if (!req.names.empty()) return req.names;

    std::vector<std::string> names;
    for (std::size_t i(0); i < req.x.size(); ++i)
    {
        names.push_back("ROI" + std::to_string(i + 1));
    }
    return names;
}

WorkUnits plan(const TileIndex& index, const RoiRequest& req)
{
    validate(req);

    const std::vector<std::string> names(getNames(req));
    const bool rectangle(!req.r2.empty());

    WorkUnits units;

    for (std::size_t i(0); i < req.x.size(); ++i)
    {
        const double buffer(pick(req.buffer, i));
        const Geometry roi(rectangle
            ? Geometry::rectangle(
                req.x[i], req.y[i], pick(req.r, i), pick(req.r2, i))
            : Geometry::circle(req.x[i], req.y[i], pick(req.r, i)));

        WorkUnit unit;
        unit.name = names[i];
        unit.geometry = roi.grow(buffer);
        unit.buffer = buffer;
        unit.tiles = index.intersecting(unit.geometry);
        unit.clauses = req.clauses;
        unit.dims = req.dims;
        unit.extra = req.extra;

        if (!unit.tiles.empty()) units.push_back(std::move(unit));
    }

    return units;
}

} // namespace planner
} // namespace tessera
