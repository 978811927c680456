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
#include <vector>

#include <tessera/types/geometry.hpp>
#include <tessera/types/point-batch.hpp>
#include <tessera/util/json.hpp>

namespace tessera
{

enum class Comparison
{
    Less,
    LessEqual,
    Greater,
    GreaterEqual,
    Equal,
    NotEqual
};

// A single attribute restriction, e.g. Z >= 0 or Classification != 7.
struct Clause
{
    std::string dimension;
    Comparison op = Comparison::Equal;
    double value = 0;
};

using Clauses = std::vector<Clause>;

// Typed spatial and attribute predicate handed to a point reader, with the
// dimensions to load.  Empty dims loads every dimension of the sources.
struct Filter
{
    Geometry shape;
    Clauses clauses;
    DimList dims;
};

// Parses a clause such as "Z>=0" or "Classification!=7".
Clause parseClause(std::string s);
Clauses parseClauses(const json& j);

std::string toString(Comparison op);
std::string toString(const Clause& c);

} // namespace tessera
