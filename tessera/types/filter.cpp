/******************************************************************************
* Copyright (c) 2026, Tessera Contributors
*
* Tessera -- Point cloud catalog tiling
*
* Tessera is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <tessera/types/filter.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <sstream>
#include <utility>

#include <tessera/types/exceptions.hpp>

namespace tessera
{

namespace
{

// Two-character operators first so that ">=" is not read as ">".
const std::array<std::pair<const char*, Comparison>, 6> operators { {
    { "<=", Comparison::LessEqual },
    { ">=", Comparison::GreaterEqual },
    { "==", Comparison::Equal },
    { "!=", Comparison::NotEqual },
    { "<", Comparison::Less },
    { ">", Comparison::Greater }
} };

std::string trim(std::string s)
{
    const auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

} // unnamed namespace

Clause parseClause(const std::string s)
{
    for (const auto& p : operators)
    {
        const auto pos = s.find(p.first);
        if (pos == std::string::npos) continue;

        Clause clause;
        clause.dimension = trim(s.substr(0, pos));
        clause.op = p.second;

        const std::string value(trim(s.substr(pos + std::strlen(p.first))));
        if (clause.dimension.empty() || value.empty())
        {
            throw ValidationError("Invalid filter clause: " + s);
        }

        try
        {
            std::size_t used(0);
            clause.value = std::stod(value, &used);
            if (used != value.size()) throw std::invalid_argument(value);
        }
        catch (const std::exception&)
        {
            throw ValidationError("Invalid filter value: " + s);
        }

        return clause;
    }

    throw ValidationError("Invalid filter clause: " + s);
}

Clauses parseClauses(const json& j)
{
    Clauses clauses;
    if (j.is_null()) return clauses;
    if (j.is_string()) return Clauses { parseClause(j.get<std::string>()) };

    for (const json& c : j)
    {
        clauses.push_back(parseClause(c.get<std::string>()));
    }
    return clauses;
}

std::string toString(const Comparison op)
{
    for (const auto& p : operators)
    {
        if (p.second == op) return p.first;
    }
    throw std::runtime_error("Invalid comparison");
}

std::string toString(const Clause& c)
{
    std::ostringstream ss;
    ss << c.dimension << toString(c.op) << c.value;
    return ss.str();
}

} // namespace tessera
