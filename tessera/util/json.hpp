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

#include <nlohmann/json.hpp>

namespace tessera
{

using json = nlohmann::json;

// Recursively merge b into a, values from b taking precedence.  Null values
// in b do not overwrite.
inline json merge(json a, const json& b)
{
    if (b.is_null()) return a;
    if (!a.is_object() || !b.is_object()) return b;

    for (auto it = b.begin(); it != b.end(); ++it)
    {
        if (it.value().is_null()) continue;

        if (a.count(it.key()) && a[it.key()].is_object())
        {
            a[it.key()] = merge(a[it.key()], it.value());
        }
        else a[it.key()] = it.value();
    }

    return a;
}

inline int getIndent(bool pretty) { return pretty ? 2 : -1; }

} // namespace tessera
