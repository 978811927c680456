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

#include <stdexcept>
#include <string>

namespace tessera
{

// Malformed request input: mismatched lengths, negative buffers, bad
// geometries.  Thrown before any work is scheduled.
class ValidationError : public std::runtime_error
{
public:
    ValidationError(std::string what) : std::runtime_error(what) { }
};

// The destination of a write already holds point cloud files.
class ConflictError : public std::runtime_error
{
public:
    ConflictError(std::string what) : std::runtime_error(what) { }
};

// Malformed catalog index: duplicate paths or degenerate bounds.
class IndexError : public std::runtime_error
{
public:
    IndexError(std::string what) : std::runtime_error(what) { }
};

} // namespace tessera
