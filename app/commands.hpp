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

#include "tessera.hpp"

namespace tessera
{
namespace app
{

class Query : public App
{
private:
    virtual void addArgs() override;
    virtual void run() override;
};

class Retile : public App
{
private:
    virtual void addArgs() override;
    virtual void run() override;
};

} // namespace app
} // namespace tessera
