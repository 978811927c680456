/******************************************************************************
* Copyright (c) 2026, Tessera Contributors
*
* Tessera -- Point cloud catalog tiling
*
* Tessera is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <tessera/util/io.hpp>

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace tessera
{

namespace
{

void backoff(const int tried)
{
    std::this_thread::sleep_for(std::chrono::milliseconds(tried * 50));
}

} // unnamed namespace

bool putWithRetry(
    const arbiter::Endpoint& ep,
    const std::string& path,
    const std::string& s,
    const int tries)
{
    for (int i(0); i < tries; ++i)
    {
        try
        {
            ep.put(path, s);
            return true;
        }
        catch (const std::exception& e)
        {
            std::cout << "Failed to write " << path << ": " << e.what() <<
                std::endl;
            backoff(i + 1);
        }
    }
    return false;
}

void ensurePut(
    const arbiter::Endpoint& ep,
    const std::string& path,
    const std::string& s,
    const int tries)
{
    if (!putWithRetry(ep, path, s, tries))
    {
        throw std::runtime_error("Failed to write " + path);
    }
}

optional<std::string> getWithRetry(
    const arbiter::Endpoint& ep,
    const std::string& path,
    const int tries)
{
    for (int i(0); i < tries; ++i)
    {
        if (const auto data = ep.tryGet(path)) return std::string(*data);
        backoff(i + 1);
    }
    return { };
}

} // namespace tessera
