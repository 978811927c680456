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
#include <stdexcept>
#include <string>
#include <vector>

#include "arg-parser.hpp"

#include <tessera/types/options.hpp>
#include <tessera/util/json.hpp>

namespace tessera
{
namespace app
{

// A command-line subcommand.  Arguments are folded into a JSON config which
// run() hands to the library.
class App
{
public:
    App() : m_json(json::object()) { }
    virtual ~App() { }

    void go(Args args)
    {
        addArgs();
        if (!m_ap.handle(args)) return;
        mergeConfigFile();
        run();
    }

protected:
    virtual void addArgs() = 0;
    virtual void run() = 0;

    json m_json;
    ArgParser m_ap;

    void addInput(std::string description);
    void addOutput(std::string description);
    void addConfig();
    void addThreads();
    void addVerbose();
    void addProgress();
    void addRebuild();
    void addFilter();

    void checkEmpty(json j) const
    {
        if (!j.is_null()) throw std::runtime_error("Unexpected value for flag");
    }

    double extractNumber(json j) const
    {
        if (!j.is_string()) throw std::runtime_error("Expected one value");
        return json::parse(j.get<std::string>()).get<double>();
    }

    json extractNumbers(json j) const;
    json extractStrings(json j) const;

    // Execution options from the config, with a console progress sink if
    // progress display was requested.
    Options getOptions() const;

private:
    void mergeConfigFile();
};

} // namespace app
} // namespace tessera
