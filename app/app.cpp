/******************************************************************************
* Copyright (c) 2026, Tessera Contributors
*
* Tessera -- Point cloud catalog tiling
*
* Tessera is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include "tessera.hpp"

#include <cmath>
#include <iostream>

#include <arbiter/arbiter.hpp>

#include <tessera/util/config.hpp>

namespace tessera
{
namespace app
{

void App::addInput(const std::string description)
{
    m_ap.add("--input", "-i", description, [this](json j)
    {
        if (!j.is_string()) throw std::runtime_error("Invalid input");
        m_json["input"] = j;
    });
}

void App::addOutput(const std::string description)
{
    m_ap.add("--output", "-o", description, [this](json j)
    {
        if (!j.is_string()) throw std::runtime_error("Invalid output");
        m_json["output"] = j;
    });
}

void App::addConfig()
{
    m_ap.add(
        "--config",
        "-c",
        "A configuration file.  Subsequent options override configuration "
        "file parameters, so this should typically be specified first.",
        [this](json j) { m_json["config"] = j; });
}

void App::addThreads()
{
    m_ap.add(
        "--threads",
        "-t",
        "The number of threads.\n\t\tExample: --threads 12",
        [this](json j) { m_json["threads"] = int(extractNumber(j)); });
}

void App::addVerbose()
{
    m_ap.add(
        "--verbose",
        "-v",
        "Print per-unit progress information.",
        [this](json j) { checkEmpty(j); m_json["verbose"] = true; });
}

void App::addProgress()
{
    m_ap.add(
        "--progress",
        "Display the percentage of completed units.",
        [this](json j) { checkEmpty(j); m_json["progress"] = true; });
}

void App::addRebuild()
{
    m_ap.add(
        "--rebuild",
        "Re-analyze every input file, ignoring the existing catalog index.",
        [this](json j) { checkEmpty(j); m_json["rebuild"] = true; });
}

void App::addFilter()
{
    m_ap.add(
        "--filter",
        "Attribute restrictions applied while reading.\n"
        "\t\tExample: --filter \"Z>=0\" \"Classification!=7\"",
        [this](json j) { m_json["filter"] = extractStrings(j); });
}

json App::extractNumbers(json j) const
{
    json out = json::array();
    for (const json& s : extractStrings(j))
    {
        out.push_back(json::parse(s.get<std::string>()).get<double>());
    }
    return out;
}

json App::extractStrings(json j) const
{
    if (j.is_null()) throw std::runtime_error("Expected a value");
    if (j.is_string()) return json::array({ j });
    return j;
}

Options App::getOptions() const
{
    Options options(config::getOptions(m_json));

    if (config::getProgress(m_json))
    {
        options.progress = [](const uint64_t current, const uint64_t total)
        {
            const double progress(double(current) / total);
            std::cout << "\rProgress: " << std::round(progress * 100) <<
                "% - " << current << "/" << total << std::flush;
            if (current == total) std::cout << std::endl;
        };
    }

    return options;
}

void App::mergeConfigFile()
{
    if (!m_json.count("config")) return;

    const std::string path(m_json.at("config").get<std::string>());
    m_json.erase("config");

    arbiter::Arbiter a;
    m_json = merge(json::parse(a.get(path)), m_json);
}

} // namespace app
} // namespace tessera
