/******************************************************************************
* Copyright (c) 2026, Tessera Contributors
*
* Tessera -- Point cloud catalog tiling
*
* Tessera is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <tessera/util/config.hpp>

#include <tessera/builder/heuristics.hpp>
#include <tessera/types/exceptions.hpp>

namespace tessera
{
namespace config
{

namespace
{

std::vector<double> getNumbers(const json& j, const std::string key)
{
    std::vector<double> v;
    if (!j.count(key) || j.at(key).is_null()) return v;

    const json& value(j.at(key));
    try
    {
        if (value.is_array()) return value.get<std::vector<double>>();
        v.push_back(value.get<double>());
    }
    catch (const json::exception& e)
    {
        throw ValidationError("Invalid '" + key + "': " + e.what());
    }
    return v;
}

} // unnamed namespace

std::string getInput(const json& j)
{
    if (!j.count("input") || !j.at("input").is_string())
    {
        throw ValidationError("Missing input catalog");
    }
    return j.at("input").get<std::string>();
}

std::string getOutput(const json& j)
{
    if (!j.count("output") || !j.at("output").is_string())
    {
        throw ValidationError("Missing output directory");
    }
    return j.at("output").get<std::string>();
}

unsigned getThreads(const json& j)
{
    const int threads(j.value("threads", int(heuristics::defaultThreads)));
    if (threads < 1) throw ValidationError("Thread count must be positive");
    return threads;
}

Clauses getFilter(const json& j)
{
    return parseClauses(j.value("filter", json()));
}

DimList getDims(const json& j)
{
    const json dims(j.value("dims", json()));
    if (dims.is_null()) return DimList();
    if (dims.is_string()) return DimList { dims.get<std::string>() };

    try
    {
        return dims.get<DimList>();
    }
    catch (const json::exception& e)
    {
        throw ValidationError(std::string("Invalid 'dims': ") + e.what());
    }
}

json getReader(const json& j)
{
    const json reader(j.value("reader", json::object()));
    if (!reader.is_object())
    {
        throw ValidationError("Reader options must be an object");
    }
    return reader;
}

Options getOptions(const json& j)
{
    return Options(getThreads(j), getVerbose(j));
}

RetileOptions getRetileOptions(const json& j)
{
    RetileOptions options;
    options.buffer = getBuffer(j);
    options.tilingSize = getTilingSize(j);
    options.byFile = getByFile(j);
    options.prefix = getPrefix(j);
    options.extension = getExtension(j);
    return options;
}

RoiRequest getRoiRequest(const json& j)
{
    RoiRequest request;
    request.x = getNumbers(j, "x");
    request.y = getNumbers(j, "y");
    request.r = getNumbers(j, "r");
    request.r2 = getNumbers(j, "r2");

    const std::vector<double> buffer(getNumbers(j, "buffer"));
    if (!buffer.empty()) request.buffer = buffer;

    if (j.count("names"))
    {
        request.names = j.at("names").get<std::vector<std::string>>();
    }

    request.clauses = getFilter(j);
    request.dims = getDims(j);
    request.extra = getReader(j);
    return request;
}

} // namespace config
} // namespace tessera
