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

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <tessera/builder/heuristics.hpp>
#include <tessera/types/exceptions.hpp>
#include <tessera/types/options.hpp>
#include <tessera/util/optional.hpp>
#include <tessera/util/pool.hpp>

namespace tessera
{

// Outcome of one work unit.  A unit that threw carries its error message and
// no value.
template <typename T>
struct UnitResult
{
    bool ok() const { return static_cast<bool>(value); }

    optional<T> value;
    std::string error;
};

template <typename T>
using ResultMap = std::map<std::string, UnitResult<T>>;

template <typename T>
using OrderedResults = std::vector<std::pair<std::string, UnitResult<T>>>;

// Runs a batch of named work units, sequentially or over a bounded pool, and
// collects their results by name.  A failing unit never aborts its siblings.
class Dispatcher
{
public:
    explicit Dispatcher(Options options) : m_options(options) { }

    template <typename Unit, typename Worker>
    auto run(const std::vector<Unit>& units, Worker worker)
        -> ResultMap<typename std::decay<
            decltype(worker(std::declval<const Unit&>()))>::type>;

    // Units completed by the latest run, successful or not.
    uint64_t completed() const { return m_counter; }

private:
    void tick(uint64_t total);

    const Options m_options;

    std::atomic_uint64_t m_counter { 0 };

    std::mutex m_progressMutex;
    uint64_t m_reported = 0;
};

// Projects a result map onto the requested name order.  Names without a
// result are skipped.
template <typename T>
OrderedResults<T> ordered(
    const ResultMap<T>& results,
    const std::vector<std::string>& names)
{
    OrderedResults<T> out;
    out.reserve(names.size());

    for (const std::string& name : names)
    {
        const auto it = results.find(name);
        if (it != results.end()) out.emplace_back(name, it->second);
    }

    return out;
}

template <typename Unit, typename Worker>
auto Dispatcher::run(const std::vector<Unit>& units, Worker worker)
    -> ResultMap<typename std::decay<
        decltype(worker(std::declval<const Unit&>()))>::type>
{
    using Result = typename std::decay<
        decltype(worker(std::declval<const Unit&>()))>::type;

    std::set<std::string> names;
    for (const Unit& unit : units)
    {
        if (!names.insert(unit.name).second)
        {
            throw ValidationError("Duplicate work unit name: " + unit.name);
        }
    }

    m_counter = 0;
    m_reported = 0;

    const uint64_t total(units.size());
    const bool verbose(m_options.verbose);

    ResultMap<Result> results;
    std::mutex mutex;

    const auto runOne = [&](const Unit& unit)
    {
        UnitResult<Result> result;

        try
        {
            result.value = worker(unit);
        }
        catch (const std::exception& e)
        {
            result.error = e.what();
        }
        catch (...)
        {
            result.error = "Unknown error in " + unit.name;
        }

        if (verbose && !result.ok())
        {
            std::cout << "\tFailed " << unit.name << ": " << result.error <<
                std::endl;
        }

        {
            std::lock_guard<std::mutex> lock(mutex);
            results[unit.name] = std::move(result);
        }

        tick(total);
    };

    const std::size_t threads(
        std::min<std::size_t>(m_options.threads, units.size()));

    if (threads <= 1)
    {
        for (const Unit& unit : units) runOne(unit);
        return results;
    }

    Pool pool(threads, threads * heuristics::queuedUnitsPerThread, verbose);

    for (std::size_t i(0); i < units.size(); ++i)
    {
        const Unit& unit(units[i]);
        if (verbose) std::cout << "Adding " << i << " - " << unit.name <<
            std::endl;

        pool.add([&runOne, &unit]() { runOne(unit); });
    }

    if (verbose) std::cout << "Joining" << std::endl;

    pool.join();

    return results;
}

inline void Dispatcher::tick(const uint64_t total)
{
    const uint64_t current(++m_counter);
    if (!m_options.progress) return;

    std::lock_guard<std::mutex> lock(m_progressMutex);
    if (current > m_reported)
    {
        m_reported = current;
        m_options.progress(current, total);
    }
}

} // namespace tessera
