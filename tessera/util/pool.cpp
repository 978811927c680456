/******************************************************************************
* Copyright (c) 2026, Tessera Contributors
*
* Tessera -- Point cloud catalog tiling
*
* Tessera is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <tessera/util/pool.hpp>

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace tessera
{

Pool::Pool(
    const std::size_t threads,
    const std::size_t queueSize,
    const bool verbose)
    : m_verbose(verbose)
    , m_queueSize(std::max<std::size_t>(queueSize, 1))
{
    const std::size_t n(std::max<std::size_t>(threads, 1));
    for (std::size_t i(0); i < n; ++i)
    {
        m_threads.emplace_back([this]() { work(); });
    }
}

Pool::~Pool()
{
    join();
}

void Pool::join()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_joined) return;
        m_stop = true;
        m_joined = true;
    }

    m_consumeCv.notify_all();
    for (auto& t : m_threads) t.join();
}

void Pool::add(std::function<void()> task)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_stop) throw std::runtime_error("Attempted to add to a joined pool");

    m_produceCv.wait(lock, [this]() { return m_tasks.size() < m_queueSize; });
    m_tasks.push(std::move(task));

    lock.unlock();
    m_consumeCv.notify_one();
}

std::vector<std::string> Pool::errors() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_errors;
}

void Pool::work()
{
    while (true)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_consumeCv.wait(lock, [this]() { return m_stop || !m_tasks.empty(); });

        if (m_tasks.empty()) return;

        std::function<void()> task(std::move(m_tasks.front()));
        m_tasks.pop();

        lock.unlock();
        m_produceCv.notify_one();

        std::string error;

        try
        {
            task();
        }
        catch (const std::exception& e)
        {
            error = e.what();
        }
        catch (...)
        {
            error = "Unknown error";
        }

        if (!error.empty())
        {
            if (m_verbose)
            {
                std::cout << "Exception in pool task: " << error << std::endl;
            }

            lock.lock();
            m_errors.push_back(error);
        }
    }
}

} // namespace tessera
