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

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace tessera
{

// Fixed-size thread pool with a bounded task queue.  add() blocks while the
// queue is full.  Exceptions escaping a task are logged and recorded, never
// rethrown on the worker thread.
class Pool
{
public:
    Pool(std::size_t threads, std::size_t queueSize = 1, bool verbose = true);
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;

    // Blocks until all queued tasks have run, then stops the workers.  The
    // pool may not be used afterward.
    void join();

    void add(std::function<void()> task);

    std::size_t size() const { return m_threads.size(); }
    std::vector<std::string> errors() const;

private:
    void work();

    const bool m_verbose;
    const std::size_t m_queueSize;

    std::vector<std::thread> m_threads;
    std::queue<std::function<void()>> m_tasks;
    std::vector<std::string> m_errors;

    bool m_stop = false;
    bool m_joined = false;

    mutable std::mutex m_mutex;
    std::condition_variable m_produceCv;
    std::condition_variable m_consumeCv;
};

} // namespace tessera
