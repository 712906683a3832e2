/* This file is part of PinForge.
 *
 * PinForge is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * PinForge is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with PinForge.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "ThreadPool.h"
#include "Log.h"
#ifdef __linux__
#include <pthread.h>
#endif
#include <algorithm>

ThreadPool::ThreadPool(size_t threads)
{
    threads = std::max<size_t>(threads, 1);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { workerLoop(); });
    }
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

void ThreadPool::workerLoop()
{
#if defined(__linux__)
    pthread_setname_np(pthread_self(), "pinforge:pool");
#endif
    for (;;) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty())
                return;

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        // packaged_task stores exceptions in its future, so this only
        // catches failures of the wrapper itself
        try {
            task();
        }
        catch (const std::exception& e) {
            LOG_ERROR("ThreadPool", "task threw: " << e.what());
        }
    }
}

size_t ThreadPool::defaultSize()
{
    unsigned hw = std::thread::hardware_concurrency();
    return hw ? std::min(3u, hw) : 3u;
}

void ThreadPool::shutdown()
{
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        stop_ = true;
    }
    condition_.notify_all();
    for (std::thread& worker : workers_)
        if (worker.joinable())
            worker.join();
    workers_.clear();
}
