#include "fetch_pool.hpp"

#include <exception>

namespace realtime
{

    FetchPool::FetchPool(std::string name, std::size_t workers, diag::DiagnosticManager& diag)
        : m_name(std::move(name)), m_diag(diag)
    {
        if (workers == 0)
            workers = 1;
        m_workers.reserve(workers);
        for (std::size_t i = 0; i < workers; ++i)
            m_workers.emplace_back(&FetchPool::workerFn, this);
    }

    FetchPool::~FetchPool()
    {
        stop();
    }

    FetchPool::SubmitResult FetchPool::submit(const std::string& key, Task task)
    {
        {
            std::lock_guard<std::mutex> lk(m_mtx);
            if (!m_running.load())
                return SubmitResult::Stopped;
            if (!m_queuedKeys.insert(key).second)
                return SubmitResult::Coalesced;
            m_tasks.emplace_back(key, std::move(task));
        }
        m_cv.notify_one();
        return SubmitResult::Queued;
    }

    void FetchPool::stop()
    {
        std::size_t discarded = 0;
        {
            std::lock_guard<std::mutex> lk(m_mtx);
            if (!m_running.exchange(false))
                return;
            discarded = m_tasks.size();
            m_tasks.clear();
            m_queuedKeys.clear();
        }
        m_cv.notify_all();
        for (auto& t : m_workers)
        {
            if (t.joinable())
                t.join();
        }
        m_idleCv.notify_all();
        if (discarded > 0)
            m_diag.log(diag::Severity::DEBUG, "FetchPool",
                       m_name + ": discarded " + std::to_string(discarded) + " queued fetches on stop");
    }

    bool FetchPool::waitIdle(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lk(m_mtx);
        return m_idleCv.wait_for(lk, timeout, [this]() { return m_tasks.empty() && m_active == 0; });
    }

    std::size_t FetchPool::pending() const
    {
        std::lock_guard<std::mutex> lk(m_mtx);
        return m_tasks.size();
    }

    bool FetchPool::isQueued(const std::string& key) const
    {
        std::lock_guard<std::mutex> lk(m_mtx);
        return m_queuedKeys.count(key) > 0;
    }

    void FetchPool::workerFn()
    {
        for (;;)
        {
            std::pair<std::string, Task> entry;
            {
                std::unique_lock<std::mutex> lk(m_mtx);
                m_cv.wait(lk, [this]() { return !m_running.load() || !m_tasks.empty(); });
                if (!m_running.load())
                    return;
                entry = std::move(m_tasks.front());
                m_tasks.pop_front();
                m_queuedKeys.erase(entry.first);
                ++m_active;
            }

            try
            {
                entry.second();
            }
            catch (const std::exception& ex)
            {
                m_diag.log(diag::Severity::ERROR, "FetchPool",
                           m_name + ": fetch for " + entry.first + " failed: " + ex.what());
            }

            {
                std::lock_guard<std::mutex> lk(m_mtx);
                --m_active;
            }
            m_idleCv.notify_all();
        }
    }

} // namespace realtime
