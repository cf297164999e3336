#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <utility>
#include <vector>

#include "diagnostic_manager.hpp"

namespace realtime
{

    /**
     * Fixed set of worker threads draining a queue of keyed analytics fetches.
     *
     * At most one task per key waits in the queue; a submit for a key that is already queued
     * is coalesced into it. A key becomes submittable again as soon as a worker picks its task
     * up, so the queue is bounded by the number of distinct keys (active topics) rather than by
     * a fixed slot count. Workers start on construction. Tasks still queued at stop() are
     * discarded.
     */
    class FetchPool
    {
      public:
        using Task = std::function<void()>;

        enum class SubmitResult
        {
            Queued,
            Coalesced,
            Stopped
        };

        FetchPool(std::string name, std::size_t workers, diag::DiagnosticManager& diag);
        ~FetchPool();

        FetchPool(const FetchPool&)            = delete;
        FetchPool& operator=(const FetchPool&) = delete;

        SubmitResult submit(const std::string& key, Task task);
        void         stop();

        // Blocks until nothing is queued or running, or the timeout expires.
        bool waitIdle(std::chrono::milliseconds timeout);

        std::size_t pending() const;
        bool        isQueued(const std::string& key) const;
        std::size_t workerCount() const { return m_workers.size(); }

      private:
        void workerFn();

        std::string              m_name;
        diag::DiagnosticManager& m_diag;

        mutable std::mutex                       m_mtx;
        std::condition_variable                  m_cv;
        std::condition_variable                  m_idleCv;
        std::deque<std::pair<std::string, Task>> m_tasks;
        std::unordered_set<std::string>          m_queuedKeys;
        std::size_t                              m_active{0};
        std::atomic<bool>                        m_running{true};
        std::vector<std::thread>                 m_workers;
    };

} // namespace realtime
