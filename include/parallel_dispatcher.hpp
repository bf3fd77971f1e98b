// include/parallel_dispatcher.hpp
#pragma once

#include <chrono>
#include <functional> // For std::function
#include <memory>
#include <vector>

#include "backup_model.hpp"
#include "cancellation_token.hpp"
#include "thread_pool.hpp"

namespace SnapFetch
{
    namespace Concurrency
    {

        // Runs one task per batch on a shared worker pool and joins them.
        //
        // Outcome of dispatch():
        //  - every batch's work completed: returns normally;
        //  - a task threw an I/O failure (Errors::isIOFailure): batches not yet started are
        //    skipped, running ones are awaited, then the first such failure is rethrown as is;
        //  - a task threw anything else: same draining, then Errors::FatalError is thrown with
        //    the original exception nested;
        //  - the pool refused a batch (e.g. it was shut down by another owner): queued batches
        //    are skipped, running ones are awaited, then Errors::FatalError is thrown with the
        //    pool's exception nested;
        //  - the token was cancelled: returns promptly without throwing. The token is left
        //    cancelled so the caller can see the interruption.
        class ParallelDispatcher
        {
        public:
            using Work = std::function<void(const Model::Batch &)>;

            static constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL{50};

            explicit ParallelDispatcher(std::shared_ptr<ThreadPool> pool,
                                        std::chrono::milliseconds poll_interval = DEFAULT_POLL_INTERVAL);

            void dispatch(const std::vector<Model::Batch> &batches, const Work &work, const CancellationToken &token) const;

            ThreadPool &pool() const { return *pool_; }

        private:
            std::shared_ptr<ThreadPool> pool_;
            std::chrono::milliseconds poll_interval_;
        };

    } // namespace Concurrency
} // namespace SnapFetch
