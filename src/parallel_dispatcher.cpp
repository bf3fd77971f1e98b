// src/parallel_dispatcher.cpp
#include "parallel_dispatcher.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <stdexcept> // For std::invalid_argument

namespace SnapFetch
{
    namespace Concurrency
    {

        namespace
        {
            // Shared between dispatch() and its tasks. Tasks may outlive a cancelled dispatch() call.
            struct DispatchState
            {
                std::mutex mtx;
                std::condition_variable done;
                size_t remaining = 0;
                std::exception_ptr failure;
                std::atomic<bool> aborted{false};

                void finish(std::exception_ptr error)
                {
                    {
                        std::lock_guard<std::mutex> lock(mtx);
                        if (error && !failure)
                        {
                            failure = error;
                            aborted.store(true);
                        }
                        --remaining;
                    }
                    done.notify_all();
                }
            };

            // Waits for every submitted task to finish. Returns false if the token is cancelled first.
            bool awaitTasks(DispatchState &state, const CancellationToken &token, std::chrono::milliseconds poll_interval)
            {
                std::unique_lock<std::mutex> lock(state.mtx);
                while (state.remaining > 0)
                {
                    if (token.isCancelled())
                    {
                        Logging::logger()->warn("-- dispatch() - interrupted with {} batches outstanding", state.remaining);
                        return false;
                    }
                    state.done.wait_for(lock, poll_interval);
                }
                return true;
            }
        }

        ParallelDispatcher::ParallelDispatcher(std::shared_ptr<ThreadPool> pool, std::chrono::milliseconds poll_interval)
            : pool_(std::move(pool)), poll_interval_(poll_interval)
        {
            if (!pool_)
            {
                throw std::invalid_argument("ParallelDispatcher requires a thread pool.");
            }
        }

        void ParallelDispatcher::dispatch(const std::vector<Model::Batch> &batches, const Work &work,
                                          const CancellationToken &token) const
        {
            auto logger = Logging::logger();
            if (batches.empty())
            {
                logger->debug("-- dispatch() - no batches");
                return;
            }

            auto state = std::make_shared<DispatchState>();
            state->remaining = batches.size();

            size_t submitted = 0;
            try
            {
                for (const Model::Batch &batch : batches)
                {
                    // Failures travel through state, not through the returned future.
                    pool_->enqueue([state, work, token, batch]()
                                   {
                                       if (token.isCancelled() || state->aborted.load())
                                       {
                                           state->finish(nullptr);
                                           return;
                                       }
                                       try
                                       {
                                           work(batch);
                                           state->finish(nullptr);
                                       }
                                       catch (...)
                                       {
                                           state->finish(std::current_exception());
                                       } });
                    ++submitted;
                }
            }
            catch (const std::exception &e)
            {
                // Batches already queued skip their work; those already running are awaited.
                {
                    std::lock_guard<std::mutex> lock(state->mtx);
                    state->aborted.store(true);
                    state->remaining -= batches.size() - submitted;
                }
                logger->error("-- dispatch() - submitted {} of {} batches: {}", submitted, batches.size(), e.what());
                if (!awaitTasks(*state, token, poll_interval_))
                {
                    return;
                }
                std::throw_with_nested(Errors::FatalError(std::string("Failed to submit batch: ") + e.what()));
            }
            logger->debug("-- dispatch() - submitted batches: {} threads: {}", batches.size(), pool_->size());

            if (!awaitTasks(*state, token, poll_interval_))
            {
                return;
            }

            std::exception_ptr failure;
            {
                std::lock_guard<std::mutex> lock(state->mtx);
                failure = state->failure;
            }

            if (!failure)
            {
                logger->debug("-- dispatch() - completed batches: {}", batches.size());
                return;
            }

            if (Errors::isIOFailure(failure))
            {
                logger->error("-- dispatch() - I/O failure: {}", Errors::describe(failure));
                std::rethrow_exception(failure);
            }

            logger->error("-- dispatch() - unexpected failure: {}", Errors::describe(failure));
            try
            {
                std::rethrow_exception(failure);
            }
            catch (...)
            {
                std::throw_with_nested(Errors::FatalError("Batch download failed: " + Errors::describe(failure)));
            }
        }

    } // namespace Concurrency
} // namespace SnapFetch
