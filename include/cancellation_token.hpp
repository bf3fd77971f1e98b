// include/cancellation_token.hpp
#pragma once

#include <atomic>
#include <memory> // For std::shared_ptr

namespace SnapFetch {
namespace Concurrency {

// Cooperative cancellation flag. Copies share state, so a token captured by
// queued tasks sees a cancel() issued through any other copy.
class CancellationToken {
public:
    CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { cancelled_->store(true); }
    bool isCancelled() const { return cancelled_->load(); }

    // Clear the flag once the caller has dealt with the interruption.
    void reset() { cancelled_->store(false); }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace Concurrency
} // namespace SnapFetch
