#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace cpan::client
{

    // Cooperative stop flag shared between the signal handler and transfer workers.
    class CancellationSource
    {
    public:
        void cancel()
        {
            {
                std::lock_guard lock(mutex_);
                cancelled_ = true;
            }
            cv_.notify_all();
        }

        bool cancelled() const
        {
            std::lock_guard lock(mutex_);
            return cancelled_;
        }

        // Sleeps up to `duration`; returns true as soon as cancellation is requested.
        template <typename Rep, typename Period>
        bool wait_for(std::chrono::duration<Rep, Period> duration) const
        {
            std::unique_lock lock(mutex_);
            return cv_.wait_for(lock, duration, [this]
                                { return cancelled_; });
        }

    private:
        mutable std::mutex mutex_;
        mutable std::condition_variable cv_;
        bool cancelled_{false};
    };

} // namespace cpan::client
