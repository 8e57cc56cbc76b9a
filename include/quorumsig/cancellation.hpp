#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>

namespace quorumsig
{
    /**
     * One-way cancellation signal shared by every outbound call of a request.
     * Firing it is idempotent; subscribers registered after firing run immediately.
     */
    class CancellationToken
    {
    public:
        using Callback = std::function<void()>;
        using SubscriptionId = std::size_t;

        /** Fire the signal. Returns true only for the call that actually fired it. */
        bool cancel();

        bool cancelled() const;

        SubscriptionId subscribe(Callback cb);

        void unsubscribe(SubscriptionId id);

    private:
        mutable std::mutex mutex_;
        bool cancelled_{false};
        SubscriptionId next_id_{1};
        std::map<SubscriptionId, Callback> callbacks_;
    };
}
