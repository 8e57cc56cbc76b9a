#include "quorumsig/cancellation.hpp"
#include <utility>

namespace quorumsig
{
    bool CancellationToken::cancel()
    {
        std::map<SubscriptionId, Callback> fired;
        {
            std::lock_guard lock(mutex_);
            if (cancelled_)
                return false;
            cancelled_ = true;
            fired.swap(callbacks_);
        }
        // Callbacks run unlocked so they may unsubscribe or re-enter cancelled()
        for (auto &[_, cb] : fired)
            cb();
        return true;
    }

    bool CancellationToken::cancelled() const
    {
        std::lock_guard lock(mutex_);
        return cancelled_;
    }

    CancellationToken::SubscriptionId CancellationToken::subscribe(Callback cb)
    {
        SubscriptionId id;
        {
            std::lock_guard lock(mutex_);
            id = next_id_++;
            if (!cancelled_)
            {
                callbacks_.emplace(id, std::move(cb));
                return id;
            }
        }
        cb();
        return id;
    }

    void CancellationToken::unsubscribe(SubscriptionId id)
    {
        std::lock_guard lock(mutex_);
        callbacks_.erase(id);
    }

} // namespace quorumsig
