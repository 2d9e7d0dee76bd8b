#pragma once
#include <algorithm>
#include <mutex>
#include <vector>

#include "util/log.hpp"

namespace stream
{

// Observer set that can be changed while a dispatch is running: for_each()
// iterates a snapshot taken under the lock and calls out without holding it.
// Observers are not owned.
template <typename T>
class CallbackRegistry
{
  public:
    // false when `cb` is null or already registered
    bool add(T *cb)
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!cb || std::find(cbs_.begin(), cbs_.end(), cb) != cbs_.end())
        {
            LOG_ERROR("Could not add callback");
            return false;
        }
        cbs_.push_back(cb);
        return true;
    }

    bool remove(T *cb)
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = std::find(cbs_.begin(), cbs_.end(), cb);
        if (it == cbs_.end())
        {
            LOG_WARN("Did not remove callback from existing ones");
            return false;
        }
        cbs_.erase(it);
        return true;
    }

    template <typename Fn>
    void for_each(Fn &&fn) const
    {
        std::vector<T *> snapshot;
        {
            std::lock_guard<std::mutex> lk(mu_);
            snapshot = cbs_;
        }
        for (T *cb : snapshot)
            fn(*cb);
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return cbs_.size();
    }

  private:
    mutable std::mutex mu_;
    std::vector<T *>   cbs_;
};

}  // namespace stream
