#pragma once
#include <map>
#include <memory>
#include <mutex>

#include "common.hpp"

namespace NCafeBooking {

    // One mutex per booking date, held across validation and commit of every
    // write touching that date. Entries for past dates are dropped by
    // ForgetBefore once nobody holds them.
    class TDateLockRegistry {
    public:
        std::shared_ptr<std::mutex> For(TDate date) {
            std::lock_guard lk(Mutex_);
            auto& m = Locks[date.Days];
            if (!m) {
                m = std::make_shared<std::mutex>();
            }
            return m;
        }

        // A mutex referenced only by the registry is neither held nor awaited,
        // and For() cannot hand it out meanwhile. Returns how many were dropped.
        size_t ForgetBefore(TDate date) {
            std::lock_guard lk(Mutex_);
            size_t dropped = 0;
            auto end = Locks.lower_bound(date.Days);
            for (auto it = Locks.begin(); it != end;) {
                if (it->second.use_count() == 1) {
                    it = Locks.erase(it);
                    ++dropped;
                } else {
                    ++it;
                }
            }
            return dropped;
        }

        size_t Size() {
            std::lock_guard lk(Mutex_);
            return Locks.size();
        }

    private:
        std::mutex Mutex_;
        std::map<int64_t, std::shared_ptr<std::mutex>> Locks;
    };

} // namespace NCafeBooking
