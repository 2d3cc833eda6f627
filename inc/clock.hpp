#pragma once
#include <atomic>
#include <chrono>
#include <ctime>

#include "common.hpp"

namespace NCafeBooking {

    struct IClock {
        virtual ~IClock() = default;
        virtual TDate Today() const = 0;
    };

    // Local calendar date of the host.
    class TSystemClock: public IClock {
    public:
        TDate Today() const override {
            std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm tm{};
            localtime_r(&t, &tm);
            return DateFromCivil(tm.tm_year + 1900, static_cast<unsigned>(tm.tm_mon + 1), static_cast<unsigned>(tm.tm_mday));
        }
    };

    class TFixedClock: public IClock {
    public:
        explicit TFixedClock(TDate today)
            : Days(today.Days) {
        }

        TDate Today() const override {
            return TDate{Days.load()};
        }

        void Set(TDate today) {
            Days.store(today.Days);
        }

    private:
        std::atomic<int64_t> Days;
    };

} // namespace NCafeBooking
