#pragma once
#include <optional>
#include <string>

#include "BookingLifecycle.hpp"
#include "logging.hpp"

namespace NCafeBooking {

    struct TBookingRules {
        TTransitionMatrix Transitions = TTransitionMatrix::Default();
        // 0 means no upper bound on how far ahead a booking may be made.
        int MaxDaysAhead = 0;
        // How many times a create/update is re-run after a commit-time conflict.
        int CommitRetries = 1;
    };

    struct TConfig {
        ELogLevel LogLevel = ELogLevel::Info;
        // Empty snapshot path selects in-memory storage.
        std::string SnapshotPath = "data/bookings.json";
        std::string JournalPath = "data/bookings.journal";
        // Writes between snapshot rewrites; the journal covers the rest.
        int CompactEvery = 64;
        std::string CatalogPath;
        TBookingRules Rules;
    };

    // Missing keys keep their defaults; malformed values throw std::runtime_error.
    TConfig ParseConfig(const json& j);
    TConfig LoadConfig(const std::string& path);

} // namespace NCafeBooking
