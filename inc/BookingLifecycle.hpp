#pragma once
#include <map>
#include <optional>
#include <set>

#include "models.hpp"

namespace NCafeBooking {

    // Role -> current status -> statuses it may move to.
    class TTransitionMatrix {
    public:
        // Customer: pending->cancelled. Manager: pending->{confirmed, cancelled},
        // confirmed->{cancelled, completed}. Admin: any change, terminal states included.
        static TTransitionMatrix Default();

        // {"customer": {"pending": ["cancelled"]}, ...}; unlisted roles get no transitions.
        static TTransitionMatrix FromJson(const json& j);

        void Allow(ERole role, EBookingStatus from, EBookingStatus to);
        bool IsAllowed(ERole role, EBookingStatus from, EBookingStatus to) const;

    private:
        std::map<ERole, std::map<EBookingStatus, std::set<EBookingStatus>>> Allowed;
    };

    class TBookingLifecycle {
    public:
        explicit TBookingLifecycle(TTransitionMatrix matrix = TTransitionMatrix::Default());

        // Same status is a no-op; anything else must be in the matrix.
        EBookingStatus ApplyTransition(EBookingStatus current, EBookingStatus requested, ERole role) const;

        static bool IsActiveStatus(EBookingStatus status);

        // Active flag for resultingStatus; an explicit request must agree with it.
        static bool ResolveActive(EBookingStatus resultingStatus, std::optional<bool> requested);

        // Customers may only touch their own bookings.
        static void CheckPermission(const TActor& actor, const TBooking& booking);

    private:
        TTransitionMatrix Matrix;
    };

} // namespace NCafeBooking
