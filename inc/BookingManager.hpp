#pragma once
#include <memory>
#include <optional>
#include <vector>

#include "BookingLifecycle.hpp"
#include "BookingValidator.hpp"
#include "catalog.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "locks.hpp"
#include "notifications.hpp"
#include "repository.hpp"

namespace NCafeBooking {

    struct TBookingListQuery {
        std::optional<CafeId> Cafe;
        std::optional<UserId> User;
        // false restricts a manager or admin to their own bookings.
        bool ShowAll = true;
    };

    class TBookingManager {
    public:
        TBookingManager(std::shared_ptr<const ICatalog> catalog,
                        std::shared_ptr<IBookingRepository> repo,
                        std::shared_ptr<INotifier> notifier,
                        std::shared_ptr<const IClock> clock,
                        TBookingRules rules = {});

        TBooking CreateBooking(const TCreateRequest& req);
        TBooking UpdateBooking(BookingId id, const TBookingPatch& patch, const TActor& actor);

        TBooking GetBooking(BookingId id, const TActor& actor);
        std::vector<TBooking> ListBookings(const TActor& actor, const TBookingListQuery& query = {});

        // Occupying bookings dated before today become completed. Returns how many.
        size_t CompleteExpiredBookings();

    private:
        struct TUpdateOutcome {
            TBooking Booking;
            EBookingStatus PreviousStatus = EBookingStatus::Pending;
            bool Changed = false;
        };

        TBooking DoCreate(const TCreateRequest& req);
        TUpdateOutcome DoUpdate(BookingId id, const TBookingPatch& patch, const TActor& actor);
        TBooking LoadBooking(BookingId id);
        void Dispatch(EBookingEvent event, const TBooking& booking);

    private:
        std::shared_ptr<const ICatalog> Catalog;
        std::shared_ptr<IBookingRepository> Repo;
        std::shared_ptr<INotifier> Notifier;
        std::shared_ptr<const IClock> Clock;
        TBookingRules Rules;
        TBookingValidator Validator;
        TBookingLifecycle Lifecycle;
        TDateLockRegistry DateLocks;
    };

} // namespace NCafeBooking
