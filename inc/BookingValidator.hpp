#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "catalog.hpp"
#include "repository.hpp"

namespace NCafeBooking {

    constexpr size_t MAX_BOOKING_NOTE_LENGTH = 256;

    struct TValidatedTables {
        std::vector<TTable> Tables; // distinct, in first-seen order
        int TotalSeats = 0;
    };

    // Each check throws TBookingError at the first violation.
    class TBookingValidator {
    public:
        TBookingValidator(std::shared_ptr<const ICatalog> catalog,
                          std::shared_ptr<IBookingRepository> repo,
                          int maxDaysAhead = 0);

        // Per pair: table, slot, occupancy, owner overlap. Seats last.
        // exclude is the booking's own id on update.
        TValidatedTables ValidateAssignments(const std::vector<TTableSlot>& assignments,
                                             CafeId cafe,
                                             TDate date,
                                             UserId owner,
                                             int guestNumber,
                                             std::optional<BookingId> exclude = std::nullopt) const;

        // date must be strictly after today and, if limited, within the horizon.
        void ValidateBookingDate(TDate date, TDate today) const;

        TCafe ValidateCafe(CafeId cafe) const;

        static void ValidateGuestNumber(int guestNumber);
        static void ValidateAssignmentSet(const std::vector<TTableSlot>& assignments);
        static void ValidateNote(const std::string& note);

    private:
        std::shared_ptr<const ICatalog> Catalog;
        std::shared_ptr<IBookingRepository> Repo;
        int MaxDaysAhead;
    };

} // namespace NCafeBooking
