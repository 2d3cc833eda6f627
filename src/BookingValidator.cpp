#include <BookingValidator.hpp>

#include <set>

namespace NCafeBooking {

    TBookingValidator::TBookingValidator(std::shared_ptr<const ICatalog> catalog,
                                         std::shared_ptr<IBookingRepository> repo,
                                         int maxDaysAhead)
        : Catalog(std::move(catalog))
        , Repo(std::move(repo))
        , MaxDaysAhead(maxDaysAhead) {
    }

    TValidatedTables TBookingValidator::ValidateAssignments(const std::vector<TTableSlot>& assignments,
                                                            CafeId cafe,
                                                            TDate date,
                                                            UserId owner,
                                                            int guestNumber,
                                                            std::optional<BookingId> exclude) const {
        TValidatedTables out;
        std::set<TableId> seen;

        for (const auto& ts : assignments) {
            auto table = Catalog->GetTable(ts.Table);
            if (!table || table->Cafe != cafe) {
                throw TBookingError(EErrorCode::TableNotFound, std::to_string(ts.Table));
            }
            if (!table->Active) {
                throw TBookingError(EErrorCode::TableInactive, std::to_string(ts.Table));
            }

            auto slot = Catalog->GetSlot(ts.Slot);
            if (!slot || slot->Cafe != cafe) {
                throw TBookingError(EErrorCode::SlotNotFound, std::to_string(ts.Slot));
            }
            if (!slot->Active) {
                throw TBookingError(EErrorCode::SlotInactive, std::to_string(ts.Slot));
            }

            if (Repo->IsOccupied(ts.Table, ts.Slot, date, exclude)) {
                throw TBookingError(EErrorCode::TableAlreadyBooked,
                                    "table " + std::to_string(ts.Table) + " at " + slot->Interval.ToString() +
                                        " on " + FormatDate(date));
            }

            if (Repo->UserIsBusy(owner, slot->Interval, date, exclude)) {
                throw TBookingError(EErrorCode::UserAlreadyBooked,
                                    "user " + std::to_string(owner) + " at " + slot->Interval.ToString() +
                                        " on " + FormatDate(date));
            }

            if (seen.insert(table->Id).second) {
                out.Tables.push_back(*table);
                out.TotalSeats += table->Seats;
            }
        }

        if (guestNumber > out.TotalSeats) {
            throw TBookingError(EErrorCode::NotEnoughSeats,
                                std::to_string(guestNumber) + " guests, " + std::to_string(out.TotalSeats) + " seats");
        }
        return out;
    }

    void TBookingValidator::ValidateBookingDate(TDate date, TDate today) const {
        if (date <= today) {
            throw TBookingError(EErrorCode::BookingPastDate, FormatDate(date));
        }
        if (MaxDaysAhead > 0 && date > today.AddDays(MaxDaysAhead)) {
            throw TBookingError(EErrorCode::ValidationError,
                                FormatDate(date) + " is more than " + std::to_string(MaxDaysAhead) + " days ahead");
        }
    }

    TCafe TBookingValidator::ValidateCafe(CafeId cafe) const {
        auto c = Catalog->GetCafe(cafe);
        if (!c) {
            throw TBookingError(EErrorCode::CafeNotFound, std::to_string(cafe));
        }
        if (!c->Active) {
            throw TBookingError(EErrorCode::CafeInactive, std::to_string(cafe));
        }
        return *c;
    }

    void TBookingValidator::ValidateGuestNumber(int guestNumber) {
        if (guestNumber <= 0) {
            throw TBookingError(EErrorCode::ValidationError, "guest number must be positive");
        }
    }

    void TBookingValidator::ValidateAssignmentSet(const std::vector<TTableSlot>& assignments) {
        if (assignments.empty()) {
            throw TBookingError(EErrorCode::ValidationError, "at least one table slot is required");
        }
        std::set<TTableSlot> unique(assignments.begin(), assignments.end());
        if (unique.size() != assignments.size()) {
            throw TBookingError(EErrorCode::ValidationError, "duplicate table slot");
        }
    }

    void TBookingValidator::ValidateNote(const std::string& note) {
        if (note.size() > MAX_BOOKING_NOTE_LENGTH) {
            throw TBookingError(EErrorCode::ValidationError,
                                "note longer than " + std::to_string(MAX_BOOKING_NOTE_LENGTH) + " characters");
        }
    }

} // namespace NCafeBooking
