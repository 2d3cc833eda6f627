#pragma once
#include <stdexcept>
#include <string>

namespace NCafeBooking {

    enum class EErrorKind {
        Validation,
        NotFound,
        InactiveResource,
        Conflict,
        Capacity,
        Permission,
        State,
        Temporal
    };

    enum class EErrorCode {
        ValidationError,
        InvalidTimeRange,
        InvalidSeatsCount,

        CafeNotFound,
        TableNotFound,
        SlotNotFound,
        BookingNotFound,

        CafeInactive,
        TableInactive,
        SlotInactive,

        TableAlreadyBooked,
        UserAlreadyBooked,
        SlotOverlap,

        NotEnoughSeats,

        InsufficientPermissions,

        InvalidStatusTransition,
        CannotActivateInactiveStatus,
        CannotDeactivateActiveStatus,
        BookingInactive,

        BookingPastDate
    };

    inline EErrorKind KindOf(EErrorCode code) {
        switch (code) {
            case EErrorCode::ValidationError:
            case EErrorCode::InvalidTimeRange:
            case EErrorCode::InvalidSeatsCount:
                return EErrorKind::Validation;
            case EErrorCode::CafeNotFound:
            case EErrorCode::TableNotFound:
            case EErrorCode::SlotNotFound:
            case EErrorCode::BookingNotFound:
                return EErrorKind::NotFound;
            case EErrorCode::CafeInactive:
            case EErrorCode::TableInactive:
            case EErrorCode::SlotInactive:
                return EErrorKind::InactiveResource;
            case EErrorCode::TableAlreadyBooked:
            case EErrorCode::UserAlreadyBooked:
            case EErrorCode::SlotOverlap:
                return EErrorKind::Conflict;
            case EErrorCode::NotEnoughSeats:
                return EErrorKind::Capacity;
            case EErrorCode::InsufficientPermissions:
                return EErrorKind::Permission;
            case EErrorCode::InvalidStatusTransition:
            case EErrorCode::CannotActivateInactiveStatus:
            case EErrorCode::CannotDeactivateActiveStatus:
            case EErrorCode::BookingInactive:
                return EErrorKind::State;
            case EErrorCode::BookingPastDate:
                return EErrorKind::Temporal;
        }
        return EErrorKind::Validation;
    }

    // Wire name, e.g. "table_already_booked".
    inline const char* ErrorCodeName(EErrorCode code) {
        switch (code) {
            case EErrorCode::ValidationError: return "validation_error";
            case EErrorCode::InvalidTimeRange: return "invalid_time_range";
            case EErrorCode::InvalidSeatsCount: return "invalid_seats_count";
            case EErrorCode::CafeNotFound: return "cafe_not_found";
            case EErrorCode::TableNotFound: return "table_not_found";
            case EErrorCode::SlotNotFound: return "slot_not_found";
            case EErrorCode::BookingNotFound: return "booking_not_found";
            case EErrorCode::CafeInactive: return "cafe_inactive";
            case EErrorCode::TableInactive: return "table_inactive";
            case EErrorCode::SlotInactive: return "slot_inactive";
            case EErrorCode::TableAlreadyBooked: return "table_already_booked";
            case EErrorCode::UserAlreadyBooked: return "user_already_booked";
            case EErrorCode::SlotOverlap: return "slot_overlap";
            case EErrorCode::NotEnoughSeats: return "not_enough_seats";
            case EErrorCode::InsufficientPermissions: return "insufficient_permissions";
            case EErrorCode::InvalidStatusTransition: return "invalid_status_transition";
            case EErrorCode::CannotActivateInactiveStatus: return "cannot_activate_inactive_status";
            case EErrorCode::CannotDeactivateActiveStatus: return "cannot_deactivate_active_status";
            case EErrorCode::BookingInactive: return "booking_inactive";
            case EErrorCode::BookingPastDate: return "booking_past_date";
        }
        return "unknown";
    }

    inline const char* ErrorKindName(EErrorKind kind) {
        switch (kind) {
            case EErrorKind::Validation: return "ValidationError";
            case EErrorKind::NotFound: return "NotFoundError";
            case EErrorKind::InactiveResource: return "InactiveResourceError";
            case EErrorKind::Conflict: return "ConflictError";
            case EErrorKind::Capacity: return "CapacityError";
            case EErrorKind::Permission: return "PermissionError";
            case EErrorKind::State: return "StateError";
            case EErrorKind::Temporal: return "TemporalError";
        }
        return "Error";
    }

    class TBookingError: public std::runtime_error {
    public:
        explicit TBookingError(EErrorCode code)
            : std::runtime_error(ErrorCodeName(code))
            , Code_(code) {
        }

        TBookingError(EErrorCode code, const std::string& detail)
            : std::runtime_error(std::string(ErrorCodeName(code)) + ": " + detail)
            , Code_(code) {
        }

        EErrorCode Code() const {
            return Code_;
        }

        EErrorKind Kind() const {
            return KindOf(Code_);
        }

        bool IsConflict() const {
            return Kind() == EErrorKind::Conflict;
        }

    private:
        EErrorCode Code_;
    };

} // namespace NCafeBooking
