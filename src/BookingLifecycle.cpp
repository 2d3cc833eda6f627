#include <BookingLifecycle.hpp>

namespace NCafeBooking {

    namespace {

        const EBookingStatus ALL_STATUSES[] = {
            EBookingStatus::Pending,
            EBookingStatus::Confirmed,
            EBookingStatus::Cancelled,
            EBookingStatus::Completed};

    } // namespace

    TTransitionMatrix TTransitionMatrix::Default() {
        TTransitionMatrix m;
        m.Allow(ERole::Customer, EBookingStatus::Pending, EBookingStatus::Cancelled);

        m.Allow(ERole::Manager, EBookingStatus::Pending, EBookingStatus::Confirmed);
        m.Allow(ERole::Manager, EBookingStatus::Pending, EBookingStatus::Cancelled);
        m.Allow(ERole::Manager, EBookingStatus::Confirmed, EBookingStatus::Cancelled);
        m.Allow(ERole::Manager, EBookingStatus::Confirmed, EBookingStatus::Completed);

        for (auto from : ALL_STATUSES) {
            for (auto to : ALL_STATUSES) {
                if (from != to) {
                    m.Allow(ERole::Admin, from, to);
                }
            }
        }
        return m;
    }

    TTransitionMatrix TTransitionMatrix::FromJson(const json& j) {
        if (!j.is_object()) {
            throw std::runtime_error("transitions must be an object keyed by role");
        }
        TTransitionMatrix m;
        for (auto& [roleName, rows] : j.items()) {
            auto role = ParseRole(roleName);
            if (!role) {
                throw std::runtime_error("unknown role in transitions: " + roleName);
            }
            if (!rows.is_object()) {
                throw std::runtime_error("transitions." + roleName + " must be an object");
            }
            for (auto& [fromName, targets] : rows.items()) {
                auto from = ParseStatus(fromName);
                if (!from) {
                    throw std::runtime_error("unknown status in transitions: " + fromName);
                }
                for (const auto& t : targets) {
                    auto to = ParseStatus(t.get<std::string>());
                    if (!to) {
                        throw std::runtime_error("unknown status in transitions: " + t.get<std::string>());
                    }
                    m.Allow(*role, *from, *to);
                }
            }
        }
        return m;
    }

    void TTransitionMatrix::Allow(ERole role, EBookingStatus from, EBookingStatus to) {
        Allowed[role][from].insert(to);
    }

    bool TTransitionMatrix::IsAllowed(ERole role, EBookingStatus from, EBookingStatus to) const {
        auto r = Allowed.find(role);
        if (r == Allowed.end()) {
            return false;
        }
        auto f = r->second.find(from);
        if (f == r->second.end()) {
            return false;
        }
        return f->second.count(to) > 0;
    }

    TBookingLifecycle::TBookingLifecycle(TTransitionMatrix matrix)
        : Matrix(std::move(matrix)) {
    }

    EBookingStatus TBookingLifecycle::ApplyTransition(EBookingStatus current, EBookingStatus requested, ERole role) const {
        if (current == requested) {
            return current;
        }
        if (!Matrix.IsAllowed(role, current, requested)) {
            throw TBookingError(EErrorCode::InvalidStatusTransition,
                                std::string(RoleName(role)) + " cannot move " + StatusName(current) + " to " +
                                    StatusName(requested));
        }
        return requested;
    }

    bool TBookingLifecycle::IsActiveStatus(EBookingStatus status) {
        return status == EBookingStatus::Pending || status == EBookingStatus::Confirmed;
    }

    bool TBookingLifecycle::ResolveActive(EBookingStatus resultingStatus, std::optional<bool> requested) {
        const bool derived = IsActiveStatus(resultingStatus);
        if (!requested || *requested == derived) {
            return derived;
        }
        if (*requested) {
            throw TBookingError(EErrorCode::CannotActivateInactiveStatus, StatusName(resultingStatus));
        }
        throw TBookingError(EErrorCode::CannotDeactivateActiveStatus, StatusName(resultingStatus));
    }

    void TBookingLifecycle::CheckPermission(const TActor& actor, const TBooking& booking) {
        if (actor.Role == ERole::Admin || actor.Role == ERole::Manager) {
            return;
        }
        if (actor.Id != booking.Owner) {
            throw TBookingError(EErrorCode::InsufficientPermissions,
                                "booking " + std::to_string(booking.Id) + " belongs to another user");
        }
    }

} // namespace NCafeBooking
