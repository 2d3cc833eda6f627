#include <BookingManager.hpp>
#include <logging.hpp>

namespace NCafeBooking {

    namespace {

        // Locks the mutexes of one or two dates together and releases them on scope exit.
        class TDateGuard {
        public:
            TDateGuard(TDateLockRegistry& registry, TDate a, TDate b)
                : First(registry.For(a))
                , Second(a == b ? nullptr : registry.For(b)) {
                if (Second) {
                    std::lock(*First, *Second);
                } else {
                    First->lock();
                }
            }

            ~TDateGuard() {
                First->unlock();
                if (Second) {
                    Second->unlock();
                }
            }

            TDateGuard(const TDateGuard&) = delete;
            TDateGuard& operator=(const TDateGuard&) = delete;

        private:
            std::shared_ptr<std::mutex> First;
            std::shared_ptr<std::mutex> Second;
        };

        // Fields of patch that differ from booking. An explicit active flag is
        // kept alongside a status change so it is checked against the new status.
        TBookingPatch EffectiveChanges(const TBooking& booking, const TBookingPatch& patch) {
            TBookingPatch c;
            if (patch.Cafe && *patch.Cafe != booking.Cafe) {
                c.Cafe = patch.Cafe;
            }
            if (patch.Date && *patch.Date != booking.Date) {
                c.Date = patch.Date;
            }
            if (patch.GuestNumber && *patch.GuestNumber != booking.GuestNumber) {
                c.GuestNumber = patch.GuestNumber;
            }
            if (patch.Note && *patch.Note != booking.Note) {
                c.Note = patch.Note;
            }
            if (patch.Status && *patch.Status != booking.Status) {
                c.Status = patch.Status;
            }
            if (patch.Active && (*patch.Active != booking.Active || c.Status)) {
                c.Active = patch.Active;
            }
            if (patch.TableSlots && !SameAssignmentSet(*patch.TableSlots, booking.TableSlots)) {
                c.TableSlots = patch.TableSlots;
            }
            return c;
        }

        EBookingEvent EventFor(EBookingStatus previous, EBookingStatus current) {
            if (previous == current) {
                return EBookingEvent::Updated;
            }
            switch (current) {
                case EBookingStatus::Confirmed: return EBookingEvent::Confirmed;
                case EBookingStatus::Cancelled: return EBookingEvent::Cancelled;
                case EBookingStatus::Completed: return EBookingEvent::Completed;
                case EBookingStatus::Pending: return EBookingEvent::Updated;
            }
            return EBookingEvent::Updated;
        }

        json Describe(const TBooking& b) {
            return {{"booking_id", b.Id},
                    {"user_id", b.Owner},
                    {"cafe_id", b.Cafe},
                    {"booking_date", FormatDate(b.Date)},
                    {"status", StatusName(b.Status)},
                    {"active", b.Active}};
        }

    } // namespace

    TBookingManager::TBookingManager(std::shared_ptr<const ICatalog> catalog,
                                     std::shared_ptr<IBookingRepository> repo,
                                     std::shared_ptr<INotifier> notifier,
                                     std::shared_ptr<const IClock> clock,
                                     TBookingRules rules)
        : Catalog(std::move(catalog))
        , Repo(std::move(repo))
        , Notifier(std::move(notifier))
        , Clock(std::move(clock))
        , Rules(std::move(rules))
        , Validator(Catalog, Repo, Rules.MaxDaysAhead)
        , Lifecycle(Rules.Transitions) {
    }

    TBooking TBookingManager::CreateBooking(const TCreateRequest& req) {
        TBooking booking;
        try {
            booking = DoCreate(req);
        } catch (const TBookingError& e) {
            LogWarn("booking", "create rejected",
                    {{"user_id", req.Actor.Id}, {"cafe_id", req.Cafe}, {"code", ErrorCodeName(e.Code())}, {"error", e.what()}});
            throw;
        }
        LogInfo("booking", "booking created", Describe(booking));
        Dispatch(EBookingEvent::Created, booking);
        return booking;
    }

    TBooking TBookingManager::DoCreate(const TCreateRequest& req) {
        Validator.ValidateBookingDate(req.Date, Clock->Today());
        TBookingValidator::ValidateGuestNumber(req.GuestNumber);
        TBookingValidator::ValidateNote(req.Note);
        TBookingValidator::ValidateAssignmentSet(req.TableSlots);

        for (int attempt = 0;; ++attempt) {
            TDateGuard guard(DateLocks, req.Date, req.Date);
            Validator.ValidateCafe(req.Cafe);
            Validator.ValidateAssignments(req.TableSlots, req.Cafe, req.Date, req.Actor.Id, req.GuestNumber);

            TBooking booking;
            booking.Owner = req.Actor.Id;
            booking.Cafe = req.Cafe;
            booking.Date = req.Date;
            booking.GuestNumber = req.GuestNumber;
            booking.Note = req.Note;
            booking.Status = EBookingStatus::Pending;
            booking.Active = true;
            booking.TableSlots = req.TableSlots;
            booking.CreatedAt = std::chrono::system_clock::now();
            booking.UpdatedAt = booking.CreatedAt;
            try {
                return Repo->Insert(booking);
            } catch (const TBookingError& e) {
                if (!e.IsConflict() || attempt >= Rules.CommitRetries) {
                    throw;
                }
                LogWarn("booking", "commit conflict, retrying create",
                        {{"attempt", attempt + 1}, {"error", e.what()}});
            }
        }
    }

    TBooking TBookingManager::UpdateBooking(BookingId id, const TBookingPatch& patch, const TActor& actor) {
        TUpdateOutcome outcome;
        try {
            outcome = DoUpdate(id, patch, actor);
        } catch (const TBookingError& e) {
            LogWarn("booking", "update rejected",
                    {{"booking_id", id}, {"user_id", actor.Id}, {"code", ErrorCodeName(e.Code())}, {"error", e.what()}});
            throw;
        }
        if (!outcome.Changed) {
            Log(ELogLevel::Debug, "booking", "update is a no-op", {{"booking_id", id}});
            return outcome.Booking;
        }
        LogInfo("booking", "booking updated", Describe(outcome.Booking));
        Dispatch(EventFor(outcome.PreviousStatus, outcome.Booking.Status), outcome.Booking);
        return outcome.Booking;
    }

    TBookingManager::TUpdateOutcome TBookingManager::DoUpdate(BookingId id, const TBookingPatch& patch, const TActor& actor) {
        for (int attempt = 0;; ++attempt) {
            TBooking seen = LoadBooking(id);
            TBookingLifecycle::CheckPermission(actor, seen);
            TBookingPatch changes = EffectiveChanges(seen, patch);
            if (changes.Empty()) {
                return TUpdateOutcome{seen, seen.Status, false};
            }

            TDateGuard guard(DateLocks, seen.Date, changes.Date.value_or(seen.Date));
            TBooking current = LoadBooking(id);
            if (current.Date != seen.Date) {
                // Moved to another date while we waited; lock the right one.
                continue;
            }
            changes = EffectiveChanges(current, patch);
            if (changes.Empty()) {
                return TUpdateOutcome{current, current.Status, false};
            }

            if (!current.Active && actor.Role != ERole::Admin) {
                throw TBookingError(EErrorCode::BookingInactive, std::to_string(id));
            }

            TBooking next = current;
            if (changes.Date) {
                Validator.ValidateBookingDate(*changes.Date, Clock->Today());
                next.Date = *changes.Date;
            }
            if (changes.Cafe) {
                Validator.ValidateCafe(*changes.Cafe);
                next.Cafe = *changes.Cafe;
            }
            if (changes.GuestNumber) {
                TBookingValidator::ValidateGuestNumber(*changes.GuestNumber);
                next.GuestNumber = *changes.GuestNumber;
            }
            if (changes.Note) {
                TBookingValidator::ValidateNote(*changes.Note);
                next.Note = *changes.Note;
            }
            if (changes.TableSlots) {
                TBookingValidator::ValidateAssignmentSet(*changes.TableSlots);
                next.TableSlots = *changes.TableSlots;
            }
            if (changes.Status) {
                next.Status = Lifecycle.ApplyTransition(current.Status, *changes.Status, actor.Role);
            }
            if (changes.Status || changes.Active) {
                next.Active = TBookingLifecycle::ResolveActive(next.Status, changes.Active);
            }

            // Only a booking that will hold its seats needs them checked.
            const bool reopened = !IsOccupying(current);
            if (IsOccupying(next) && (changes.TableSlots || changes.Cafe || changes.Date || changes.GuestNumber || reopened)) {
                Validator.ValidateAssignments(next.TableSlots, next.Cafe, next.Date, next.Owner, next.GuestNumber, next.Id);
            }

            next.UpdatedAt = std::chrono::system_clock::now();
            try {
                Repo->Replace(next);
                return TUpdateOutcome{next, current.Status, true};
            } catch (const TBookingError& e) {
                if (!e.IsConflict() || attempt >= Rules.CommitRetries) {
                    throw;
                }
                LogWarn("booking", "commit conflict, retrying update",
                        {{"booking_id", id}, {"attempt", attempt + 1}, {"error", e.what()}});
            }
        }
    }

    TBooking TBookingManager::GetBooking(BookingId id, const TActor& actor) {
        TBooking booking = LoadBooking(id);
        TBookingLifecycle::CheckPermission(actor, booking);
        return booking;
    }

    std::vector<TBooking> TBookingManager::ListBookings(const TActor& actor, const TBookingListQuery& query) {
        TBookingFilter filter;
        filter.Cafe = query.Cafe;
        if (actor.Role == ERole::Customer || !query.ShowAll) {
            filter.Owner = actor.Id;
        } else {
            filter.Owner = query.User;
        }
        return Repo->ListBookings(filter);
    }

    size_t TBookingManager::CompleteExpiredBookings() {
        const TDate today = Clock->Today();
        TBookingFilter filter;
        filter.OnlyOccupying = true;

        std::vector<TBooking> completed;
        for (const auto& candidate : Repo->ListBookings(filter)) {
            if (!(candidate.Date < today)) {
                continue;
            }
            TDateGuard guard(DateLocks, candidate.Date, candidate.Date);
            auto current = Repo->GetBooking(candidate.Id);
            if (!current || !IsOccupying(*current) || !(current->Date < today)) {
                continue;
            }
            TBooking next = *current;
            next.Status = EBookingStatus::Completed;
            next.Active = false;
            next.UpdatedAt = std::chrono::system_clock::now();
            Repo->Replace(next);
            completed.push_back(next);
        }

        for (const auto& b : completed) {
            Dispatch(EBookingEvent::Completed, b);
        }
        const size_t pruned = DateLocks.ForgetBefore(today);
        LogInfo("sweep", "expired bookings completed",
                {{"count", completed.size()}, {"today", FormatDate(today)}, {"locks_pruned", pruned}});
        return completed.size();
    }

    TBooking TBookingManager::LoadBooking(BookingId id) {
        auto booking = Repo->GetBooking(id);
        if (!booking) {
            throw TBookingError(EErrorCode::BookingNotFound, std::to_string(id));
        }
        return *booking;
    }

    void TBookingManager::Dispatch(EBookingEvent event, const TBooking& booking) {
        if (!Notifier) {
            return;
        }
        try {
            Notifier->Notify(event, BookingPayload(booking));
        } catch (const std::exception& e) {
            LogError("notify", "notification dispatch failed",
                     {{"event", EventName(event)}, {"booking_id", booking.Id}, {"error", e.what()}});
        }
    }

} // namespace NCafeBooking
