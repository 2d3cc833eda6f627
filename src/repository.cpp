#include <repository.hpp>
#include <logging.hpp>

#include <algorithm>

namespace NCafeBooking {

    TBookingRepository::TBookingRepository(std::shared_ptr<IStorage> storage, std::shared_ptr<const ICatalog> catalog,
                                           size_t compactEvery)
        : Storage(std::move(storage))
        , Catalog(std::move(catalog))
        , CompactEvery(std::max<size_t>(compactEvery, 1)) {
        Reload();
    }

    std::optional<TBooking> TBookingRepository::GetBooking(BookingId id) {
        std::lock_guard lk(Mutex_);
        auto it = Bookings.find(id);
        if (it == Bookings.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<TBooking> TBookingRepository::ListBookings(const TBookingFilter& filter) {
        std::lock_guard lk(Mutex_);
        std::vector<TBooking> out;
        for (const auto& kv : Bookings) {
            const TBooking& b = kv.second;
            if (filter.Owner && b.Owner != *filter.Owner) {
                continue;
            }
            if (filter.Cafe && b.Cafe != *filter.Cafe) {
                continue;
            }
            if (filter.Date && b.Date != *filter.Date) {
                continue;
            }
            if (filter.OnlyOccupying && !IsOccupying(b)) {
                continue;
            }
            out.push_back(b);
        }
        std::sort(out.begin(), out.end(), [](const TBooking& a, const TBooking& b) {
            return a.Id < b.Id;
        });
        return out;
    }

    bool TBookingRepository::IsOccupied(TableId table, SlotId slot, TDate date,
                                        std::optional<BookingId> exclude) {
        std::lock_guard lk(Mutex_);
        auto it = Occupancy.find(TOccupancyKey{table, slot, date.Days});
        if (it == Occupancy.end()) {
            return false;
        }
        return !exclude || it->second != *exclude;
    }

    bool TBookingRepository::UserIsBusy(UserId user, const TTimeInterval& interval, TDate date,
                                        std::optional<BookingId> exclude) {
        std::lock_guard lk(Mutex_);
        for (const auto& kv : Bookings) {
            const TBooking& b = kv.second;
            if (b.Owner != user || b.Date != date || !IsOccupying(b)) {
                continue;
            }
            if (exclude && b.Id == *exclude) {
                continue;
            }
            for (const auto& ts : b.TableSlots) {
                // Current slot times, not the ones in force when b was made.
                auto slot = Catalog->GetSlot(ts.Slot);
                if (slot && slot->Interval.Overlaps(interval)) {
                    return true;
                }
            }
        }
        return false;
    }

    TBooking TBookingRepository::Insert(TBooking booking) {
        std::lock_guard lk(Mutex_);
        booking.Id = NextId;
        CheckOccupancy(booking);

        // Nothing changes in memory unless the record is durable.
        Record("create", booking);
        Bookings[booking.Id] = booking;
        Index(booking);
        ++NextId;
        CompactIfDue();
        return booking;
    }

    void TBookingRepository::Replace(const TBooking& booking) {
        std::lock_guard lk(Mutex_);
        auto it = Bookings.find(booking.Id);
        if (it == Bookings.end()) {
            throw TBookingError(EErrorCode::BookingNotFound, std::to_string(booking.Id));
        }
        CheckOccupancy(booking);

        Record("update", booking);
        Unindex(it->second);
        it->second = booking;
        Index(booking);
        CompactIfDue();
    }

    void TBookingRepository::CheckOccupancy(const TBooking& booking) const {
        if (!IsOccupying(booking)) {
            return;
        }
        for (const auto& ts : booking.TableSlots) {
            auto it = Occupancy.find(TOccupancyKey{ts.Table, ts.Slot, booking.Date.Days});
            if (it != Occupancy.end() && it->second != booking.Id) {
                throw TBookingError(EErrorCode::TableAlreadyBooked,
                                    "table " + std::to_string(ts.Table) + " slot " + std::to_string(ts.Slot) +
                                        " on " + FormatDate(booking.Date) + " held by booking " +
                                        std::to_string(it->second));
            }
        }
    }

    void TBookingRepository::Index(const TBooking& booking) {
        if (!IsOccupying(booking)) {
            return;
        }
        for (const auto& ts : booking.TableSlots) {
            Occupancy[TOccupancyKey{ts.Table, ts.Slot, booking.Date.Days}] = booking.Id;
        }
    }

    void TBookingRepository::Unindex(const TBooking& booking) {
        for (const auto& ts : booking.TableSlots) {
            auto it = Occupancy.find(TOccupancyKey{ts.Table, ts.Slot, booking.Date.Days});
            if (it != Occupancy.end() && it->second == booking.Id) {
                Occupancy.erase(it);
            }
        }
    }

    void TBookingRepository::Reload() {
        std::lock_guard lk(Mutex_);
        Bookings.clear();
        Occupancy.clear();
        NextId = 1;
        LastSeq = 0;
        nlohmann::json snap = Storage->LoadSnapshot();
        if (snap.is_object() && snap.contains("bookings") && snap["bookings"].is_array()) {
            for (const auto& jb : snap["bookings"]) {
                TBooking b;
                FromJSON(jb, b);
                Bookings[b.Id] = b;
                NextId = std::max(NextId, b.Id + 1);
            }
        }
        if (snap.is_object() && snap.contains("next_id")) {
            NextId = std::max(NextId, snap["next_id"].get<BookingId>());
        }
        if (snap.is_object() && snap.contains("journal_seq")) {
            LastSeq = snap["journal_seq"].get<uint64_t>();
        }
        size_t replayed = Replay(Storage->LoadChanges());

        for (const auto& kv : Bookings) {
            if (!IsOccupying(kv.second)) {
                continue;
            }
            for (const auto& ts : kv.second.TableSlots) {
                auto key = TOccupancyKey{ts.Table, ts.Slot, kv.second.Date.Days};
                auto [it, inserted] = Occupancy.emplace(key, kv.first);
                if (!inserted) {
                    LogWarn("repository", "stored state holds a double booking",
                            {{"table_id", ts.Table}, {"slot_id", ts.Slot},
                             {"booking_ids", {it->second, kv.first}}});
                }
            }
        }

        if (replayed > 0) {
            LogInfo("repository", "journal replayed", {{"changes", replayed}, {"journal_seq", LastSeq}});
            try {
                Compact();
            } catch (const std::exception& e) {
                LogWarn("repository", "snapshot compaction failed", {{"journal_seq", LastSeq}, {"error", e.what()}});
            }
        }
        if (!Bookings.empty()) {
            LogInfo("repository", "bookings loaded", {{"count", Bookings.size()}, {"next_id", NextId}});
        }
    }

    // Applies change records the snapshot does not cover yet, in order.
    size_t TBookingRepository::Replay(const std::vector<nlohmann::json>& changes) {
        size_t applied = 0;
        for (const auto& change : changes) {
            if (!change.is_object() || !change.contains("seq") || !change.contains("booking")) {
                LogWarn("repository", "skipping malformed journal record", {{"record", change.dump()}});
                continue;
            }
            uint64_t seq = change.at("seq").get<uint64_t>();
            if (seq <= LastSeq) {
                continue;
            }
            TBooking b;
            FromJSON(change.at("booking"), b);
            Bookings[b.Id] = b;
            NextId = std::max(NextId, b.Id + 1);
            LastSeq = seq;
            ++applied;
        }
        return applied;
    }

    void TBookingRepository::Record(const char* op, const TBooking& booking) {
        uint64_t seq = LastSeq + 1;
        Storage->AppendChange({{"seq", seq}, {"op", op}, {"booking", BookingToJson(booking)}});
        LastSeq = seq;
    }

    void TBookingRepository::Compact() {
        std::vector<BookingId> ids;
        ids.reserve(Bookings.size());
        for (const auto& kv : Bookings) {
            ids.push_back(kv.first);
        }
        std::sort(ids.begin(), ids.end());

        nlohmann::json snap = nlohmann::json::object();
        snap["next_id"] = NextId;
        snap["journal_seq"] = LastSeq;
        snap["bookings"] = nlohmann::json::array();
        for (BookingId id : ids) {
            snap["bookings"].push_back(BookingToJson(Bookings.at(id)));
        }
        Storage->Compact(snap);
        SinceCompact = 0;
    }

    // The journal already holds every change, so a failed compaction only
    // postpones the snapshot to the next write.
    void TBookingRepository::CompactIfDue() {
        if (++SinceCompact < CompactEvery) {
            return;
        }
        try {
            Compact();
        } catch (const std::exception& e) {
            LogWarn("repository", "snapshot compaction failed", {{"journal_seq", LastSeq}, {"error", e.what()}});
        }
    }

    nlohmann::json TBookingRepository::BookingToJson(const TBooking& b) {
        nlohmann::json j;
        ToJSON(j, b);
        return j;
    }

} // namespace NCafeBooking
