#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "catalog.hpp"
#include "models.hpp"
#include "storage.hpp"

namespace NCafeBooking {

    struct TBookingFilter {
        std::optional<UserId> Owner;
        std::optional<CafeId> Cafe;
        std::optional<TDate> Date;
        bool OnlyOccupying = false;
    };

    struct IBookingRepository {
        virtual ~IBookingRepository() = default;

        virtual std::optional<TBooking> GetBooking(BookingId id) = 0;
        virtual std::vector<TBooking> ListBookings(const TBookingFilter& filter) = 0;

        // Another occupying booking holds (table, slot) on date.
        virtual bool IsOccupied(TableId table, SlotId slot, TDate date,
                                std::optional<BookingId> exclude) = 0;
        // User owns an occupying booking on date whose slot overlaps interval.
        virtual bool UserIsBusy(UserId user, const TTimeInterval& interval, TDate date,
                                std::optional<BookingId> exclude) = 0;

        // Writes are atomic and throw TableAlreadyBooked on an occupancy clash.
        virtual TBooking Insert(TBooking booking) = 0;
        virtual void Replace(const TBooking& booking) = 0;
    };

    constexpr size_t DEFAULT_COMPACT_EVERY = 64;

    // Booking store over IStorage. Every write is journalled before it is
    // applied; the snapshot is rewritten every compactEvery writes and after
    // a reload that replayed the journal.
    class TBookingRepository: public IBookingRepository {
    public:
        TBookingRepository(std::shared_ptr<IStorage> storage, std::shared_ptr<const ICatalog> catalog,
                           size_t compactEvery = DEFAULT_COMPACT_EVERY);

        std::optional<TBooking> GetBooking(BookingId id) override;
        std::vector<TBooking> ListBookings(const TBookingFilter& filter) override;

        bool IsOccupied(TableId table, SlotId slot, TDate date,
                        std::optional<BookingId> exclude) override;
        bool UserIsBusy(UserId user, const TTimeInterval& interval, TDate date,
                        std::optional<BookingId> exclude) override;

        TBooking Insert(TBooking booking) override;
        void Replace(const TBooking& booking) override;

    private:
        using TOccupancyKey = std::tuple<TableId, SlotId, int64_t>;

        void Reload();
        size_t Replay(const std::vector<nlohmann::json>& changes);
        void Record(const char* op, const TBooking& booking);
        void Compact();
        void CompactIfDue();
        void CheckOccupancy(const TBooking& booking) const;
        void Index(const TBooking& booking);
        void Unindex(const TBooking& booking);

        static nlohmann::json BookingToJson(const TBooking& b);

    private:
        std::shared_ptr<IStorage> Storage;
        std::shared_ptr<const ICatalog> Catalog;
        std::mutex Mutex_;
        std::unordered_map<BookingId, TBooking> Bookings;
        std::map<TOccupancyKey, BookingId> Occupancy;
        BookingId NextId = 1;
        uint64_t LastSeq = 0;
        size_t CompactEvery;
        size_t SinceCompact = 0;
    };

} // namespace NCafeBooking
