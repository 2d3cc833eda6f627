#pragma once
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include <BookingManager.hpp>

namespace NCafeBooking::NTest {

    // 2030-05-10
    inline TDate Today() {
        return DateFromCivil(2030, 5, 10);
    }

    inline TDate Tomorrow() {
        return Today().AddDays(1);
    }

    inline TActor Customer(UserId id = 100) {
        return TActor{id, "customer" + std::to_string(id), ERole::Customer};
    }

    inline TActor Manager() {
        return TActor{2, "manager", ERole::Manager};
    }

    inline TActor Admin() {
        return TActor{1, "admin", ERole::Admin};
    }

    inline TSlot MakeSlot(SlotId id, CafeId cafe, const char* from, const char* to, bool active = true) {
        TSlot s;
        s.Id = id;
        s.Cafe = cafe;
        s.Interval = TTimeInterval{ParseTime(from), ParseTime(to)};
        s.Active = active;
        return s;
    }

    // Cafe 1 has tables 1 (4), 2 (2) and inactive 3; slot 3 is inactive.
    inline std::shared_ptr<TMemoryCatalog> MakeCatalog() {
        auto c = std::make_shared<TMemoryCatalog>();
        c->AddCafe(TCafe{1, "Central", true});
        c->AddCafe(TCafe{2, "Riverside", true});
        c->AddCafe(TCafe{3, "Harbour", true});
        c->AddCafe(TCafe{4, "Closed", false});

        c->AddTable(TTable{1, 1, 4, "window", true});
        c->AddTable(TTable{2, 1, 2, "bar", true});
        c->AddTable(TTable{3, 1, 4, "terrace", false});
        c->AddTable(TTable{20, 2, 6, "", true});
        c->AddTable(TTable{30, 3, 4, "", true});
        c->AddTable(TTable{40, 4, 4, "", true});

        c->AddSlot(MakeSlot(1, 1, "09:00", "10:00"));
        c->AddSlot(MakeSlot(2, 1, "10:00", "11:00"));
        c->AddSlot(MakeSlot(3, 1, "12:00", "13:00", false));
        c->AddSlot(MakeSlot(20, 2, "09:30", "10:30"));
        c->AddSlot(MakeSlot(30, 3, "10:00", "11:00"));
        c->AddSlot(MakeSlot(40, 4, "09:00", "10:00"));
        return c;
    }

    class TRecordingNotifier: public INotifier {
    public:
        void Notify(EBookingEvent event, const json& payload) override {
            std::lock_guard lk(Mutex_);
            Events.emplace_back(event, payload);
        }

        std::vector<std::pair<EBookingEvent, json>> Snapshot() {
            std::lock_guard lk(Mutex_);
            return Events;
        }

    private:
        std::mutex Mutex_;
        std::vector<std::pair<EBookingEvent, json>> Events;
    };

    class TFailingNotifier: public INotifier {
    public:
        void Notify(EBookingEvent, const json&) override {
            throw std::runtime_error("smtp unreachable");
        }
    };

    // Swallows log output for the lifetime of a test.
    class TQuietLog {
    public:
        TQuietLog() {
            SetLogSink(&Sink);
        }

        ~TQuietLog() {
            SetLogSink(nullptr);
        }

        std::string Text() const {
            return Sink.str();
        }

    private:
        std::ostringstream Sink;
    };

    struct TWorld {
        explicit TWorld(TBookingRules rules = {}, std::shared_ptr<INotifier> notifier = nullptr)
            : Catalog(MakeCatalog())
            , Storage(std::make_shared<TMemoryStorage>())
            , Repo(std::make_shared<TBookingRepository>(Storage, Catalog))
            , Clock(std::make_shared<TFixedClock>(Today()))
            , Events(std::make_shared<TRecordingNotifier>())
            , Engine(Catalog, Repo, notifier ? notifier : std::shared_ptr<INotifier>(Events), Clock, std::move(rules)) {
        }

        TCreateRequest Request(const TActor& actor, std::vector<TTableSlot> slots,
                               int guests = 2, CafeId cafe = 1, TDate date = Tomorrow()) {
            TCreateRequest req;
            req.Cafe = cafe;
            req.Date = date;
            req.GuestNumber = guests;
            req.TableSlots = std::move(slots);
            req.Actor = actor;
            return req;
        }

        TBooking Create(const TActor& actor, std::vector<TTableSlot> slots,
                        int guests = 2, CafeId cafe = 1, TDate date = Tomorrow()) {
            return Engine.CreateBooking(Request(actor, std::move(slots), guests, cafe, date));
        }

        TQuietLog Quiet;
        std::shared_ptr<TMemoryCatalog> Catalog;
        std::shared_ptr<TMemoryStorage> Storage;
        std::shared_ptr<TBookingRepository> Repo;
        std::shared_ptr<TFixedClock> Clock;
        std::shared_ptr<TRecordingNotifier> Events;
        TBookingManager Engine;
    };

    // Runs fn and returns the TBookingError code it throws.
    template <class F>
    EErrorCode CodeOf(F&& fn) {
        try {
            fn();
        } catch (const TBookingError& e) {
            return e.Code();
        }
        ADD_FAILURE() << "expected TBookingError";
        return EErrorCode::ValidationError;
    }

} // namespace NCafeBooking::NTest
