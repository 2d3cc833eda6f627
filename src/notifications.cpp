#include <notifications.hpp>
#include <logging.hpp>

namespace NCafeBooking {

    const char* EventName(EBookingEvent event) {
        switch (event) {
            case EBookingEvent::Created: return "booking_created";
            case EBookingEvent::Updated: return "booking_updated";
            case EBookingEvent::Confirmed: return "booking_confirmed";
            case EBookingEvent::Cancelled: return "booking_cancelled";
            case EBookingEvent::Completed: return "booking_finished";
        }
        return "booking_updated";
    }

    json BookingPayload(const TBooking& booking) {
        json j;
        ToJSON(j, booking);
        return j;
    }

    void TLoggingNotifier::Notify(EBookingEvent event, const json& payload) {
        LogInfo("notify", EventName(event), {{"booking", payload}});
    }

    TQueuedNotifier::TQueuedNotifier(std::shared_ptr<INotifier> inner)
        : Inner(std::move(inner))
        , Worker([this] { Run(); }) {
    }

    TQueuedNotifier::~TQueuedNotifier() {
        {
            std::lock_guard lk(Mutex_);
            Stopping = true;
        }
        Wakeup.notify_all();
        Worker.join();
    }

    void TQueuedNotifier::Notify(EBookingEvent event, const json& payload) {
        {
            std::lock_guard lk(Mutex_);
            Queue.emplace_back(event, payload);
        }
        Wakeup.notify_one();
    }

    void TQueuedNotifier::Flush() {
        std::unique_lock lk(Mutex_);
        Drained.wait(lk, [this] { return Queue.empty() && InFlight == 0; });
    }

    void TQueuedNotifier::Run() {
        std::unique_lock lk(Mutex_);
        while (true) {
            Wakeup.wait(lk, [this] { return Stopping || !Queue.empty(); });
            if (Queue.empty()) {
                break;
            }
            auto item = std::move(Queue.front());
            Queue.pop_front();
            ++InFlight;
            lk.unlock();
            try {
                Inner->Notify(item.first, item.second);
            } catch (const std::exception& e) {
                LogError("notify", "notification delivery failed",
                         {{"event", EventName(item.first)}, {"error", e.what()}});
            }
            lk.lock();
            --InFlight;
            if (Queue.empty() && InFlight == 0) {
                Drained.notify_all();
            }
        }
    }

} // namespace NCafeBooking
