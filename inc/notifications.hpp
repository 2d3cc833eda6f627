#pragma once
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

#include "models.hpp"

namespace NCafeBooking {

    enum class EBookingEvent {
        Created,
        Updated,
        Confirmed,
        Cancelled,
        Completed
    };

    const char* EventName(EBookingEvent event);

    json BookingPayload(const TBooking& booking);

    // Side-effect sink. Failures must never undo a committed booking.
    struct INotifier {
        virtual ~INotifier() = default;
        virtual void Notify(EBookingEvent event, const json& payload) = 0;
    };

    // Writes each event as an info log line.
    class TLoggingNotifier: public INotifier {
    public:
        void Notify(EBookingEvent event, const json& payload) override;
    };

    // Delivers on a worker thread; inner errors are logged and dropped.
    class TQueuedNotifier: public INotifier {
    public:
        explicit TQueuedNotifier(std::shared_ptr<INotifier> inner);
        ~TQueuedNotifier() override;

        TQueuedNotifier(const TQueuedNotifier&) = delete;
        TQueuedNotifier& operator=(const TQueuedNotifier&) = delete;

        void Notify(EBookingEvent event, const json& payload) override;

        // Blocks until every event queued so far has been handed to the inner notifier.
        void Flush();

    private:
        void Run();

    private:
        std::shared_ptr<INotifier> Inner;
        std::mutex Mutex_;
        std::condition_variable Wakeup;
        std::condition_variable Drained;
        std::deque<std::pair<EBookingEvent, json>> Queue;
        size_t InFlight = 0;
        bool Stopping = false;
        std::thread Worker;
    };

} // namespace NCafeBooking
