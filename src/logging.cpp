#include <logging.hpp>

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace NCafeBooking {

    namespace {

        std::atomic<ELogLevel> MinLevel{ELogLevel::Info};
        std::mutex SinkMutex_;
        std::ostream* Sink = &std::clog;

        std::string NowIso8601() {
            auto now = std::chrono::system_clock::now();
            std::time_t t = std::chrono::system_clock::to_time_t(now);
            std::tm tm{};
            gmtime_r(&t, &tm);
            std::stringstream ss;
            ss << std::put_time(&tm, "%FT%TZ");
            return ss.str();
        }

    } // namespace

    const char* LogLevelName(ELogLevel level) {
        switch (level) {
            case ELogLevel::Debug: return "debug";
            case ELogLevel::Info: return "info";
            case ELogLevel::Warn: return "warn";
            case ELogLevel::Error: return "error";
        }
        return "info";
    }

    std::optional<ELogLevel> ParseLogLevel(const std::string& s) {
        if (s == "debug") {
            return ELogLevel::Debug;
        }
        if (s == "info") {
            return ELogLevel::Info;
        }
        if (s == "warn" || s == "warning") {
            return ELogLevel::Warn;
        }
        if (s == "error") {
            return ELogLevel::Error;
        }
        return std::nullopt;
    }

    void SetLogLevel(ELogLevel level) {
        MinLevel.store(level);
    }

    ELogLevel GetLogLevel() {
        return MinLevel.load();
    }

    void SetLogSink(std::ostream* sink) {
        std::lock_guard lk(SinkMutex_);
        Sink = sink ? sink : &std::clog;
    }

    void Log(ELogLevel level, const std::string& component, const std::string& message,
             const nlohmann::json& fields) {
        if (level < MinLevel.load()) {
            return;
        }
        nlohmann::json entry = {
            {"level", LogLevelName(level)},
            {"message", message},
            {"component", component},
            {"timestamp", NowIso8601()}};
        if (fields.is_object()) {
            for (auto& [key, value] : fields.items()) {
                entry[key] = value;
            }
        }
        std::string line = entry.dump();
        std::lock_guard lk(SinkMutex_);
        *Sink << line << std::endl;
    }

} // namespace NCafeBooking
