#pragma once
#include <iosfwd>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace NCafeBooking {

    enum class ELogLevel {
        Debug,
        Info,
        Warn,
        Error
    };

    const char* LogLevelName(ELogLevel level);
    std::optional<ELogLevel> ParseLogLevel(const std::string& s);

    void SetLogLevel(ELogLevel level);
    ELogLevel GetLogLevel();

    // Defaults to std::clog. The stream must outlive every later Log call.
    void SetLogSink(std::ostream* sink);

    // One JSON object per line: level, message, component, timestamp, plus fields.
    void Log(ELogLevel level, const std::string& component, const std::string& message,
             const nlohmann::json& fields = nlohmann::json::object());

    inline void LogInfo(const std::string& component, const std::string& message,
                        const nlohmann::json& fields = nlohmann::json::object()) {
        Log(ELogLevel::Info, component, message, fields);
    }

    inline void LogWarn(const std::string& component, const std::string& message,
                        const nlohmann::json& fields = nlohmann::json::object()) {
        Log(ELogLevel::Warn, component, message, fields);
    }

    inline void LogError(const std::string& component, const std::string& message,
                         const nlohmann::json& fields = nlohmann::json::object()) {
        Log(ELogLevel::Error, component, message, fields);
    }

} // namespace NCafeBooking
