#pragma once
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>

#include "errors.hpp"

using json = nlohmann::json;

namespace NCafeBooking {

    using BookingId = uint64_t;
    using CafeId = uint64_t;
    using TableId = uint64_t;
    using SlotId = uint64_t;
    using UserId = uint64_t;

    enum class ERole {
        Customer,
        Manager,
        Admin
    };

    struct TActor {
        UserId Id = 0;
        std::string Name;
        ERole Role = ERole::Customer;
    };

    inline const char* RoleName(ERole role) {
        switch (role) {
            case ERole::Customer: return "customer";
            case ERole::Manager: return "manager";
            case ERole::Admin: return "admin";
        }
        return "customer";
    }

    inline std::optional<ERole> ParseRole(const std::string& s) {
        if (s == "customer" || s == "Customer") {
            return ERole::Customer;
        }
        if (s == "manager" || s == "Manager") {
            return ERole::Manager;
        }
        if (s == "admin" || s == "Admin") {
            return ERole::Admin;
        }
        return std::nullopt;
    }

    // Calendar date without a time component, stored as days since 1970-01-01.
    struct TDate {
        int64_t Days = 0;

        friend bool operator==(TDate a, TDate b) { return a.Days == b.Days; }
        friend bool operator!=(TDate a, TDate b) { return a.Days != b.Days; }
        friend bool operator<(TDate a, TDate b) { return a.Days < b.Days; }
        friend bool operator<=(TDate a, TDate b) { return a.Days <= b.Days; }
        friend bool operator>(TDate a, TDate b) { return a.Days > b.Days; }
        friend bool operator>=(TDate a, TDate b) { return a.Days >= b.Days; }

        TDate AddDays(int64_t n) const {
            return TDate{Days + n};
        }
    };

    inline TDate DateFromCivil(int64_t y, unsigned m, unsigned d) {
        y -= m <= 2 ? 1 : 0;
        const int64_t era = (y >= 0 ? y : y - 399) / 400;
        const auto yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return TDate{era * 146097 + static_cast<int64_t>(doe) - 719468};
    }

    inline void CivilFromDate(TDate date, int64_t& y, unsigned& m, unsigned& d) {
        const int64_t z = date.Days + 719468;
        const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const auto doe = static_cast<unsigned>(z - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        d = doy - (153 * mp + 2) / 5 + 1;
        m = mp < 10 ? mp + 3 : mp - 9;
        y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
    }

    // Accepts YYYY-MM-DD only.
    inline TDate ParseDate(const std::string& s) {
        int y = 0;
        unsigned m = 0;
        unsigned d = 0;
        char tail = 0;
        if (s.size() != 10 || std::sscanf(s.c_str(), "%4d-%2u-%2u%c", &y, &m, &d, &tail) != 3) {
            throw TBookingError(EErrorCode::ValidationError, "malformed date '" + s + "'");
        }
        TDate date = DateFromCivil(y, m, d);
        int64_t ry = 0;
        unsigned rm = 0;
        unsigned rd = 0;
        CivilFromDate(date, ry, rm, rd);
        if (ry != y || rm != m || rd != d) {
            throw TBookingError(EErrorCode::ValidationError, "no such date '" + s + "'");
        }
        return date;
    }

    inline std::string FormatDate(TDate date) {
        int64_t y = 0;
        unsigned m = 0;
        unsigned d = 0;
        CivilFromDate(date, y, m, d);
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u", static_cast<long long>(y), m, d);
        return buf;
    }

    // Minutes since midnight.
    struct TTimeOfDay {
        int Minutes = 0;

        friend bool operator==(TTimeOfDay a, TTimeOfDay b) { return a.Minutes == b.Minutes; }
        friend bool operator!=(TTimeOfDay a, TTimeOfDay b) { return a.Minutes != b.Minutes; }
        friend bool operator<(TTimeOfDay a, TTimeOfDay b) { return a.Minutes < b.Minutes; }
        friend bool operator<=(TTimeOfDay a, TTimeOfDay b) { return a.Minutes <= b.Minutes; }
    };

    inline TTimeOfDay MakeTime(int hours, int minutes) {
        if (hours < 0 || hours > 24 || minutes < 0 || minutes > 59 || (hours == 24 && minutes != 0)) {
            throw TBookingError(EErrorCode::ValidationError, "time of day out of range");
        }
        return TTimeOfDay{hours * 60 + minutes};
    }

    // Accepts HH:MM; 24:00 is allowed as an end-of-day bound.
    inline TTimeOfDay ParseTime(const std::string& s) {
        int h = 0;
        int m = 0;
        char tail = 0;
        if (s.size() != 5 || std::sscanf(s.c_str(), "%2d:%2d%c", &h, &m, &tail) != 2) {
            throw TBookingError(EErrorCode::ValidationError, "malformed time '" + s + "'");
        }
        return MakeTime(h, m);
    }

    inline std::string FormatTime(TTimeOfDay t) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "%02d:%02d", t.Minutes / 60, t.Minutes % 60);
        return buf;
    }

    inline bool IntervalsOverlap(TTimeOfDay a_start, TTimeOfDay a_end, TTimeOfDay b_start, TTimeOfDay b_end) {
        return a_start < b_end && b_start < a_end;
    }

    // Half-open [Start, End) time-of-day interval.
    struct TTimeInterval {
        TTimeOfDay Start;
        TTimeOfDay End;

        static TTimeInterval Make(TTimeOfDay start, TTimeOfDay end) {
            if (!(start < end)) {
                throw TBookingError(EErrorCode::InvalidTimeRange,
                                    FormatTime(start) + "-" + FormatTime(end));
            }
            return TTimeInterval{start, end};
        }

        bool Overlaps(const TTimeInterval& other) const {
            return IntervalsOverlap(Start, End, other.Start, other.End);
        }

        std::string ToString() const {
            return FormatTime(Start) + "-" + FormatTime(End);
        }
    };

    inline bool IntervalsOverlap(const TTimeInterval& a, const TTimeInterval& b) {
        return a.Overlaps(b);
    }

} // namespace NCafeBooking
