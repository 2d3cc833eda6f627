#pragma once
#include <set>
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <algorithm>

#include "common.hpp"

namespace NCafeBooking {

    enum class EBookingStatus {
        Pending,
        Confirmed,
        Cancelled,
        Completed
    };

    inline const char* StatusName(EBookingStatus s) {
        switch (s) {
            case EBookingStatus::Pending: return "pending";
            case EBookingStatus::Confirmed: return "confirmed";
            case EBookingStatus::Cancelled: return "cancelled";
            case EBookingStatus::Completed: return "completed";
        }
        return "pending";
    }

    inline std::optional<EBookingStatus> ParseStatus(const std::string& s) {
        if (s == "pending") {
            return EBookingStatus::Pending;
        }
        if (s == "confirmed") {
            return EBookingStatus::Confirmed;
        }
        if (s == "cancelled") {
            return EBookingStatus::Cancelled;
        }
        if (s == "completed") {
            return EBookingStatus::Completed;
        }
        return std::nullopt;
    }

    struct TCafe {
        CafeId Id = 0;
        std::string Name;
        bool Active = true;
    };

    struct TTable {
        TableId Id = 0;
        CafeId Cafe = 0;
        int Seats = 1;
        std::string Description;
        bool Active = true;
    };

    struct TSlot {
        SlotId Id = 0;
        CafeId Cafe = 0;
        TTimeInterval Interval;
        bool Active = true;
    };

    struct TTableSlot {
        TableId Table = 0;
        SlotId Slot = 0;

        friend bool operator==(const TTableSlot& a, const TTableSlot& b) {
            return a.Table == b.Table && a.Slot == b.Slot;
        }
        friend bool operator<(const TTableSlot& a, const TTableSlot& b) {
            return a.Table != b.Table ? a.Table < b.Table : a.Slot < b.Slot;
        }
    };

    inline bool SameAssignmentSet(const std::vector<TTableSlot>& a, const std::vector<TTableSlot>& b) {
        return std::set<TTableSlot>(a.begin(), a.end()) == std::set<TTableSlot>(b.begin(), b.end());
    }

    struct TBooking {
        BookingId Id = 0;
        UserId Owner = 0;
        CafeId Cafe = 0;
        TDate Date;
        int GuestNumber = 0;
        EBookingStatus Status = EBookingStatus::Pending;
        bool Active = true;
        std::string Note;
        std::chrono::system_clock::time_point CreatedAt;
        std::chrono::system_clock::time_point UpdatedAt;
        std::vector<TTableSlot> TableSlots;
    };

    // Holds a table/slot pair on its date.
    inline bool IsOccupying(const TBooking& b) {
        return b.Active && (b.Status == EBookingStatus::Pending || b.Status == EBookingStatus::Confirmed);
    }

    struct TCreateRequest {
        CafeId Cafe = 0;
        TDate Date;
        int GuestNumber = 0;
        std::vector<TTableSlot> TableSlots;
        std::string Note;
        TActor Actor;
    };

    // Every field is optional; an unset field keeps the stored value.
    struct TBookingPatch {
        std::optional<CafeId> Cafe;
        std::optional<TDate> Date;
        std::optional<int> GuestNumber;
        std::optional<std::string> Note;
        std::optional<EBookingStatus> Status;
        std::optional<bool> Active;
        std::optional<std::vector<TTableSlot>> TableSlots;

        bool Empty() const {
            return !Cafe && !Date && !GuestNumber && !Note && !Status && !Active && !TableSlots;
        }
    };

    inline long long ToEpochSeconds(std::chrono::system_clock::time_point tp) {
        return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    }

    inline std::chrono::system_clock::time_point FromEpochSeconds(long long s) {
        return std::chrono::system_clock::time_point(std::chrono::seconds(s));
    }

    inline void ToJSON(json& j, const TBooking& b) {
        j = json{{"id", b.Id},
                 {"user_id", b.Owner},
                 {"cafe_id", b.Cafe},
                 {"booking_date", FormatDate(b.Date)},
                 {"guest_number", b.GuestNumber},
                 {"status", StatusName(b.Status)},
                 {"active", b.Active},
                 {"note", b.Note},
                 {"created_at", ToEpochSeconds(b.CreatedAt)},
                 {"updated_at", ToEpochSeconds(b.UpdatedAt)}};
        j["table_slots"] = json::array();
        for (const auto& ts : b.TableSlots) {
            j["table_slots"].push_back({{"table_id", ts.Table}, {"slot_id", ts.Slot}});
        }
    }

    inline void FromJSON(const json& j, TBooking& b) {
        b.Id = j.at("id").get<BookingId>();
        b.Owner = j.at("user_id").get<UserId>();
        b.Cafe = j.at("cafe_id").get<CafeId>();
        b.Date = ParseDate(j.at("booking_date").get<std::string>());
        b.GuestNumber = j.at("guest_number").get<int>();
        auto status = ParseStatus(j.at("status").get<std::string>());
        if (!status) {
            throw std::runtime_error("Unknown booking status in record " + std::to_string(b.Id));
        }
        b.Status = *status;
        b.Active = j.at("active").get<bool>();
        b.Note = j.value("note", "");
        b.CreatedAt = FromEpochSeconds(j.value("created_at", 0LL));
        b.UpdatedAt = FromEpochSeconds(j.value("updated_at", 0LL));
        b.TableSlots.clear();
        if (j.contains("table_slots") && j["table_slots"].is_array()) {
            for (const auto& ts : j["table_slots"]) {
                b.TableSlots.push_back(TTableSlot{ts.at("table_id").get<TableId>(), ts.at("slot_id").get<SlotId>()});
            }
        }
    }

} // namespace NCafeBooking
