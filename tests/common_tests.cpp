#include <gtest/gtest.h>

#include <common.hpp>
#include <models.hpp>

using namespace NCafeBooking;

static TTimeInterval Interval(const char* from, const char* to) {
    return TTimeInterval::Make(ParseTime(from), ParseTime(to));
}

TEST(Overlap, PartialOverlapBothWays) {
    auto a = Interval("09:00", "10:00");
    auto b = Interval("09:30", "10:30");
    EXPECT_TRUE(IntervalsOverlap(a, b));
    EXPECT_TRUE(IntervalsOverlap(b, a));
}

TEST(Overlap, TouchingEndpointsDoNotOverlap) {
    auto a = Interval("09:00", "10:00");
    auto b = Interval("10:00", "11:00");
    EXPECT_FALSE(IntervalsOverlap(a, b));
    EXPECT_FALSE(IntervalsOverlap(b, a));
}

TEST(Overlap, ContainedIntervalOverlaps) {
    auto outer = Interval("08:00", "12:00");
    auto inner = Interval("09:00", "10:00");
    EXPECT_TRUE(IntervalsOverlap(outer, inner));
    EXPECT_TRUE(IntervalsOverlap(inner, outer));
    EXPECT_TRUE(IntervalsOverlap(inner, inner));
}

TEST(Overlap, IsSymmetricOverHourGrid) {
    for (int as = 0; as < 24; ++as) {
        for (int ae = as + 1; ae <= 24; ae += 3) {
            for (int bs = 0; bs < 24; bs += 2) {
                for (int be = bs + 1; be <= 24; be += 5) {
                    auto a = TTimeInterval::Make(MakeTime(as, 0), MakeTime(ae, 0));
                    auto b = TTimeInterval::Make(MakeTime(bs, 0), MakeTime(be, 0));
                    ASSERT_EQ(IntervalsOverlap(a, b), IntervalsOverlap(b, a));
                }
            }
        }
    }
}

TEST(Overlap, EmptyOrReversedIntervalRejected) {
    try {
        Interval("10:00", "10:00");
        FAIL() << "expected InvalidTimeRange";
    } catch (const TBookingError& e) {
        EXPECT_EQ(e.Code(), EErrorCode::InvalidTimeRange);
        EXPECT_EQ(e.Kind(), EErrorKind::Validation);
    }
    EXPECT_THROW(Interval("11:00", "10:00"), TBookingError);
}

TEST(Time, ParseAndFormat) {
    EXPECT_EQ(ParseTime("09:30").Minutes, 9 * 60 + 30);
    EXPECT_EQ(ParseTime("24:00").Minutes, 24 * 60);
    EXPECT_EQ(FormatTime(MakeTime(7, 5)), "07:05");
    EXPECT_EQ(Interval("09:00", "10:30").ToString(), "09:00-10:30");
}

TEST(Time, MalformedTimeRejected) {
    EXPECT_THROW(ParseTime("9:30"), TBookingError);
    EXPECT_THROW(ParseTime("25:00"), TBookingError);
    EXPECT_THROW(ParseTime("10:60"), TBookingError);
    EXPECT_THROW(ParseTime("24:01"), TBookingError);
    EXPECT_THROW(ParseTime("ab:cd"), TBookingError);
}

TEST(Date, ParseFormatRoundTrip) {
    TDate d = ParseDate("2030-05-10");
    EXPECT_EQ(FormatDate(d), "2030-05-10");
    EXPECT_EQ(FormatDate(d.AddDays(22)), "2030-06-01");
    EXPECT_EQ(ParseDate("1970-01-01").Days, 0);
    EXPECT_EQ(FormatDate(ParseDate("2028-02-29")), "2028-02-29");
}

TEST(Date, InvalidDatesRejected) {
    EXPECT_THROW(ParseDate("2030-02-30"), TBookingError);
    EXPECT_THROW(ParseDate("2029-02-29"), TBookingError);
    EXPECT_THROW(ParseDate("2030-13-01"), TBookingError);
    EXPECT_THROW(ParseDate("2030-5-10"), TBookingError);
    EXPECT_THROW(ParseDate("tomorrow"), TBookingError);
}

TEST(Date, Ordering) {
    TDate a = ParseDate("2030-12-31");
    TDate b = ParseDate("2031-01-01");
    EXPECT_LT(a, b);
    EXPECT_EQ(a.AddDays(1), b);
}

TEST(Errors, CodesMapToKinds) {
    EXPECT_EQ(KindOf(EErrorCode::TableAlreadyBooked), EErrorKind::Conflict);
    EXPECT_EQ(KindOf(EErrorCode::UserAlreadyBooked), EErrorKind::Conflict);
    EXPECT_EQ(KindOf(EErrorCode::NotEnoughSeats), EErrorKind::Capacity);
    EXPECT_EQ(KindOf(EErrorCode::SlotInactive), EErrorKind::InactiveResource);
    EXPECT_EQ(KindOf(EErrorCode::BookingPastDate), EErrorKind::Temporal);
    EXPECT_EQ(KindOf(EErrorCode::InsufficientPermissions), EErrorKind::Permission);
    EXPECT_EQ(KindOf(EErrorCode::InvalidStatusTransition), EErrorKind::State);

    TBookingError e(EErrorCode::TableAlreadyBooked, "table 1");
    EXPECT_TRUE(e.IsConflict());
    EXPECT_STREQ(e.what(), "table_already_booked: table 1");
}

TEST(Models, BookingJsonRoundTrip) {
    TBooking b;
    b.Id = 7;
    b.Owner = 100;
    b.Cafe = 1;
    b.Date = ParseDate("2030-05-11");
    b.GuestNumber = 3;
    b.Status = EBookingStatus::Confirmed;
    b.Note = "birthday";
    b.TableSlots = {{1, 1}, {2, 1}};

    json j;
    ToJSON(j, b);
    EXPECT_EQ(j["booking_date"].get<std::string>(), "2030-05-11");
    EXPECT_EQ(j["status"].get<std::string>(), "confirmed");
    EXPECT_EQ(j["table_slots"].size(), 2u);

    TBooking back;
    FromJSON(j, back);
    EXPECT_EQ(back.Id, 7u);
    EXPECT_EQ(back.Date, b.Date);
    EXPECT_EQ(back.Status, EBookingStatus::Confirmed);
    EXPECT_EQ(back.TableSlots, b.TableSlots);
}

TEST(Models, AssignmentSetIgnoresOrder) {
    EXPECT_TRUE(SameAssignmentSet({{1, 1}, {2, 1}}, {{2, 1}, {1, 1}}));
    EXPECT_FALSE(SameAssignmentSet({{1, 1}}, {{1, 2}}));
}

TEST(Models, OnlyActivePendingOrConfirmedOccupies) {
    TBooking b;
    EXPECT_TRUE(IsOccupying(b));
    b.Status = EBookingStatus::Confirmed;
    EXPECT_TRUE(IsOccupying(b));
    b.Active = false;
    EXPECT_FALSE(IsOccupying(b));
    b.Active = true;
    b.Status = EBookingStatus::Cancelled;
    EXPECT_FALSE(IsOccupying(b));
}
