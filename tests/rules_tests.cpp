#include <gtest/gtest.h>

#include "test_helpers.hpp"

using namespace NCafeBooking;
using namespace NCafeBooking::NTest;

namespace {

    struct TValidatorWorld {
        TValidatorWorld()
            : Catalog(MakeCatalog())
            , Repo(std::make_shared<TBookingRepository>(std::make_shared<TMemoryStorage>(), Catalog))
            , Validator(Catalog, Repo) {
        }

        void Hold(UserId owner, std::vector<TTableSlot> slots, CafeId cafe = 1) {
            TBooking b;
            b.Owner = owner;
            b.Cafe = cafe;
            b.Date = Tomorrow();
            b.GuestNumber = 1;
            b.TableSlots = std::move(slots);
            Repo->Insert(b);
        }

        EErrorCode Check(std::vector<TTableSlot> slots, int guests = 2, UserId owner = 100, CafeId cafe = 1) {
            return CodeOf([&] { Validator.ValidateAssignments(slots, cafe, Tomorrow(), owner, guests); });
        }

        TQuietLog Quiet;
        std::shared_ptr<TMemoryCatalog> Catalog;
        std::shared_ptr<TBookingRepository> Repo;
        TBookingValidator Validator;
    };

} // namespace

TEST(Validator, AcceptsFreeAssignment) {
    TValidatorWorld w;
    auto res = w.Validator.ValidateAssignments({{1, 1}, {2, 1}}, 1, Tomorrow(), 100, 6);
    EXPECT_EQ(res.TotalSeats, 6);
    EXPECT_EQ(res.Tables.size(), 2u);
}

TEST(Validator, SeatsCountDistinctTables) {
    TValidatorWorld w;
    // Table 1 twice across two slots still gives 4 seats.
    auto res = w.Validator.ValidateAssignments({{1, 1}, {1, 2}}, 1, Tomorrow(), 100, 4);
    EXPECT_EQ(res.TotalSeats, 4);
    EXPECT_EQ(w.Check({{1, 1}, {1, 2}}, 5), EErrorCode::NotEnoughSeats);
}

TEST(Validator, ResolutionErrors) {
    TValidatorWorld w;
    EXPECT_EQ(w.Check({{99, 1}}), EErrorCode::TableNotFound);
    EXPECT_EQ(w.Check({{20, 1}}), EErrorCode::TableNotFound);
    EXPECT_EQ(w.Check({{3, 1}}), EErrorCode::TableInactive);
    EXPECT_EQ(w.Check({{1, 99}}), EErrorCode::SlotNotFound);
    EXPECT_EQ(w.Check({{1, 20}}), EErrorCode::SlotNotFound);
    EXPECT_EQ(w.Check({{1, 3}}), EErrorCode::SlotInactive);
}

TEST(Validator, TableCheckedBeforeSlot) {
    TValidatorWorld w;
    // Both table and slot are bad; the table error wins.
    EXPECT_EQ(w.Check({{3, 99}}), EErrorCode::TableInactive);
    // Inactive slot wins over occupancy.
    w.Hold(200, {{1, 1}});
    w.Catalog->SetSlotActive(1, false);
    EXPECT_EQ(w.Check({{1, 1}}), EErrorCode::SlotInactive);
}

TEST(Validator, OccupancyBeforeUserConflict) {
    TValidatorWorld w;
    w.Hold(100, {{1, 1}});
    // Same user, same seat: the seat is reported first.
    EXPECT_EQ(w.Check({{1, 1}}, 2, 100), EErrorCode::TableAlreadyBooked);
    EXPECT_EQ(w.Check({{2, 1}}, 2, 100), EErrorCode::UserAlreadyBooked);
    EXPECT_NO_THROW(w.Validator.ValidateAssignments({{2, 1}}, 1, Tomorrow(), 200, 2));
}

TEST(Validator, UserConflictSpansCafes) {
    TValidatorWorld w;
    w.Hold(100, {{1, 1}});
    EXPECT_EQ(w.Check({{20, 20}}, 2, 100, 2), EErrorCode::UserAlreadyBooked);
    EXPECT_NO_THROW(w.Validator.ValidateAssignments({{30, 30}}, 3, Tomorrow(), 100, 2));
}

TEST(Validator, CapacityCheckedAfterAssignments) {
    TValidatorWorld w;
    EXPECT_EQ(w.Check({{2, 1}}, 3), EErrorCode::NotEnoughSeats);
    EXPECT_NO_THROW(w.Validator.ValidateAssignments({{2, 1}}, 1, Tomorrow(), 100, 2));
    // A later bad assignment is reported even if capacity would also fail.
    EXPECT_EQ(w.Check({{2, 1}, {99, 1}}, 50), EErrorCode::TableNotFound);
}

TEST(Validator, BookingDate) {
    TValidatorWorld w;
    EXPECT_EQ(CodeOf([&] { w.Validator.ValidateBookingDate(Today(), Today()); }), EErrorCode::BookingPastDate);
    EXPECT_EQ(CodeOf([&] { w.Validator.ValidateBookingDate(Today().AddDays(-3), Today()); }), EErrorCode::BookingPastDate);
    EXPECT_NO_THROW(w.Validator.ValidateBookingDate(Tomorrow(), Today()));
    EXPECT_NO_THROW(w.Validator.ValidateBookingDate(Today().AddDays(5000), Today()));

    TBookingValidator limited(w.Catalog, w.Repo, 30);
    EXPECT_NO_THROW(limited.ValidateBookingDate(Today().AddDays(30), Today()));
    EXPECT_EQ(CodeOf([&] { limited.ValidateBookingDate(Today().AddDays(31), Today()); }), EErrorCode::ValidationError);
}

TEST(Validator, CafeAndScalarChecks) {
    TValidatorWorld w;
    EXPECT_EQ(w.Validator.ValidateCafe(1).Name, "Central");
    EXPECT_EQ(CodeOf([&] { w.Validator.ValidateCafe(99); }), EErrorCode::CafeNotFound);
    EXPECT_EQ(CodeOf([&] { w.Validator.ValidateCafe(4); }), EErrorCode::CafeInactive);

    EXPECT_EQ(CodeOf([] { TBookingValidator::ValidateGuestNumber(0); }), EErrorCode::ValidationError);
    EXPECT_EQ(CodeOf([] { TBookingValidator::ValidateAssignmentSet({}); }), EErrorCode::ValidationError);
    EXPECT_EQ(CodeOf([] { TBookingValidator::ValidateAssignmentSet({{1, 1}, {1, 1}}); }), EErrorCode::ValidationError);
    EXPECT_EQ(CodeOf([] { TBookingValidator::ValidateNote(std::string(MAX_BOOKING_NOTE_LENGTH + 1, 'x')); }),
              EErrorCode::ValidationError);
    EXPECT_NO_THROW(TBookingValidator::ValidateNote(std::string(MAX_BOOKING_NOTE_LENGTH, 'x')));
}

TEST(Lifecycle, DefaultMatrix) {
    TBookingLifecycle lc;
    EXPECT_EQ(lc.ApplyTransition(EBookingStatus::Pending, EBookingStatus::Cancelled, ERole::Customer),
              EBookingStatus::Cancelled);
    EXPECT_EQ(lc.ApplyTransition(EBookingStatus::Pending, EBookingStatus::Confirmed, ERole::Manager),
              EBookingStatus::Confirmed);
    EXPECT_EQ(lc.ApplyTransition(EBookingStatus::Confirmed, EBookingStatus::Completed, ERole::Manager),
              EBookingStatus::Completed);
    EXPECT_EQ(lc.ApplyTransition(EBookingStatus::Cancelled, EBookingStatus::Pending, ERole::Admin),
              EBookingStatus::Pending);

    EXPECT_EQ(CodeOf([&] { lc.ApplyTransition(EBookingStatus::Pending, EBookingStatus::Confirmed, ERole::Customer); }),
              EErrorCode::InvalidStatusTransition);
    EXPECT_EQ(CodeOf([&] { lc.ApplyTransition(EBookingStatus::Confirmed, EBookingStatus::Cancelled, ERole::Customer); }),
              EErrorCode::InvalidStatusTransition);
    EXPECT_EQ(CodeOf([&] { lc.ApplyTransition(EBookingStatus::Cancelled, EBookingStatus::Pending, ERole::Manager); }),
              EErrorCode::InvalidStatusTransition);
    EXPECT_EQ(CodeOf([&] { lc.ApplyTransition(EBookingStatus::Pending, EBookingStatus::Completed, ERole::Manager); }),
              EErrorCode::InvalidStatusTransition);
}

TEST(Lifecycle, SameStatusIsNoOp) {
    TBookingLifecycle lc;
    EXPECT_EQ(lc.ApplyTransition(EBookingStatus::Completed, EBookingStatus::Completed, ERole::Customer),
              EBookingStatus::Completed);
}

TEST(Lifecycle, ActiveFlagFollowsStatus) {
    EXPECT_TRUE(TBookingLifecycle::ResolveActive(EBookingStatus::Pending, std::nullopt));
    EXPECT_TRUE(TBookingLifecycle::ResolveActive(EBookingStatus::Confirmed, true));
    EXPECT_FALSE(TBookingLifecycle::ResolveActive(EBookingStatus::Cancelled, std::nullopt));
    EXPECT_FALSE(TBookingLifecycle::ResolveActive(EBookingStatus::Completed, false));

    EXPECT_EQ(CodeOf([] { TBookingLifecycle::ResolveActive(EBookingStatus::Cancelled, true); }),
              EErrorCode::CannotActivateInactiveStatus);
    EXPECT_EQ(CodeOf([] { TBookingLifecycle::ResolveActive(EBookingStatus::Pending, false); }),
              EErrorCode::CannotDeactivateActiveStatus);
}

TEST(Lifecycle, Permission) {
    TBooking b;
    b.Owner = 100;
    EXPECT_NO_THROW(TBookingLifecycle::CheckPermission(Customer(100), b));
    EXPECT_NO_THROW(TBookingLifecycle::CheckPermission(Manager(), b));
    EXPECT_NO_THROW(TBookingLifecycle::CheckPermission(Admin(), b));
    EXPECT_EQ(CodeOf([&] { TBookingLifecycle::CheckPermission(Customer(200), b); }), EErrorCode::InsufficientPermissions);
}

TEST(Lifecycle, MatrixFromJson) {
    auto m = TTransitionMatrix::FromJson(json::parse(R"({
        "customer": {"pending": ["cancelled"], "confirmed": ["cancelled"]},
        "admin": {"cancelled": ["pending"]}
    })"));
    EXPECT_TRUE(m.IsAllowed(ERole::Customer, EBookingStatus::Confirmed, EBookingStatus::Cancelled));
    EXPECT_TRUE(m.IsAllowed(ERole::Admin, EBookingStatus::Cancelled, EBookingStatus::Pending));
    EXPECT_FALSE(m.IsAllowed(ERole::Admin, EBookingStatus::Pending, EBookingStatus::Cancelled));
    EXPECT_FALSE(m.IsAllowed(ERole::Manager, EBookingStatus::Pending, EBookingStatus::Confirmed));

    EXPECT_THROW(TTransitionMatrix::FromJson(json::parse(R"({"customer": {"gone": []}})")), std::runtime_error);
    EXPECT_THROW(TTransitionMatrix::FromJson(json::parse(R"({"customer": {"pending": ["gone"]}})")), std::runtime_error);
}
