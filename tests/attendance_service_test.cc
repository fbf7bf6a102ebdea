#include <gtest/gtest.h>
#include "core/geofence_engine.h"
#include "service/approval_workflow.h"
#include "service/attendance_service.h"
#include "service/config_manager.h"
#include "service/temporary_workplace_handler.h"
#include "service/verification_session_controller.h"
#include "test_support.h"

using namespace service;
using testing_support::make_fix;
using testing_support::make_zone;
using testing_support::sample_with_ref;

class AttendanceServiceTest : public testing_support::DatabaseTest {
protected:
    testing_support::ManualClock clock{testing_support::local_time(8, 50)};
    testing_support::ScriptedVerificationProvider verifier;
    testing_support::FixedLocationProvider location;
    core::GeofenceEngine geofence;
    std::chrono::milliseconds timeout{1000};

    void SetUp() override {
        testing_support::DatabaseTest::SetUp();
        auto office = make_zone("Office", 37.7749, -122.4194, 100.0);
        auto yard = make_zone("Yard", 37.7900, -122.4194, 150.0);
        yard.allowed_methods = {db::PunchMethod::Gps};
        geofence.set_zones({office, yard});
    }

    PunchRequest request(db::PunchType type, const std::string& event) {
        PunchRequest r;
        r.user_id = 11;
        r.manager_id = 900;
        r.attendance_event_id = event;
        r.type = type;
        return r;
    }
};

TEST_F(AttendanceServiceTest, InZoneFaceVerificationAccepted) {
    VerificationSessionController sessions(verifier, clock.clock());
    ApprovalWorkflow approvals(clock.clock());
    TemporaryWorkplaceHandler temporary(approvals, clock.clock());
    AttendanceService service(geofence, location, sessions, temporary, approvals, clock.clock());

    location.set_fix(37.7749, -122.4194, 5.0);
    auto begun = service.begin_punch(request(db::PunchType::ClockIn, "2024-03-15-in"));
    ASSERT_TRUE(begun.ok()) << begun.message();
    EXPECT_FALSE(begun->accepted);
    ASSERT_TRUE(begun->session_id.has_value());
    EXPECT_EQ(begun->attendance_status, AttendanceStatus::Pending);
    EXPECT_TRUE(begun->zone_match.within_zone);

    verifier.push_outcome(true, 96.0f);
    auto done = service.submit_verification(*begun->session_id, sample_with_ref("f.jpg"), timeout);
    ASSERT_TRUE(done.ok()) << done.message();
    EXPECT_TRUE(done->accepted);
    EXPECT_EQ(done->attendance_status, AttendanceStatus::Normal);
    EXPECT_TRUE(done->pending_approval_ids.empty());
    EXPECT_EQ(done->zone_match.zone->name, "Office");
}

TEST_F(AttendanceServiceTest, LateClockInRaisesApproval) {
    VerificationSessionController sessions(verifier, clock.clock());
    ApprovalWorkflow approvals(clock.clock());
    TemporaryWorkplaceHandler temporary(approvals, clock.clock());
    AttendanceService service(geofence, location, sessions, temporary, approvals, clock.clock());

    clock.set(testing_support::local_time(9, 45));
    PunchRequest r = request(db::PunchType::ClockIn, "2024-03-15-in");
    r.fix = make_fix(37.7749, -122.4194, 5.0);
    auto begun = service.begin_punch(r);
    ASSERT_TRUE(begun.ok());

    verifier.push_outcome(true, 90.0f);
    auto done = service.submit_verification(*begun->session_id, sample_with_ref("f.jpg"), timeout);
    ASSERT_TRUE(done.ok());
    EXPECT_EQ(done->attendance_status, AttendanceStatus::Late);
    ASSERT_EQ(done->pending_approval_ids.size(), 1u);

    auto approval = approvals.get(done->pending_approval_ids[0]);
    ASSERT_TRUE(approval.has_value());
    EXPECT_EQ(approval->type, db::ApprovalType::Late);
    EXPECT_EQ(approval->source_event_id, "2024-03-15-in");
    EXPECT_EQ(approval->manager_id, 900);
}

TEST_F(AttendanceServiceTest, ClassifyWorkingHours) {
    VerificationSessionController sessions(verifier, clock.clock());
    ApprovalWorkflow approvals(clock.clock());
    TemporaryWorkplaceHandler temporary(approvals, clock.clock());
    AttendanceService service(geofence, location, sessions, temporary, approvals, clock.clock());
    using testing_support::local_time;

    EXPECT_EQ(service.classify(db::PunchType::ClockIn, local_time(9, 30)), AttendanceStatus::Normal);
    EXPECT_EQ(service.classify(db::PunchType::ClockIn, local_time(9, 31)), AttendanceStatus::Late);
    EXPECT_EQ(service.classify(db::PunchType::ClockOut, local_time(17, 29)), AttendanceStatus::EarlyLeave);
    EXPECT_EQ(service.classify(db::PunchType::ClockOut, local_time(17, 30)), AttendanceStatus::Normal);
    EXPECT_EQ(service.classify(db::PunchType::ClockOut, local_time(19, 0)), AttendanceStatus::Normal);
    EXPECT_EQ(service.classify(db::PunchType::ClockOut, local_time(19, 1)), AttendanceStatus::Overtime);
}

TEST_F(AttendanceServiceTest, GpsOnlyZoneAcceptsWithoutSession) {
    VerificationSessionController sessions(verifier, clock.clock());
    ApprovalWorkflow approvals(clock.clock());
    TemporaryWorkplaceHandler temporary(approvals, clock.clock());
    AttendanceService service(geofence, location, sessions, temporary, approvals, clock.clock());

    location.set_fix(37.7900, -122.4194, 5.0);
    auto r = service.begin_punch(request(db::PunchType::ClockIn, "evt"));
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r->accepted);
    EXPECT_FALSE(r->session_id.has_value());
    EXPECT_EQ(sessions.open_session_count(), 0u);
    EXPECT_EQ(verifier.calls(), 0);
}

TEST_F(AttendanceServiceTest, LocationFailures) {
    VerificationSessionController sessions(verifier, clock.clock());
    ApprovalWorkflow approvals(clock.clock());
    TemporaryWorkplaceHandler temporary(approvals, clock.clock());
    AttendanceService service(geofence, location, sessions, temporary, approvals, clock.clock());

    location.fail(LocationFailure::PermissionDenied);
    auto denied = service.begin_punch(request(db::PunchType::ClockIn, "evt"));
    EXPECT_EQ(denied.code(), core::ErrorCode::LocationUnavailable);

    location.set_fix(37.7749, -122.4194, 250.0);
    auto coarse = service.begin_punch(request(db::PunchType::ClockIn, "evt"));
    EXPECT_EQ(coarse.code(), core::ErrorCode::LocationUnavailable);
    EXPECT_EQ(sessions.open_session_count(), 0u);
}

TEST_F(AttendanceServiceTest, OutOfZoneGoesToTemporaryWorkplace) {
    VerificationSessionController sessions(verifier, clock.clock());
    ApprovalWorkflow approvals(clock.clock());
    TemporaryWorkplaceHandler temporary(approvals, clock.clock());
    AttendanceService service(geofence, location, sessions, temporary, approvals, clock.clock());

    location.set_fix(37.7800, -122.4100, 5.0);
    PunchRequest r = request(db::PunchType::ClockIn, "evt-temp");
    r.reason = "customer visit";
    auto result = service.begin_punch(r);
    ASSERT_TRUE(result.ok()) << result.message();
    EXPECT_FALSE(result->accepted);
    EXPECT_FALSE(result->zone_match.within_zone);
    ASSERT_TRUE(result->record_id.has_value());
    ASSERT_EQ(result->pending_approval_ids.size(), 1u);
    EXPECT_EQ(approvals.get(result->pending_approval_ids[0])->type, db::ApprovalType::TemporaryWorkplace);

    r.reason.clear();
    EXPECT_EQ(service.begin_punch(r).code(), core::ErrorCode::MissingReason);
}

TEST_F(AttendanceServiceTest, OutOfZoneRejectedWhenTemporaryDisabled) {
    AttendancePolicy policy = ConfigManager::instance().policy();
    policy.temporary_workplace.enabled = false;
    ConfigManager::instance().set_policy(policy);

    VerificationSessionController sessions(verifier, clock.clock());
    ApprovalWorkflow approvals(clock.clock());
    TemporaryWorkplaceHandler temporary(approvals, clock.clock());
    AttendanceService service(geofence, location, sessions, temporary, approvals, clock.clock());

    location.set_fix(37.7800, -122.4100, 5.0);
    auto r = service.begin_punch(request(db::PunchType::ClockIn, "evt"));
    EXPECT_EQ(r.code(), core::ErrorCode::ZoneMismatch);
}

TEST_F(AttendanceServiceTest, FailedVerificationRequiresReRegistration) {
    VerificationSessionController sessions(verifier, clock.clock());
    ApprovalWorkflow approvals(clock.clock());
    TemporaryWorkplaceHandler temporary(approvals, clock.clock());
    AttendanceService service(geofence, location, sessions, temporary, approvals, clock.clock());

    location.set_fix(37.7749, -122.4194, 5.0);
    auto begun = service.begin_punch(request(db::PunchType::ClockOut, "evt-out"));
    ASSERT_TRUE(begun.ok());
    int64_t id = *begun->session_id;

    EXPECT_EQ(service.submit_verification(id, sample_with_ref("a"), timeout).code(), core::ErrorCode::VerificationFailed);
    EXPECT_EQ(service.submit_verification(id, sample_with_ref("b"), timeout).code(), core::ErrorCode::VerificationFailed);
    EXPECT_EQ(service.submit_verification(id, sample_with_ref("c"), timeout).code(), core::ErrorCode::MaxAttemptsExceeded);
    // 验证失败不产生审批单
    EXPECT_TRUE(approvals.pending().empty());
}

TEST_F(AttendanceServiceTest, CancelPunch) {
    VerificationSessionController sessions(verifier, clock.clock());
    ApprovalWorkflow approvals(clock.clock());
    TemporaryWorkplaceHandler temporary(approvals, clock.clock());
    AttendanceService service(geofence, location, sessions, temporary, approvals, clock.clock());

    location.set_fix(37.7749, -122.4194, 5.0);
    auto begun = service.begin_punch(request(db::PunchType::ClockIn, "evt"));
    ASSERT_TRUE(begun.ok());

    EXPECT_TRUE(service.cancel_punch(*begun->session_id).ok());
    EXPECT_EQ(service.cancel_punch(*begun->session_id).code(), core::ErrorCode::InvalidTransition);
    EXPECT_TRUE(approvals.pending().empty());

    // 取消后同一事件可以重新打卡
    EXPECT_TRUE(service.begin_punch(request(db::PunchType::ClockIn, "evt")).ok());
}
