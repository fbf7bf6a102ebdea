#include <gtest/gtest.h>
#include "database/approval_dao.h"
#include "database/database_manager.h"
#include "database/session_dao.h"
#include "database/temporary_workplace_dao.h"
#include "database/zone_dao.h"
#include "test_support.h"

using testing_support::make_fix;
using testing_support::make_zone;

class DaoTest : public testing_support::DatabaseTest {};

TEST_F(DaoTest, ZoneCrud) {
    db::ZoneDao dao;
    auto zone = make_zone("Plant", 22.5431, 114.0579, 300.0);
    zone.address = "Nanshan";
    zone.allowed_methods = {db::PunchMethod::Face, db::PunchMethod::Manual};
    int64_t id = dao.add_zone(zone);
    ASSERT_GT(id, 0);

    auto stored = dao.get_zone(id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->address, "Nanshan");
    EXPECT_EQ(stored->allowed_methods, zone.allowed_methods);

    stored->radius_meters = 450.0;
    EXPECT_TRUE(dao.update_zone(*stored));
    EXPECT_DOUBLE_EQ(dao.get_zone(id)->radius_meters, 450.0);

    EXPECT_TRUE(dao.set_active(id, false));
    EXPECT_FALSE(dao.get_zone(id)->is_active);
    EXPECT_FALSE(dao.set_active(9999, false));

    EXPECT_TRUE(dao.delete_zone(id));
    EXPECT_FALSE(dao.get_zone(id).has_value());
}

TEST(PunchMethodsTest, ParseAndFormat) {
    auto parsed = db::parse_punch_methods("gps,face");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, (std::set<db::PunchMethod>{db::PunchMethod::Face, db::PunchMethod::Gps}));
    EXPECT_EQ(db::format_punch_methods(*parsed), "face,gps");

    EXPECT_FALSE(db::parse_punch_methods("face,retina").has_value());
    ASSERT_TRUE(db::parse_punch_methods("").has_value());
    EXPECT_TRUE(db::parse_punch_methods("")->empty());
}

TEST_F(DaoTest, ZoneRadiusMustBePositive) {
    db::ZoneDao dao;
    EXPECT_EQ(dao.add_zone(make_zone("Bad", 0, 0, 0.0)), -1);
    EXPECT_EQ(dao.add_zone(make_zone("Bad", 0, 0, -5.0)), -1);
    EXPECT_TRUE(dao.get_all_zones().empty());
}

TEST_F(DaoTest, OnlyOneOpenSessionPerEvent) {
    db::SessionDao dao;
    db::VerificationSession s;
    s.user_id = 1;
    s.attendance_event_id = "evt";
    s.state = db::SessionState::Capturing;
    s.started_at = 100;

    int64_t first = dao.create_session(s);
    ASSERT_GT(first, 0);
    EXPECT_EQ(dao.create_session(s), -1);

    // 结束后可再开
    s.session_id = first;
    s.state = db::SessionState::Completed;
    s.completed_at = 200;
    ASSERT_TRUE(dao.update_session(s));
    s.state = db::SessionState::Capturing;
    EXPECT_GT(dao.create_session(s), first);
}

TEST_F(DaoTest, AttemptNumbersAreUniquePerSession) {
    db::SessionDao dao;
    db::VerificationSession s;
    s.user_id = 1;
    s.attendance_event_id = "evt";
    s.state = db::SessionState::Capturing;
    int64_t id = dao.create_session(s);
    ASSERT_GT(id, 0);

    db::VerificationAttempt a;
    a.session_id = id;
    a.attempt_number = 1;
    a.captured_image_ref = "a.jpg";
    a.outcome.confidence_percent = 42.0f;
    a.outcome.failure_reason = "blurry";
    a.location_fix = make_fix(1.5, 2.5, 7.0, 300);
    ASSERT_GT(dao.add_attempt(a), 0);
    EXPECT_EQ(dao.add_attempt(a), -1);

    auto attempts = dao.get_attempts(id);
    ASSERT_EQ(attempts.size(), 1u);
    EXPECT_EQ(attempts[0].outcome.failure_reason, "blurry");
    EXPECT_DOUBLE_EQ(attempts[0].location_fix.latitude, 1.5);
    EXPECT_EQ(attempts[0].location_fix.captured_at, 300);
}

TEST_F(DaoTest, TransactionRollsBackWhenNotCommitted) {
    db::TemporaryWorkplaceDao dao;
    db::TemporaryWorkplaceRecord r;
    r.user_id = 1;
    r.date = "2024-03-15";
    r.time = "10:00:00";
    r.reason = "x";
    {
        db::Transaction tx;
        ASSERT_TRUE(tx.active());
        ASSERT_GT(dao.add_record(r), 0);
    }
    EXPECT_EQ(dao.count_records(), 0);

    {
        db::Transaction tx;
        ASSERT_GT(dao.add_record(r), 0);
        EXPECT_TRUE(tx.commit());
    }
    EXPECT_EQ(dao.count_records(), 1);
}

TEST_F(DaoTest, ReusableNameUniquePerUser) {
    db::TemporaryWorkplaceDao dao;
    db::ReusableWorkplace w;
    w.user_id = 1;
    w.name = "Depot";
    w.location_fix = make_fix(1, 2);
    ASSERT_GT(dao.add_reusable(w), 0);
    EXPECT_EQ(dao.add_reusable(w), -1);

    w.user_id = 2;
    EXPECT_GT(dao.add_reusable(w), 0);
    EXPECT_TRUE(dao.get_reusable_by_name(1, "Depot").has_value());
    EXPECT_FALSE(dao.get_reusable_by_name(3, "Depot").has_value());
}

TEST_F(DaoTest, ApprovalDecideOnlyFromPending) {
    db::ApprovalDao dao;
    db::ApprovalRequest r;
    r.user_id = 1;
    r.manager_id = 2;
    r.type = db::ApprovalType::Overtime;
    r.reason = "release";
    r.requested_at = 1000;
    int64_t id = dao.add_request(r);
    ASSERT_GT(id, 0);

    EXPECT_TRUE(dao.decide(id, db::ApprovalStatus::Approved, 2000, 2, "ok"));
    EXPECT_FALSE(dao.decide(id, db::ApprovalStatus::Rejected, 3000, 2, "changed mind"));

    auto stored = dao.get_request(id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, db::ApprovalStatus::Approved);
    EXPECT_EQ(stored->decided_at.value_or(0), 2000);
    EXPECT_EQ(stored->decision_notes, "ok");

    db::ApprovalCounts counts = dao.count_by_status();
    EXPECT_EQ(counts.approved, 1);
    EXPECT_DOUBLE_EQ(counts.average_response_seconds, 1000.0);
}
