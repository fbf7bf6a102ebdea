#include <gtest/gtest.h>
#include "service/approval_workflow.h"
#include "service/notification_hub.h"
#include "test_support.h"
#include <atomic>
#include <thread>
#include <vector>

using namespace service;

class ApprovalWorkflowTest : public testing_support::DatabaseTest {
protected:
    testing_support::ManualClock clock{1700000000};

    db::ApprovalRequest request(db::ApprovalType type, int64_t user, const std::string& reason) {
        db::ApprovalRequest r;
        r.source_event_id = "evt-" + std::to_string(user);
        r.user_id = user;
        r.manager_id = 900;
        r.type = type;
        r.reason = reason;
        return r;
    }
};

TEST_F(ApprovalWorkflowTest, EnqueueIsIdempotentOnId) {
    ApprovalWorkflow workflow(clock.clock());
    NotificationHub hub;
    int requested = 0;
    hub.subscribe([&](const Notification& n) {
        if (n.type == NotificationType::ApprovalRequested) ++requested;
    });
    workflow.set_notification_hub(&hub);

    auto r = request(db::ApprovalType::Overtime, 1, "release night");
    r.request_id = 77;
    auto first = workflow.enqueue(r);
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.value(), 77);

    r.reason = "changed on retry";
    auto again = workflow.enqueue(r);
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(again.value(), 77);

    EXPECT_EQ(workflow.pending().size(), 1u);
    EXPECT_EQ(workflow.get(77)->reason, "release night");
    EXPECT_EQ(requested, 1);
}

TEST_F(ApprovalWorkflowTest, EnqueueWithoutIdAssignsNewIds) {
    ApprovalWorkflow workflow(clock.clock());
    auto a = workflow.enqueue(request(db::ApprovalType::Late, 1, "traffic"));
    auto b = workflow.enqueue(request(db::ApprovalType::Late, 1, "traffic"));
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_NE(a.value(), b.value());

    auto stored = workflow.get(a.value());
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, db::ApprovalStatus::Pending);
    EXPECT_EQ(stored->requested_at, 1700000000);
}

TEST_F(ApprovalWorkflowTest, DecideOnceOnly) {
    ApprovalWorkflow workflow(clock.clock());
    int64_t id = workflow.enqueue(request(db::ApprovalType::EarlyLeave, 3, "doctor")).value();

    clock.advance(3600);
    auto decided = workflow.decide(id, false, 900, "not enough notice");
    ASSERT_TRUE(decided.ok());
    EXPECT_EQ(decided->status, db::ApprovalStatus::Rejected);
    ASSERT_TRUE(decided->decided_at.has_value());
    EXPECT_EQ(*decided->decided_at, 1700003600);
    EXPECT_EQ(decided->decided_by.value_or(-1), 900);
    EXPECT_EQ(decided->decision_notes, "not enough notice");

    auto again = workflow.decide(id, true);
    EXPECT_EQ(again.code(), core::ErrorCode::AlreadyDecided);
    EXPECT_EQ(workflow.get(id)->status, db::ApprovalStatus::Rejected);

    EXPECT_EQ(workflow.decide(424242, true).code(), core::ErrorCode::NotFound);
}

TEST_F(ApprovalWorkflowTest, BulkDecidePartialSuccess) {
    ApprovalWorkflow workflow(clock.clock());
    int64_t a = workflow.enqueue(request(db::ApprovalType::Overtime, 1, "deploy")).value();
    int64_t b = workflow.enqueue(request(db::ApprovalType::Overtime, 2, "deploy")).value();
    ASSERT_TRUE(workflow.decide(b, true).ok());

    BulkDecision result = workflow.bulk_decide({a, b}, true);
    ASSERT_EQ(result.succeeded.size(), 1u);
    EXPECT_EQ(result.succeeded[0], a);
    ASSERT_EQ(result.failed.size(), 1u);
    EXPECT_EQ(result.failed[0].first, b);
    EXPECT_EQ(result.failed[0].second.code, core::ErrorCode::AlreadyDecided);
    EXPECT_EQ(workflow.get(a)->status, db::ApprovalStatus::Approved);
}

TEST_F(ApprovalWorkflowTest, BulkDecideKeepsCallerOrder) {
    ApprovalWorkflow workflow(clock.clock());
    int64_t a = workflow.enqueue(request(db::ApprovalType::Late, 1, "x")).value();
    int64_t b = workflow.enqueue(request(db::ApprovalType::Late, 2, "y")).value();
    int64_t c = workflow.enqueue(request(db::ApprovalType::Late, 3, "z")).value();

    BulkDecision result = workflow.bulk_decide({c, 999, a, b}, false);
    EXPECT_EQ(result.succeeded, (std::vector<int64_t>{c, a, b}));
    ASSERT_EQ(result.failed.size(), 1u);
    EXPECT_EQ(result.failed[0].second.code, core::ErrorCode::NotFound);
}

TEST_F(ApprovalWorkflowTest, ConcurrentDecisionsOnSameIdSucceedOnce) {
    ApprovalWorkflow workflow(clock.clock());
    int64_t id = workflow.enqueue(request(db::ApprovalType::Overtime, 1, "race")).value();

    std::atomic<int> succeeded{0};
    std::atomic<int> already{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            auto r = workflow.decide(id, i % 2 == 0);
            if (r.ok()) ++succeeded;
            else if (r.code() == core::ErrorCode::AlreadyDecided) ++already;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(succeeded.load(), 1);
    EXPECT_EQ(already.load(), 7);
}

TEST_F(ApprovalWorkflowTest, ListFiltersWithoutSideEffects) {
    ApprovalWorkflow workflow(clock.clock());
    workflow.enqueue(request(db::ApprovalType::Late, 1, "bus broke down"));
    clock.advance(100);
    workflow.enqueue(request(db::ApprovalType::Overtime, 2, "quarter close"));
    clock.advance(100);
    int64_t temp = workflow.enqueue(request(db::ApprovalType::TemporaryWorkplace, 1, "client site")).value();
    ASSERT_TRUE(workflow.decide(temp, true).ok());

    db::ApprovalFilter by_user;
    by_user.user_id = 1;
    EXPECT_EQ(workflow.list(by_user).size(), 2u);

    db::ApprovalFilter pending_late;
    pending_late.status = db::ApprovalStatus::Pending;
    pending_late.type = db::ApprovalType::Late;
    auto late = workflow.list(pending_late);
    ASSERT_EQ(late.size(), 1u);
    EXPECT_EQ(late[0].reason, "bus broke down");

    db::ApprovalFilter window;
    window.requested_from = 1700000050;
    window.requested_to = 1700000150;
    auto in_window = workflow.list(window);
    ASSERT_EQ(in_window.size(), 1u);
    EXPECT_EQ(in_window[0].type, db::ApprovalType::Overtime);

    db::ApprovalFilter search;
    search.search = "client";
    EXPECT_EQ(workflow.list(search).size(), 1u);

    EXPECT_EQ(workflow.pending().size(), 2u);
}

TEST_F(ApprovalWorkflowTest, Stats) {
    ApprovalWorkflow workflow(clock.clock());
    int64_t a = workflow.enqueue(request(db::ApprovalType::Late, 1, "a")).value();
    int64_t b = workflow.enqueue(request(db::ApprovalType::Late, 2, "b")).value();
    int64_t c = workflow.enqueue(request(db::ApprovalType::Late, 3, "c")).value();
    workflow.enqueue(request(db::ApprovalType::Late, 4, "d"));

    clock.advance(7200);
    ASSERT_TRUE(workflow.decide(a, true).ok());
    ASSERT_TRUE(workflow.decide(b, true).ok());
    ASSERT_TRUE(workflow.decide(c, false).ok());

    ApprovalStats s = workflow.stats();
    EXPECT_EQ(s.total, 4);
    EXPECT_EQ(s.pending, 1);
    EXPECT_EQ(s.approved, 2);
    EXPECT_EQ(s.rejected, 1);
    EXPECT_NEAR(s.approval_rate, 66.67, 0.01);
    EXPECT_NEAR(s.average_response_hours, 2.0, 1e-9);
}

TEST_F(ApprovalWorkflowTest, DecisionPublishesNotification) {
    ApprovalWorkflow workflow(clock.clock());
    NotificationHub hub;
    std::vector<Notification> seen;
    hub.subscribe([&](const Notification& n) { seen.push_back(n); });
    workflow.set_notification_hub(&hub);

    int64_t id = workflow.enqueue(request(db::ApprovalType::Overtime, 1, "x")).value();
    ASSERT_TRUE(workflow.decide(id, true).ok());

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_STREQ(to_string(seen[1].type), "approval.decided");
    EXPECT_EQ(seen[1].entity_id, id);
    EXPECT_EQ(seen[1].kind, "overtime");
    EXPECT_EQ(seen[1].status, "approved");
}

TEST_F(ApprovalWorkflowTest, SubscriberMayDecideFromCallback) {
    ApprovalWorkflow workflow(clock.clock());
    std::vector<int64_t> ids;
    for (int i = 0; i < 65; ++i) {
        auto id = workflow.enqueue(request(db::ApprovalType::Late, 1 + i, "traffic"));
        ASSERT_TRUE(id.ok());
        ids.push_back(id.value());
    }
    // 与第一个审批单落在同一分段锁上的审批单
    int64_t first = ids.front();
    int64_t same_stripe = -1;
    for (int64_t id : ids) {
        if (id != first && (id - first) % 64 == 0) same_stripe = id;
    }
    ASSERT_GT(same_stripe, 0);

    NotificationHub hub;
    std::vector<int64_t> decided;
    core::ErrorCode chained = core::ErrorCode::InvalidArgument;
    hub.subscribe([&](const Notification& n) {
        if (n.type != NotificationType::ApprovalDecided) return;
        decided.push_back(n.entity_id);
        if (n.entity_id == first) {
            chained = workflow.decide(same_stripe, false, 900, "auto-rejected").code();
        }
    });
    workflow.set_notification_hub(&hub);

    auto result = workflow.decide(first, true, 900);
    ASSERT_TRUE(result.ok()) << result.message();
    EXPECT_EQ(chained, core::ErrorCode::Ok);
    EXPECT_EQ(workflow.get(same_stripe)->status, db::ApprovalStatus::Rejected);
    EXPECT_EQ(decided, (std::vector<int64_t>{first, same_stripe}));
}
