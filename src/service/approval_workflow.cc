/**
 * @file approval_workflow.cc
 * @brief 审批流程实现
 * @details 同一审批单的决定通过分段锁串行化, 库中再以 "WHERE status = pending" 的条件更新兜底,
 *          不同审批单之间互不阻塞。
 */

#include "service/approval_workflow.h"
#include "service/notification_hub.h"
#include <iostream>

namespace service {

ApprovalWorkflow::ApprovalWorkflow(Clock clock) : clock_(std::move(clock)) {}

core::Result<int64_t> ApprovalWorkflow::enqueue(const db::ApprovalRequest& request, bool notify) {
    if (request.user_id < 0) {
        return core::Error{core::ErrorCode::InvalidArgument, "approval request has no requester"};
    }

    db::ApprovalRequest to_insert = request;
    to_insert.status = db::ApprovalStatus::Pending;
    if (to_insert.requested_at == 0) {
        to_insert.requested_at = clock_();
    }

    db::ApprovalDao dao;
    bool inserted = false;
    int64_t id = dao.add_request(to_insert, &inserted);
    if (id < 0) {
        return core::Error{core::ErrorCode::StorageError, "cannot store approval request"};
    }

    if (inserted) {
        std::cout << "Approval request " << id << " queued: " << db::to_string(to_insert.type)
                  << " user=" << to_insert.user_id << " manager=" << to_insert.manager_id << std::endl;
        if (notify) {
            to_insert.request_id = id;
            publish(NotificationType::ApprovalRequested, to_insert);
        }
    }
    return id;
}

void ApprovalWorkflow::notify_requested(int64_t request_id) {
    auto request = get(request_id);
    if (request) {
        publish(NotificationType::ApprovalRequested, *request);
    }
}

core::Result<db::ApprovalRequest> ApprovalWorkflow::decide(int64_t request_id, bool approve,
                                                           std::optional<int64_t> decided_by,
                                                           const std::string& notes) {
    auto decided = decide_locked(request_id, approve, decided_by, notes);
    if (!decided.ok()) {
        return decided;
    }

    std::cout << "Approval request " << request_id << " " << db::to_string(decided->status);
    if (decided_by) std::cout << " by " << *decided_by;
    std::cout << std::endl;

    // 订阅者可能再次调用 decide, 通知在释放分段锁之后发出
    publish(NotificationType::ApprovalDecided, decided.value());
    return decided;
}

core::Result<db::ApprovalRequest> ApprovalWorkflow::decide_locked(int64_t request_id, bool approve,
                                                                  std::optional<int64_t> decided_by,
                                                                  const std::string& notes) {
    std::lock_guard<std::mutex> lock(stripe(request_id));

    db::ApprovalDao dao;
    auto request = dao.get_request(request_id);
    if (!request) {
        return core::Error{core::ErrorCode::NotFound, "approval request " + std::to_string(request_id) + " not found"};
    }
    if (request->status != db::ApprovalStatus::Pending) {
        return core::Error{core::ErrorCode::AlreadyDecided,
                           "approval request " + std::to_string(request_id) + " is already " +
                           db::to_string(request->status)};
    }

    db::ApprovalStatus status = approve ? db::ApprovalStatus::Approved : db::ApprovalStatus::Rejected;
    if (!dao.decide(request_id, status, clock_(), decided_by, notes)) {
        // 其他进程抢先处理
        auto latest = dao.get_request(request_id);
        if (latest && latest->status != db::ApprovalStatus::Pending) {
            return core::Error{core::ErrorCode::AlreadyDecided,
                               "approval request " + std::to_string(request_id) + " is already " +
                               db::to_string(latest->status)};
        }
        return core::Error{core::ErrorCode::StorageError, "cannot update approval request"};
    }

    auto decided = dao.get_request(request_id);
    if (!decided) {
        return core::Error{core::ErrorCode::StorageError, "approval request vanished after update"};
    }
    return *decided;
}

BulkDecision ApprovalWorkflow::bulk_decide(const std::vector<int64_t>& request_ids, bool approve,
                                           std::optional<int64_t> decided_by, const std::string& notes) {
    BulkDecision result;
    for (int64_t id : request_ids) {
        auto decided = decide(id, approve, decided_by, notes);
        if (decided.ok()) {
            result.succeeded.push_back(id);
        } else {
            result.failed.emplace_back(id, decided.error());
        }
    }
    return result;
}

std::optional<db::ApprovalRequest> ApprovalWorkflow::get(int64_t request_id) const {
    db::ApprovalDao dao;
    return dao.get_request(request_id);
}

std::vector<db::ApprovalRequest> ApprovalWorkflow::list(const db::ApprovalFilter& filter) const {
    db::ApprovalDao dao;
    return dao.query(filter);
}

std::vector<db::ApprovalRequest> ApprovalWorkflow::pending() const {
    db::ApprovalFilter filter;
    filter.status = db::ApprovalStatus::Pending;
    return list(filter);
}

ApprovalStats ApprovalWorkflow::stats() const {
    db::ApprovalDao dao;
    db::ApprovalCounts counts = dao.count_by_status();

    ApprovalStats s;
    s.pending = counts.pending;
    s.approved = counts.approved;
    s.rejected = counts.rejected;
    s.total = counts.pending + counts.approved + counts.rejected;

    int64_t decided = counts.approved + counts.rejected;
    if (decided > 0) {
        s.approval_rate = 100.0 * static_cast<double>(counts.approved) / static_cast<double>(decided);
    }
    s.average_response_hours = counts.average_response_seconds / 3600.0;
    return s;
}

std::mutex& ApprovalWorkflow::stripe(int64_t request_id) {
    return stripes_[static_cast<uint64_t>(request_id) % kStripes];
}

void ApprovalWorkflow::publish(NotificationType type, const db::ApprovalRequest& request) {
    if (!hub_) return;
    Notification n;
    n.type = type;
    n.entity_id = request.request_id;
    n.kind = db::to_string(request.type);
    n.status = db::to_string(request.status);
    n.emitted_at = clock_();
    hub_->publish(n);
}

} // namespace service
