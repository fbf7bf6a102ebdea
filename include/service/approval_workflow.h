/**
 * @file approval_workflow.h
 * @brief 审批流程 (加班/迟到/早退/临时地点)
 */

#ifndef APPROVAL_WORKFLOW_H
#define APPROVAL_WORKFLOW_H

#include "core/error.h"
#include "database/approval_dao.h"
#include "database/database_types.h"
#include "service/clock.h"
#include "service/notification_hub.h"
#include <array>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace service {

struct BulkDecision {
    std::vector<int64_t> succeeded;                       // 按调用方给出的顺序
    std::vector<std::pair<int64_t, core::Error>> failed;
};

struct ApprovalStats {
    int64_t total = 0;
    int64_t pending = 0;
    int64_t approved = 0;
    int64_t rejected = 0;
    double approval_rate = 0.0;           // 已处理中通过的百分比
    double average_response_hours = 0.0;
};

class ApprovalWorkflow {
public:
    explicit ApprovalWorkflow(Clock clock = system_clock());

    void set_notification_hub(NotificationHub* hub) { hub_ = hub; }

    /**
     * @brief 提交审批单 (幂等)
     * @details request_id > 0 且已存在时不做修改, 直接返回该 id;
     *          未指定 id 时分配新 id。仅首次写入时发布 approval.requested。
     * @param notify 为 false 时不发布通知 (在外部事务中调用, 提交后再调用 notify_requested)
     */
    core::Result<int64_t> enqueue(const db::ApprovalRequest& request, bool notify = true);

    void notify_requested(int64_t request_id);

    /**
     * @brief 审批
     * @return 更新后的审批单; 不存在返回 NotFound, 已处理返回 AlreadyDecided
     */
    core::Result<db::ApprovalRequest> decide(int64_t request_id, bool approve,
                                             std::optional<int64_t> decided_by = std::nullopt,
                                             const std::string& notes = "");

    // 批量审批, 每个 id 独立处理, 允许部分成功
    BulkDecision bulk_decide(const std::vector<int64_t>& request_ids, bool approve,
                             std::optional<int64_t> decided_by = std::nullopt,
                             const std::string& notes = "");

    std::optional<db::ApprovalRequest> get(int64_t request_id) const;
    std::vector<db::ApprovalRequest> list(const db::ApprovalFilter& filter) const;
    std::vector<db::ApprovalRequest> pending() const;
    ApprovalStats stats() const;

private:
    static constexpr size_t kStripes = 64;

    // 持有分段锁完成状态检查与更新, 不发通知
    core::Result<db::ApprovalRequest> decide_locked(int64_t request_id, bool approve,
                                                    std::optional<int64_t> decided_by, const std::string& notes);
    std::mutex& stripe(int64_t request_id);
    void publish(NotificationType type, const db::ApprovalRequest& request);

    Clock clock_;
    NotificationHub* hub_ = nullptr;
    std::array<std::mutex, kStripes> stripes_;
};

} // namespace service

#endif // APPROVAL_WORKFLOW_H
