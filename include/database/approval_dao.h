#ifndef APPROVAL_DAO_H
#define APPROVAL_DAO_H

#include "database/database_types.h"
#include <optional>
#include <string>
#include <vector>

namespace db {

/**
 * @brief 审批单查询条件, 未设置的字段不参与过滤
 */
struct ApprovalFilter {
    std::optional<ApprovalType> type;
    std::optional<ApprovalStatus> status;
    std::optional<int64_t> user_id;
    std::optional<int64_t> manager_id;
    std::optional<std::time_t> requested_from;
    std::optional<std::time_t> requested_to;
    std::string search;               // reason 或 source_event_id 包含的文本
};

struct ApprovalCounts {
    int64_t pending = 0;
    int64_t approved = 0;
    int64_t rejected = 0;
    double average_response_seconds = 0.0;  // 已处理审批单的平均处理时长
};

class ApprovalDao {
public:
    /**
     * @brief 写入审批单
     * @details request_id > 0 时使用指定 id, 已存在则不做任何修改 (inserted = false)
     * @return 审批单 id，失败返回 -1
     */
    int64_t add_request(const ApprovalRequest& request, bool* inserted = nullptr);

    std::optional<ApprovalRequest> get_request(int64_t request_id);

    // 仅当审批单仍为 pending 时更新，返回是否发生了更新
    bool decide(int64_t request_id, ApprovalStatus status, std::time_t decided_at,
                std::optional<int64_t> decided_by, const std::string& notes);

    // 按 requested_at, request_id 升序
    std::vector<ApprovalRequest> query(const ApprovalFilter& filter);

    ApprovalCounts count_by_status();
};

} // namespace db

#endif // APPROVAL_DAO_H
