/**
 * @file temporary_workplace_handler.h
 * @brief 临时工作地点打卡
 * @details 定位不在任何围栏内时, 记录打卡原因/照片, 可保存为常用地点, 按策略提交审批。
 *          调用方负责先做围栏匹配, 这里不再判断是否在围栏内。
 */

#ifndef TEMPORARY_WORKPLACE_HANDLER_H
#define TEMPORARY_WORKPLACE_HANDLER_H

#include "core/error.h"
#include "database/database_types.h"
#include "service/clock.h"
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

namespace service {

class ApprovalWorkflow;
class PhotoStore;

struct TemporaryPunchRequest {
    int64_t user_id = -1;
    int64_t manager_id = -1;                       // 审批人
    std::string attendance_event_id;               // 作为审批单的 source_event_id
    db::PunchType type = db::PunchType::ClockIn;
    db::LocationFix fix;
    std::string reason;
    std::optional<std::string> photo_ref;          // 已存档的照片
    cv::Mat photo;                                 // 或原始照片, 由 PhotoStore 存档
    std::optional<std::string> notes;
    bool save_as_reusable = false;
    std::optional<std::string> reusable_name;
    std::optional<int64_t> reusable_location_id;   // 引用已保存的常用地点 (只按 id 匹配)
    double distance_to_nearest_zone = -1.0;        // 围栏匹配得到的最近距离, < 0 表示未知
};

struct TemporaryPunchOutcome {
    db::TemporaryWorkplaceRecord record;
    std::optional<db::ReusableWorkplace> reusable;
    std::optional<int64_t> approval_id;            // 无需审批时为空
};

class TemporaryWorkplaceHandler {
public:
    TemporaryWorkplaceHandler(ApprovalWorkflow& approvals, Clock clock = system_clock());

    void set_photo_store(PhotoStore* store) { photo_store_ = store; }

    /**
     * @brief 提交临时地点打卡
     * @details 全部校验在写库之前完成, 校验失败不产生任何记录。
     *          记录、常用地点、审批单在同一事务中写入。
     */
    core::Result<TemporaryPunchOutcome> submit_punch(const TemporaryPunchRequest& request);

    // [start_time, end_time] 内的打卡记录 (按 created_at)
    std::vector<db::TemporaryWorkplaceRecord> list_records(int64_t user_id, std::time_t start_time,
                                                           std::time_t end_time) const;

    // 用户启用中的常用地点
    std::vector<db::ReusableWorkplace> list_reusable(int64_t user_id) const;

    core::Status deactivate_reusable(int64_t user_id, int64_t reusable_id);

private:
    core::Status validate(const TemporaryPunchRequest& request) const;

    ApprovalWorkflow& approvals_;
    Clock clock_;
    PhotoStore* photo_store_ = nullptr;
};

} // namespace service

#endif // TEMPORARY_WORKPLACE_HANDLER_H
