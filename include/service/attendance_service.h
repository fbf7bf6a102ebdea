/**
 * @file attendance_service.h
 * @brief 考勤业务服务头文件
 * @details 打卡流程: 定位 -> 围栏匹配 -> 围栏内人脸验证 / 围栏外临时地点打卡 -> 考勤判定与异常审批
 */

#ifndef ATTENDANCE_SERVICE_H
#define ATTENDANCE_SERVICE_H

#include "core/error.h"
#include "core/geofence_engine.h"
#include "database/database_types.h"
#include "service/clock.h"
#include "service/verification_provider.h"
#include <opencv2/core.hpp>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace service {

class ApprovalWorkflow;
class LocationProvider;
class TemporaryWorkplaceHandler;
class VerificationSessionController;

enum class AttendanceStatus {
    Pending = 0,       // 等待人脸验证
    Normal = 1,
    Late = 2,
    EarlyLeave = 3,
    Overtime = 4,
};

const char* to_string(AttendanceStatus status);

struct PunchRequest {
    int64_t user_id = -1;
    int64_t manager_id = -1;
    std::string attendance_event_id;
    db::PunchType type = db::PunchType::ClockIn;
    std::optional<db::LocationFix> fix;            // 为空时向定位服务获取

    // 仅围栏外 (临时地点) 使用
    std::string reason;
    std::optional<std::string> photo_ref;
    cv::Mat photo;
    std::optional<std::string> notes;
    bool save_as_reusable = false;
    std::optional<std::string> reusable_name;
    std::optional<int64_t> reusable_location_id;
};

/**
 * @brief 打卡结果, 交给考勤台账
 * accepted 为 false 且有 session_id 时, 需要继续提交人脸样本
 */
struct PunchResult {
    bool accepted = false;
    std::optional<int64_t> session_id;
    std::optional<int64_t> record_id;              // 临时地点记录
    std::vector<int64_t> pending_approval_ids;
    AttendanceStatus attendance_status = AttendanceStatus::Pending;
    core::ZoneMatch zone_match;
};

class AttendanceService {
public:
    AttendanceService(core::GeofenceEngine& geofence, LocationProvider& location,
                      VerificationSessionController& sessions, TemporaryWorkplaceHandler& temporary,
                      ApprovalWorkflow& approvals, Clock clock = system_clock());

    /**
     * @brief 发起打卡
     * @return LocationUnavailable / ZoneMismatch (未开启临时地点) / SessionAlreadyOpen / 临时地点校验错误
     */
    core::Result<PunchResult> begin_punch(const PunchRequest& request);

    /**
     * @brief 提交人脸样本
     * @return 验证通过返回已接受的打卡; VerificationFailed 可重试,
     *         MaxAttemptsExceeded 需要重新注册人脸, ProviderUnavailable 不计次数
     */
    core::Result<PunchResult> submit_verification(int64_t session_id, const VerificationSample& sample,
                                                  std::chrono::milliseconds timeout);

    core::Status cancel_punch(int64_t session_id);

    // 按工作时间判定考勤状态
    AttendanceStatus classify(db::PunchType type, std::time_t at) const;

private:
    struct PendingPunch {
        PunchRequest request;
        core::ZoneMatch zone_match;
    };

    PunchResult accept(const PunchRequest& request, const core::ZoneMatch& zone_match, std::time_t at);
    std::optional<PendingPunch> take_pending(int64_t session_id);

    core::GeofenceEngine& geofence_;
    LocationProvider& location_;
    VerificationSessionController& sessions_;
    TemporaryWorkplaceHandler& temporary_;
    ApprovalWorkflow& approvals_;
    Clock clock_;

    std::map<int64_t, PendingPunch> pending_;      // session_id -> 打卡上下文
    std::mutex mutex_;
};

} // namespace service

#endif // ATTENDANCE_SERVICE_H
