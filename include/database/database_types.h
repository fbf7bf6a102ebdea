#ifndef DATABASE_TYPES_H
#define DATABASE_TYPES_H

#include <string>
#include <vector>
#include <set>
#include <optional>
#include <cstdint>
#include <ctime>

namespace db {

enum class PunchType {
    ClockIn = 1,
    ClockOut = 2,
};

/**
 * @brief 围栏允许的打卡方式
 */
enum class PunchMethod {
    Face = 1,      // 人脸验证
    Gps = 2,       // 仅定位
    Manual = 3,    // 人工补卡
};

/**
 * @brief 定位结果 (外部定位服务产生, 不可修改)
 */
struct LocationFix {
    double latitude = 0.0;
    double longitude = 0.0;
    double accuracy_meters = 0.0;   // 定位精度半径
    std::time_t captured_at = 0;
};

/**
 * @brief 工作地点围栏 (圆形)
 */
struct GeofenceZone {
    int64_t zone_id = -1;           // 主键, 同时代表录入顺序
    std::string name;
    double center_lat = 0.0;
    double center_lng = 0.0;
    double radius_meters = 0.0;     // 必须 > 0
    std::string address;
    bool is_active = true;          // 停用的围栏不参与匹配
    std::set<PunchMethod> allowed_methods{PunchMethod::Face};
};

/**
 * @brief 验证服务返回结果
 */
struct VerificationOutcome {
    bool success = false;
    float confidence_percent = 0.0f;  // 0..100
    std::string failure_reason;       // 仅失败时有值
};

/**
 * @brief 单次验证记录 (写入后不可修改)
 */
struct VerificationAttempt {
    int64_t attempt_id = -1;
    int64_t session_id = -1;
    int attempt_number = 0;           // 会话内从 1 开始严格递增
    std::string captured_image_ref;
    VerificationOutcome outcome;
    std::time_t captured_at = 0;
    LocationFix location_fix;
};

enum class SessionState {
    Pending = 0,
    Capturing = 1,
    Verifying = 2,
    Completed = 3,
    Failed = 4,
    Cancelled = 5,
};

struct SessionResult {
    bool success = false;
    std::string final_image_ref;      // 仅成功时有值
    int total_attempts = 0;
    float average_confidence = 0.0f;
};

/**
 * @brief 验证会话 (一次打卡对应一个会话)
 */
struct VerificationSession {
    int64_t session_id = -1;
    int64_t user_id = -1;
    std::string attendance_event_id;
    PunchType session_type = PunchType::ClockIn;
    SessionState state = SessionState::Pending;
    std::vector<VerificationAttempt> attempts;
    int max_attempts = 3;
    std::time_t started_at = 0;
    std::optional<std::time_t> completed_at;
    std::optional<SessionResult> result;
    LocationFix location_fix;         // 开启会话时的定位
    std::string pending_image_ref;    // verifying 状态下正在验证的样本
};

/**
 * @brief 临时工作地点打卡记录
 */
struct TemporaryWorkplaceRecord {
    int64_t record_id = -1;
    int64_t user_id = -1;
    std::string date;                 // YYYY-MM-DD (本地时间)
    PunchType type = PunchType::ClockIn;
    std::string time;                 // HH:MM:SS (本地时间)
    LocationFix location_fix;
    std::string reason;
    std::optional<std::string> photo_ref;
    std::optional<std::string> notes;
    bool is_reusable = false;
    std::optional<int64_t> reusable_location_id;
    std::time_t created_at = 0;
};

/**
 * @brief 用户保存的常用临时地点
 */
struct ReusableWorkplace {
    int64_t reusable_id = -1;
    int64_t user_id = -1;
    std::string name;                 // 同一用户内唯一
    LocationFix location_fix;
    std::string reason;
    bool is_active = true;
    int usage_count = 0;
    std::time_t last_used_at = 0;
};

enum class ApprovalType {
    Overtime = 1,
    Late = 2,
    EarlyLeave = 3,
    TemporaryWorkplace = 4,
};

enum class ApprovalStatus {
    Pending = 0,
    Approved = 1,
    Rejected = 2,
};

/**
 * @brief 审批单, status 离开 pending 后不可再修改
 */
struct ApprovalRequest {
    int64_t request_id = -1;          // -1 表示由数据库分配
    std::string source_event_id;
    int64_t user_id = -1;
    int64_t manager_id = -1;
    ApprovalType type = ApprovalType::TemporaryWorkplace;
    std::string reason;
    ApprovalStatus status = ApprovalStatus::Pending;
    std::time_t requested_at = 0;
    std::optional<std::time_t> decided_at;
    std::optional<int64_t> decided_by;
    std::string decision_notes;
};

/**
 * @brief 人脸特征 (注册时写入)
 */
struct FaceFeature {
    int64_t feature_id = -1;        // 主键
    int64_t user_id = -1;
    std::vector<float> feature_vector; // 512维特征向量
    float feature_quality = 0.0f;   // 注册时的画质评分
};

inline const char* to_string(PunchType type) {
    return type == PunchType::ClockIn ? "clock-in" : "clock-out";
}

inline const char* to_string(PunchMethod method) {
    switch (method) {
        case PunchMethod::Face:   return "face";
        case PunchMethod::Gps:    return "gps";
        case PunchMethod::Manual: return "manual";
    }
    return "unknown";
}

inline const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Pending:   return "pending";
        case SessionState::Capturing: return "capturing";
        case SessionState::Verifying: return "verifying";
        case SessionState::Completed: return "completed";
        case SessionState::Failed:    return "failed";
        case SessionState::Cancelled: return "cancelled";
    }
    return "unknown";
}

inline const char* to_string(ApprovalType type) {
    switch (type) {
        case ApprovalType::Overtime:           return "overtime";
        case ApprovalType::Late:               return "late";
        case ApprovalType::EarlyLeave:         return "early-leave";
        case ApprovalType::TemporaryWorkplace: return "temporary-workplace";
    }
    return "unknown";
}

inline const char* to_string(ApprovalStatus status) {
    switch (status) {
        case ApprovalStatus::Pending:  return "pending";
        case ApprovalStatus::Approved: return "approved";
        case ApprovalStatus::Rejected: return "rejected";
    }
    return "unknown";
}

} // namespace db

#endif // DATABASE_TYPES_H
