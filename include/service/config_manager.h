/**
 * @file config_manager.h
 * @brief 运行时策略配置
 * @details 初始值取自 Config::Default, 可通过 YAML/JSON 文件 (cv::FileStorage) 加载和保存。
 */

#ifndef CONFIG_MANAGER_H
#define CONFIG_MANAGER_H

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace service {

struct VerificationPolicy {
    int max_attempts;                 // 单次打卡最多验证次数
    int timeout_ms;                   // 验证服务超时
    float match_threshold;            // 人脸相似度阈值 (0..1)
    int location_timeout_ms;          // 定位超时
};

struct GeofencePolicy {
    double max_fix_accuracy_meters;   // 0 表示不检查定位精度
};

struct TemporaryWorkplacePolicy {
    bool enabled;
    bool require_reason;
    bool require_photo;
    bool require_manager_approval;
    double max_distance_from_workplace;  // 0 表示不限制
    std::vector<int64_t> allowed_users;  // 为空表示全部员工
};

struct WorkHoursPolicy {
    int start_hour;
    int start_minute;
    int end_hour;
    int end_minute;
    int late_threshold;               // 分钟
    int early_leave_threshold;        // 分钟
    int overtime_threshold;           // 分钟
    bool raise_exception_requests;
};

struct StoragePolicy {
    std::string database;
    std::string photo_dir;
};

struct AttendancePolicy {
    VerificationPolicy verification;
    GeofencePolicy geofence;
    TemporaryWorkplacePolicy temporary_workplace;
    WorkHoursPolicy work_hours;
    StoragePolicy storage;

    static AttendancePolicy defaults();
};

class ConfigManager {
public:
    static ConfigManager& instance();

    // 读取策略文件, 文件中缺失的项保留当前值
    bool load(const std::string& path);
    bool save(const std::string& path) const;

    AttendancePolicy policy() const;
    void set_policy(const AttendancePolicy& policy);

    // 恢复为 Config::Default
    void reset();

private:
    ConfigManager();
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    AttendancePolicy policy_;
    mutable std::mutex mutex_;
};

} // namespace service

#endif // CONFIG_MANAGER_H
