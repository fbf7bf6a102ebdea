/**
 * @file config_manager.cc
 * @brief 运行时策略配置实现
 * @details 文件格式由扩展名决定 (.yml/.yaml/.json/.xml), 读写均通过 cv::FileStorage。
 */

#include "service/config_manager.h"
#include "config.h"
#include <opencv2/core.hpp>
#include <iostream>

namespace service {

namespace {

template <typename T>
void read_value(const cv::FileNode& section, const char* key, T& out) {
    cv::FileNode node = section[key];
    if (!node.empty()) node >> out;
}

void read_flag(const cv::FileNode& section, const char* key, bool& out) {
    cv::FileNode node = section[key];
    if (node.empty()) return;
    int value = 0;
    node >> value;
    out = (value != 0);
}

} // namespace

AttendancePolicy AttendancePolicy::defaults() {
    AttendancePolicy p;
    p.verification.max_attempts = Config::Default::MAX_VERIFY_ATTEMPTS;
    p.verification.timeout_ms = Config::Default::VERIFY_TIMEOUT_MS;
    p.verification.match_threshold = Config::Default::MATCH_THRESHOLD;
    p.verification.location_timeout_ms = Config::Default::LOCATION_TIMEOUT_MS;

    p.geofence.max_fix_accuracy_meters = Config::Default::MAX_FIX_ACCURACY_METERS;

    p.temporary_workplace.enabled = Config::Default::TEMP_WORKPLACE_ENABLED;
    p.temporary_workplace.require_reason = Config::Default::TEMP_REQUIRE_REASON;
    p.temporary_workplace.require_photo = Config::Default::TEMP_REQUIRE_PHOTO;
    p.temporary_workplace.require_manager_approval = Config::Default::TEMP_REQUIRE_APPROVAL;
    p.temporary_workplace.max_distance_from_workplace = Config::Default::TEMP_MAX_DISTANCE_METERS;

    p.work_hours.start_hour = Config::Default::WORK_START_HOUR;
    p.work_hours.start_minute = Config::Default::WORK_START_MINUTE;
    p.work_hours.end_hour = Config::Default::WORK_END_HOUR;
    p.work_hours.end_minute = Config::Default::WORK_END_MINUTE;
    p.work_hours.late_threshold = Config::Default::LATE_THRESHOLD;
    p.work_hours.early_leave_threshold = Config::Default::EARLY_LEAVE_THRESHOLD;
    p.work_hours.overtime_threshold = Config::Default::OVERTIME_THRESHOLD;
    p.work_hours.raise_exception_requests = Config::Default::RAISE_EXCEPTION_REQUESTS;

    p.storage.database = Config::Path::DATABASE;
    p.storage.photo_dir = Config::Path::PHOTO_DIR;
    return p;
}

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

ConfigManager::ConfigManager() : policy_(AttendancePolicy::defaults()) {}

bool ConfigManager::load(const std::string& path) {
    AttendancePolicy p = policy();

    try {
        cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            std::cerr << "Can't open policy file: " << path << std::endl;
            return false;
        }

        cv::FileNode v = fs["verification"];
        if (v.isMap()) {
            read_value(v, "max_attempts", p.verification.max_attempts);
            read_value(v, "timeout_ms", p.verification.timeout_ms);
            read_value(v, "match_threshold", p.verification.match_threshold);
            read_value(v, "location_timeout_ms", p.verification.location_timeout_ms);
        }

        cv::FileNode g = fs["geofence"];
        if (g.isMap()) {
            read_value(g, "max_fix_accuracy_meters", p.geofence.max_fix_accuracy_meters);
        }

        cv::FileNode t = fs["temporary_workplace"];
        if (t.isMap()) {
            read_flag(t, "enabled", p.temporary_workplace.enabled);
            read_flag(t, "require_reason", p.temporary_workplace.require_reason);
            read_flag(t, "require_photo", p.temporary_workplace.require_photo);
            read_flag(t, "require_manager_approval", p.temporary_workplace.require_manager_approval);
            read_value(t, "max_distance_from_workplace", p.temporary_workplace.max_distance_from_workplace);

            cv::FileNode users = t["allowed_users"];
            if (users.isSeq()) {
                p.temporary_workplace.allowed_users.clear();
                for (cv::FileNodeIterator it = users.begin(); it != users.end(); ++it) {
                    p.temporary_workplace.allowed_users.push_back(static_cast<int64_t>(static_cast<int>(*it)));
                }
            }
        }

        cv::FileNode w = fs["attendance"];
        if (w.isMap()) {
            read_value(w, "work_start_hour", p.work_hours.start_hour);
            read_value(w, "work_start_minute", p.work_hours.start_minute);
            read_value(w, "work_end_hour", p.work_hours.end_hour);
            read_value(w, "work_end_minute", p.work_hours.end_minute);
            read_value(w, "late_threshold", p.work_hours.late_threshold);
            read_value(w, "early_leave_threshold", p.work_hours.early_leave_threshold);
            read_value(w, "overtime_threshold", p.work_hours.overtime_threshold);
            read_flag(w, "raise_exception_requests", p.work_hours.raise_exception_requests);
        }

        cv::FileNode s = fs["storage"];
        if (s.isMap()) {
            read_value(s, "database", p.storage.database);
            read_value(s, "photo_dir", p.storage.photo_dir);
        }
    } catch (const cv::Exception& e) {
        std::cerr << "Failed to parse policy file " << path << ": " << e.what() << std::endl;
        return false;
    }

    if (p.verification.max_attempts < 1) {
        std::cerr << "verification.max_attempts must be >= 1, using 1" << std::endl;
        p.verification.max_attempts = 1;
    }

    set_policy(p);
    std::cout << "Policy loaded from " << path << std::endl;
    return true;
}

bool ConfigManager::save(const std::string& path) const {
    AttendancePolicy p = policy();

    try {
        cv::FileStorage fs(path, cv::FileStorage::WRITE);
        if (!fs.isOpened()) {
            std::cerr << "Can't write policy file: " << path << std::endl;
            return false;
        }

        fs << "verification" << "{"
           << "max_attempts" << p.verification.max_attempts
           << "timeout_ms" << p.verification.timeout_ms
           << "match_threshold" << p.verification.match_threshold
           << "location_timeout_ms" << p.verification.location_timeout_ms
           << "}";

        fs << "geofence" << "{"
           << "max_fix_accuracy_meters" << p.geofence.max_fix_accuracy_meters
           << "}";

        fs << "temporary_workplace" << "{"
           << "enabled" << static_cast<int>(p.temporary_workplace.enabled)
           << "require_reason" << static_cast<int>(p.temporary_workplace.require_reason)
           << "require_photo" << static_cast<int>(p.temporary_workplace.require_photo)
           << "require_manager_approval" << static_cast<int>(p.temporary_workplace.require_manager_approval)
           << "max_distance_from_workplace" << p.temporary_workplace.max_distance_from_workplace
           << "allowed_users" << "[";
        for (int64_t id : p.temporary_workplace.allowed_users) {
            fs << static_cast<int>(id);
        }
        fs << "]" << "}";

        fs << "attendance" << "{"
           << "work_start_hour" << p.work_hours.start_hour
           << "work_start_minute" << p.work_hours.start_minute
           << "work_end_hour" << p.work_hours.end_hour
           << "work_end_minute" << p.work_hours.end_minute
           << "late_threshold" << p.work_hours.late_threshold
           << "early_leave_threshold" << p.work_hours.early_leave_threshold
           << "overtime_threshold" << p.work_hours.overtime_threshold
           << "raise_exception_requests" << static_cast<int>(p.work_hours.raise_exception_requests)
           << "}";

        fs << "storage" << "{"
           << "database" << p.storage.database
           << "photo_dir" << p.storage.photo_dir
           << "}";

        fs.release();
    } catch (const cv::Exception& e) {
        std::cerr << "Failed to write policy file " << path << ": " << e.what() << std::endl;
        return false;
    }
    return true;
}

AttendancePolicy ConfigManager::policy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return policy_;
}

void ConfigManager::set_policy(const AttendancePolicy& policy) {
    std::lock_guard<std::mutex> lock(mutex_);
    policy_ = policy;
}

void ConfigManager::reset() {
    set_policy(AttendancePolicy::defaults());
}

} // namespace service
