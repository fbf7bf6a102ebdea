/**
 * @file config.h
 * @brief 全局配置常量 - 集中管理所有可调参数
 *
 * 配置分类：
 * - [固定] 系统常量，不可运行时修改
 * - [默认] 策略项的默认值，运行时从 ConfigManager 读取
 *
 * 使用方法：
 *   #include "config.h"
 *   double r = Config::Geo::EARTH_RADIUS_METERS;          // 固定常量
 *   int n = Config::Default::MAX_VERIFY_ATTEMPTS;          // 默认值
 */

#pragma once

#include <cstddef>

namespace Config {

// ==================== 路径配置 [默认] ====================
namespace Path {
    constexpr const char* DATABASE = "./data.db";
    constexpr const char* PHOTO_DIR = "./data/photos/";
    constexpr const char* POLICY_FILE = "./policy.yml";
}

// ==================== 地理参数 [固定] ====================
namespace Geo {
    constexpr double EARTH_RADIUS_METERS = 6371000.0;  // 平均地球半径
    constexpr double ACCURACY_HIGH_METERS = 10.0;      // 定位精度 "高" 上限
    constexpr double ACCURACY_MEDIUM_METERS = 50.0;    // 定位精度 "中" 上限
}

// ==================== 特征参数 [固定] ====================
namespace Model {
    constexpr int FEATURE_DIM = 512;                   // 人脸特征向量维度
}

// ==================== 性能参数 [固定] ====================
namespace Performance {
    constexpr int VERIFY_WORKER_THREADS = 2;           // 调用验证服务的工作线程数
    constexpr size_t VERIFY_QUEUE_MAX_SIZE = 32;       // 等待验证的样本上限
}

// ==================== 证据照片 [固定] ====================
namespace Photo {
    constexpr int MAX_DIMENSION = 1280;                // 存档照片最长边
    constexpr int JPEG_QUALITY = 90;
}

// ==================== 默认值 [策略可配置] ====================
// 这些值仅作为 ConfigManager 的初始默认值
namespace Default {
    // 身份验证
    constexpr int MAX_VERIFY_ATTEMPTS = 3;             // 单次打卡最多验证次数
    constexpr int VERIFY_TIMEOUT_MS = 10000;           // 验证服务超时 (毫秒)
    constexpr float MATCH_THRESHOLD = 0.60f;           // 人脸相似度阈值
    constexpr int LOCATION_TIMEOUT_MS = 15000;         // 定位超时 (毫秒)

    // 地理围栏
    constexpr double MAX_FIX_ACCURACY_METERS = 100.0;  // 定位精度低于此值才可打卡, 0 表示不限制

    // 临时工作地点
    constexpr bool TEMP_WORKPLACE_ENABLED = true;
    constexpr bool TEMP_REQUIRE_REASON = true;
    constexpr bool TEMP_REQUIRE_PHOTO = false;
    constexpr bool TEMP_REQUIRE_APPROVAL = true;
    constexpr double TEMP_MAX_DISTANCE_METERS = 5000.0; // 距最近工作地点最大距离, 0 表示不限制

    // 考勤设置
    constexpr int WORK_START_HOUR = 9;                 // 上班时间 (时)
    constexpr int WORK_START_MINUTE = 0;               // 上班时间 (分)
    constexpr int WORK_END_HOUR = 18;                  // 下班时间 (时)
    constexpr int WORK_END_MINUTE = 0;                 // 下班时间 (分)
    constexpr int LATE_THRESHOLD = 30;                 // 迟到阈值 (分钟)
    constexpr int EARLY_LEAVE_THRESHOLD = 30;          // 早退阈值 (分钟)
    constexpr int OVERTIME_THRESHOLD = 60;             // 加班阈值 (分钟)
    constexpr bool RAISE_EXCEPTION_REQUESTS = true;    // 迟到/早退/加班自动提交审批
}

} // namespace Config
