/**
 * @file geodesy.h
 * @brief 大地测量工具函数
 */

#ifndef GEODESY_H
#define GEODESY_H

#include <string>

namespace core {

enum class AccuracyGrade {
    High,
    Medium,
    Low,
};

double to_radians(double degrees);

/**
 * @brief Haversine 球面距离
 * @param lat1 纬度 (度)
 * @param lng1 经度 (度)
 * @return 两点间大圆距离 (米), 使用平均地球半径 6371000m
 */
double haversine_distance(double lat1, double lng1, double lat2, double lng2);

// 定位精度分级: <10m 高, <50m 中, 其余低
AccuracyGrade grade_accuracy(double accuracy_meters);
const char* to_string(AccuracyGrade grade);

// 距离格式化: 1000m 以内 "85m", 以上 "1.2km"
std::string format_distance(double meters);

} // namespace core

#endif // GEODESY_H
