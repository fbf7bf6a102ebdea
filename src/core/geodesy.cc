/**
 * @file geodesy.cc
 * @brief 大地测量工具函数实现
 */

#include "core/geodesy.h"
#include "config.h"
#include <cmath>
#include <cstdio>

namespace core {

namespace {
constexpr double kPi = 3.14159265358979323846;
}

double to_radians(double degrees) {
    return degrees * kPi / 180.0;
}

double haversine_distance(double lat1, double lng1, double lat2, double lng2) {
    const double phi1 = to_radians(lat1);
    const double phi2 = to_radians(lat2);
    const double d_phi = to_radians(lat2 - lat1);
    const double d_lambda = to_radians(lng2 - lng1);

    const double a = std::sin(d_phi / 2) * std::sin(d_phi / 2) +
                     std::cos(phi1) * std::cos(phi2) *
                     std::sin(d_lambda / 2) * std::sin(d_lambda / 2);
    // 浮点误差可能让 a 略大于 1
    const double c = 2 * std::atan2(std::sqrt(a), std::sqrt(std::fmax(0.0, 1.0 - a)));

    return Config::Geo::EARTH_RADIUS_METERS * c;
}

AccuracyGrade grade_accuracy(double accuracy_meters) {
    if (accuracy_meters < Config::Geo::ACCURACY_HIGH_METERS) return AccuracyGrade::High;
    if (accuracy_meters < Config::Geo::ACCURACY_MEDIUM_METERS) return AccuracyGrade::Medium;
    return AccuracyGrade::Low;
}

const char* to_string(AccuracyGrade grade) {
    switch (grade) {
        case AccuracyGrade::High:   return "high";
        case AccuracyGrade::Medium: return "medium";
        case AccuracyGrade::Low:    return "low";
    }
    return "unknown";
}

std::string format_distance(double meters) {
    char buf[32];
    if (meters < 1000.0) {
        std::snprintf(buf, sizeof(buf), "%.0fm", std::round(meters));
    } else {
        std::snprintf(buf, sizeof(buf), "%.1fkm", meters / 1000.0);
    }
    return buf;
}

} // namespace core
