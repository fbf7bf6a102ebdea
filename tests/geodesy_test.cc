#include <gtest/gtest.h>
#include "core/geodesy.h"
#include <cmath>

using namespace core;

TEST(GeodesyTest, SamePointIsZero) {
    EXPECT_DOUBLE_EQ(haversine_distance(37.7749, -122.4194, 37.7749, -122.4194), 0.0);
}

TEST(GeodesyTest, DistanceIsSymmetric) {
    double ab = haversine_distance(39.9042, 116.4074, 31.2304, 121.4737);
    double ba = haversine_distance(31.2304, 121.4737, 39.9042, 116.4074);
    EXPECT_DOUBLE_EQ(ab, ba);
}

TEST(GeodesyTest, KnownDistances) {
    // 纬度 0.0018 度约 200m
    EXPECT_NEAR(haversine_distance(37.7749, -122.4194, 37.7767, -122.4194), 200.15, 0.5);
    // 北京 - 上海约 1068km
    EXPECT_NEAR(haversine_distance(39.9042, 116.4074, 31.2304, 121.4737), 1067e3, 5e3);
}

TEST(GeodesyTest, AntipodalPointsDoNotProduceNaN) {
    double d = haversine_distance(0.0, 0.0, 0.0, 180.0);
    EXPECT_FALSE(std::isnan(d));
    EXPECT_NEAR(d, 3.14159265358979 * 6371000.0, 1.0);
}

TEST(GeodesyTest, AccuracyGrades) {
    EXPECT_EQ(grade_accuracy(3.0), AccuracyGrade::High);
    EXPECT_EQ(grade_accuracy(10.0), AccuracyGrade::Medium);
    EXPECT_EQ(grade_accuracy(49.9), AccuracyGrade::Medium);
    EXPECT_EQ(grade_accuracy(50.0), AccuracyGrade::Low);
    EXPECT_STREQ(to_string(AccuracyGrade::Medium), "medium");
}

TEST(GeodesyTest, FormatDistance) {
    EXPECT_EQ(format_distance(85.4), "85m");
    EXPECT_EQ(format_distance(999.0), "999m");
    EXPECT_EQ(format_distance(1234.0), "1.2km");
    EXPECT_EQ(format_distance(15000.0), "15.0km");
}
