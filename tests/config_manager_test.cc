#include <gtest/gtest.h>
#include "config.h"
#include "service/config_manager.h"
#include <filesystem>
#include <fstream>

using namespace service;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ConfigManager::instance().reset();
        dir_ = std::filesystem::temp_directory_path() /
               ("attendance_guard_cfg_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        ConfigManager::instance().reset();
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string path(const std::string& name) const { return (dir_ / name).string(); }

    std::filesystem::path dir_;
};

TEST_F(ConfigManagerTest, DefaultsComeFromConfig) {
    AttendancePolicy p = ConfigManager::instance().policy();
    EXPECT_EQ(p.verification.max_attempts, Config::Default::MAX_VERIFY_ATTEMPTS);
    EXPECT_FLOAT_EQ(p.verification.match_threshold, Config::Default::MATCH_THRESHOLD);
    EXPECT_TRUE(p.temporary_workplace.require_reason);
    EXPECT_FALSE(p.temporary_workplace.require_photo);
    EXPECT_TRUE(p.temporary_workplace.allowed_users.empty());
    EXPECT_EQ(p.work_hours.start_hour, 9);
    EXPECT_EQ(p.work_hours.end_hour, 18);
}

TEST_F(ConfigManagerTest, YamlRoundTrip) {
    AttendancePolicy p = ConfigManager::instance().policy();
    p.verification.max_attempts = 5;
    p.verification.match_threshold = 0.72f;
    p.geofence.max_fix_accuracy_meters = 40.0;
    p.temporary_workplace.require_photo = true;
    p.temporary_workplace.allowed_users = {3, 8, 13};
    p.work_hours.start_hour = 8;
    p.work_hours.start_minute = 30;
    p.work_hours.raise_exception_requests = false;
    p.storage.database = "/var/lib/attendance/att.db";
    ConfigManager::instance().set_policy(p);

    ASSERT_TRUE(ConfigManager::instance().save(path("policy.yml")));
    ConfigManager::instance().reset();
    ASSERT_TRUE(ConfigManager::instance().load(path("policy.yml")));

    AttendancePolicy loaded = ConfigManager::instance().policy();
    EXPECT_EQ(loaded.verification.max_attempts, 5);
    EXPECT_NEAR(loaded.verification.match_threshold, 0.72f, 1e-6);
    EXPECT_DOUBLE_EQ(loaded.geofence.max_fix_accuracy_meters, 40.0);
    EXPECT_TRUE(loaded.temporary_workplace.require_photo);
    EXPECT_EQ(loaded.temporary_workplace.allowed_users, (std::vector<int64_t>{3, 8, 13}));
    EXPECT_EQ(loaded.work_hours.start_hour, 8);
    EXPECT_EQ(loaded.work_hours.start_minute, 30);
    EXPECT_FALSE(loaded.work_hours.raise_exception_requests);
    EXPECT_EQ(loaded.storage.database, "/var/lib/attendance/att.db");
}

TEST_F(ConfigManagerTest, PartialFileKeepsOtherValues) {
    {
        std::ofstream out(path("partial.yml"));
        out << "%YAML:1.0\n"
            << "---\n"
            << "temporary_workplace:\n"
            << "   require_reason: 0\n"
            << "   max_distance_from_workplace: 2500.\n";
    }
    ASSERT_TRUE(ConfigManager::instance().load(path("partial.yml")));

    AttendancePolicy p = ConfigManager::instance().policy();
    EXPECT_FALSE(p.temporary_workplace.require_reason);
    EXPECT_DOUBLE_EQ(p.temporary_workplace.max_distance_from_workplace, 2500.0);
    EXPECT_TRUE(p.temporary_workplace.enabled);
    EXPECT_EQ(p.verification.max_attempts, Config::Default::MAX_VERIFY_ATTEMPTS);
}

TEST_F(ConfigManagerTest, MaxAttemptsClampedToOne) {
    {
        std::ofstream out(path("bad.yml"));
        out << "%YAML:1.0\n"
            << "---\n"
            << "verification:\n"
            << "   max_attempts: 0\n";
    }
    ASSERT_TRUE(ConfigManager::instance().load(path("bad.yml")));
    EXPECT_EQ(ConfigManager::instance().policy().verification.max_attempts, 1);
}

TEST_F(ConfigManagerTest, MissingFileFails) {
    EXPECT_FALSE(ConfigManager::instance().load(path("does_not_exist.yml")));
    EXPECT_EQ(ConfigManager::instance().policy().verification.max_attempts, Config::Default::MAX_VERIFY_ATTEMPTS);
}
