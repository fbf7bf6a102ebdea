#ifndef TEST_SUPPORT_H
#define TEST_SUPPORT_H

#include <gtest/gtest.h>
#include "core/error.h"
#include "database/database_manager.h"
#include "service/clock.h"
#include "service/config_manager.h"
#include "service/location_provider.h"
#include "service/verification_provider.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace testing_support {

// 每个用例使用独立的内存数据库和默认策略
class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        db::DatabaseManager::instance().close();
        ASSERT_TRUE(db::DatabaseManager::instance().open(":memory:"));
        service::ConfigManager::instance().reset();
    }

    void TearDown() override {
        db::DatabaseManager::instance().close();
        service::ConfigManager::instance().reset();
    }
};

// 本地时间 2024-03-15 hh:mm
inline std::time_t local_time(int hour, int minute) {
    std::tm tm{};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon = 2;
    tm.tm_mday = 15;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_isdst = -1;
    return std::mktime(&tm);
}

class ManualClock {
public:
    explicit ManualClock(std::time_t start) : now_(start) {}

    service::Clock clock() {
        return [this] { return now_.load(); };
    }
    void set(std::time_t t) { now_ = t; }
    void advance(std::time_t seconds) { now_ += seconds; }

private:
    std::atomic<std::time_t> now_;
};

// 按顺序返回预设结果, 用完后返回失败
class ScriptedVerificationProvider : public service::VerificationProvider {
public:
    void push_outcome(bool success, float confidence, const std::string& reason = "") {
        db::VerificationOutcome outcome;
        outcome.success = success;
        outcome.confidence_percent = confidence;
        outcome.failure_reason = reason;
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(core::Result<db::VerificationOutcome>(outcome));
    }

    void push_unavailable(const std::string& message = "camera not available") {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(core::Result<db::VerificationOutcome>(core::ErrorCode::ProviderUnavailable, message));
    }

    core::Result<db::VerificationOutcome> verify(const service::VerificationSample& sample,
                                                 std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_;
        last_user_ = sample.user_id;
        last_timeout_ = timeout;
        if (script_.empty()) {
            db::VerificationOutcome outcome;
            outcome.failure_reason = "no match";
            return outcome;
        }
        auto next = script_.front();
        script_.pop_front();
        return next;
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }
    int64_t last_user() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_user_;
    }
    std::chrono::milliseconds last_timeout() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_timeout_;
    }

private:
    std::deque<core::Result<db::VerificationOutcome>> script_;
    int calls_ = 0;
    int64_t last_user_ = -1;
    std::chrono::milliseconds last_timeout_{0};
    mutable std::mutex mutex_;
};

// 慢速验证服务: 调用阻塞到 release() 之后才返回预设结果
class GatedVerificationProvider : public service::VerificationProvider {
public:
    explicit GatedVerificationProvider(bool success = true, float confidence = 90.0f)
        : success_(success), confidence_(confidence) {}

    core::Result<db::VerificationOutcome> verify(const service::VerificationSample&,
                                                 std::chrono::milliseconds) override {
        std::unique_lock<std::mutex> lock(mutex_);
        ++started_;
        started_cv_.notify_all();
        release_cv_.wait_for(lock, std::chrono::seconds(5), [this] { return released_; });
        ++finished_;
        db::VerificationOutcome outcome;
        outcome.success = success_;
        outcome.confidence_percent = confidence_;
        if (!success_) outcome.failure_reason = "no match";
        return outcome;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        release_cv_.notify_all();
    }

    bool wait_started(int count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return started_cv_.wait_for(lock, timeout, [&] { return started_ >= count; });
    }

    int finished() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return finished_;
    }

private:
    bool success_;
    float confidence_;
    bool released_ = false;
    int started_ = 0;
    int finished_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable started_cv_;
    std::condition_variable release_cv_;
};

class FixedLocationProvider : public service::LocationProvider {
public:
    void set_fix(double lat, double lng, double accuracy = 5.0) {
        fix_.latitude = lat;
        fix_.longitude = lng;
        fix_.accuracy_meters = accuracy;
        failure_.reset();
    }
    void fail(service::LocationFailure failure) { failure_ = failure; }

    core::Result<db::LocationFix> current_fix(std::chrono::milliseconds) override {
        if (failure_) {
            return service::location_error(*failure_);
        }
        return fix_;
    }

private:
    db::LocationFix fix_;
    std::optional<service::LocationFailure> failure_;
};

inline db::LocationFix make_fix(double lat, double lng, double accuracy = 5.0, std::time_t at = 0) {
    db::LocationFix fix;
    fix.latitude = lat;
    fix.longitude = lng;
    fix.accuracy_meters = accuracy;
    fix.captured_at = at;
    return fix;
}

inline db::GeofenceZone make_zone(const std::string& name, double lat, double lng, double radius) {
    db::GeofenceZone zone;
    zone.name = name;
    zone.center_lat = lat;
    zone.center_lng = lng;
    zone.radius_meters = radius;
    return zone;
}

inline service::VerificationSample sample_with_ref(const std::string& ref) {
    service::VerificationSample sample;
    sample.image_ref = ref;
    return sample;
}

} // namespace testing_support

#endif // TEST_SUPPORT_H
