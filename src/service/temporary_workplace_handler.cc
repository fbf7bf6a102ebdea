/**
 * @file temporary_workplace_handler.cc
 * @brief 临时工作地点打卡实现
 */

#include "service/temporary_workplace_handler.h"
#include "core/geodesy.h"
#include "database/database_manager.h"
#include "database/temporary_workplace_dao.h"
#include "service/approval_workflow.h"
#include "service/config_manager.h"
#include "service/photo_store.h"
#include <algorithm>
#include <cmath>
#include <ctime>
#include <iostream>

namespace service {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

std::string format_local(std::time_t t, const char* format) {
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), format, &tm);
    return buf;
}

bool has_photo(const TemporaryPunchRequest& request) {
    return (request.photo_ref && !request.photo_ref->empty()) || !request.photo.empty();
}

} // namespace

TemporaryWorkplaceHandler::TemporaryWorkplaceHandler(ApprovalWorkflow& approvals, Clock clock)
    : approvals_(approvals), clock_(std::move(clock)) {}

core::Status TemporaryWorkplaceHandler::validate(const TemporaryPunchRequest& request) const {
    const TemporaryWorkplacePolicy policy = ConfigManager::instance().policy().temporary_workplace;

    if (!policy.enabled) {
        return core::Status(core::ErrorCode::FeatureDisabled, "temporary workplace punches are disabled");
    }
    if (!policy.allowed_users.empty() &&
        std::find(policy.allowed_users.begin(), policy.allowed_users.end(), request.user_id) == policy.allowed_users.end()) {
        return core::Status(core::ErrorCode::FeatureDisabled,
                            "user " + std::to_string(request.user_id) + " may not use temporary workplaces");
    }
    if (policy.require_reason && trim(request.reason).empty()) {
        return core::Status(core::ErrorCode::MissingReason, "a reason is required for temporary workplace punches");
    }
    if (policy.require_photo && !has_photo(request)) {
        return core::Status(core::ErrorCode::MissingPhoto, "a photo is required for temporary workplace punches");
    }
    // 没有任何围栏时距离为无穷大, 不做距离限制
    if (policy.max_distance_from_workplace > 0 && std::isfinite(request.distance_to_nearest_zone) &&
        request.distance_to_nearest_zone > policy.max_distance_from_workplace) {
        return core::Status(core::ErrorCode::TooFarFromWorkplace,
                            core::format_distance(request.distance_to_nearest_zone) + " from the nearest workplace, limit is " +
                            core::format_distance(policy.max_distance_from_workplace));
    }

    db::TemporaryWorkplaceDao dao;
    if (request.reusable_location_id) {
        auto reusable = dao.get_reusable(*request.reusable_location_id);
        if (!reusable || reusable->user_id != request.user_id || !reusable->is_active) {
            return core::Status(core::ErrorCode::NotFound,
                                "reusable workplace " + std::to_string(*request.reusable_location_id) + " not found");
        }
    } else if (request.save_as_reusable) {
        std::string name = request.reusable_name ? trim(*request.reusable_name) : "";
        if (name.empty()) {
            return core::Status(core::ErrorCode::InvalidArgument, "a name is required to save a reusable workplace");
        }
        if (dao.get_reusable_by_name(request.user_id, name)) {
            return core::Status(core::ErrorCode::AlreadyExists, "reusable workplace \"" + name + "\" already exists");
        }
    }
    return core::Status::success();
}

core::Result<TemporaryPunchOutcome> TemporaryWorkplaceHandler::submit_punch(const TemporaryPunchRequest& request) {
    core::Status status = validate(request);
    if (!status.ok()) {
        std::cerr << "Temporary punch rejected for user " << request.user_id << ": " << status.message() << std::endl;
        return status.error();
    }

    const TemporaryWorkplacePolicy policy = ConfigManager::instance().policy().temporary_workplace;
    const std::time_t now = clock_();

    std::optional<std::string> photo_ref = request.photo_ref;
    std::optional<std::string> archived;   // 本次存档的照片, 事务未提交时删除
    if ((!photo_ref || photo_ref->empty()) && !request.photo.empty()) {
        if (!photo_store_) {
            return core::Error{core::ErrorCode::StorageError, "no photo store configured"};
        }
        auto saved = photo_store_->save(request.user_id, "temp", request.photo);
        if (!saved.ok()) {
            return saved.error();
        }
        photo_ref = saved.value();
        archived = saved.value();
    }

    auto fail = [&](core::ErrorCode code, const std::string& message) -> core::Result<TemporaryPunchOutcome> {
        if (archived && photo_store_) {
            photo_store_->remove(*archived);
        }
        std::cerr << "Temporary punch of user " << request.user_id << " not saved: " << message << std::endl;
        return core::Error{code, message};
    };

    TemporaryPunchOutcome outcome;
    db::TemporaryWorkplaceRecord& record = outcome.record;
    record.user_id = request.user_id;
    record.date = format_local(now, "%Y-%m-%d");
    record.type = request.type;
    record.time = format_local(now, "%H:%M:%S");
    record.location_fix = request.fix;
    record.reason = trim(request.reason);
    record.photo_ref = photo_ref;
    record.notes = request.notes;
    record.created_at = now;

    db::Transaction tx;
    if (!tx.active()) {
        return fail(core::ErrorCode::StorageError, "cannot begin transaction");
    }
    db::TemporaryWorkplaceDao dao;

    if (request.reusable_location_id) {
        if (!dao.touch_reusable(*request.reusable_location_id, now)) {
            return fail(core::ErrorCode::StorageError, "cannot update reusable workplace");
        }
        record.is_reusable = true;
        record.reusable_location_id = request.reusable_location_id;
    } else if (request.save_as_reusable) {
        db::ReusableWorkplace workplace;
        workplace.user_id = request.user_id;
        workplace.name = trim(*request.reusable_name);
        // 校验之后可能有并发提交抢先保存同名地点, 事务内再查一次
        if (dao.get_reusable_by_name(workplace.user_id, workplace.name)) {
            return fail(core::ErrorCode::AlreadyExists, "reusable workplace \"" + workplace.name + "\" already exists");
        }
        workplace.location_fix = request.fix;
        workplace.reason = record.reason;
        workplace.is_active = true;
        workplace.usage_count = 1;
        workplace.last_used_at = now;
        int64_t id = dao.add_reusable(workplace);
        if (id < 0) {
            return fail(core::ErrorCode::StorageError, "cannot save reusable workplace");
        }
        record.is_reusable = true;
        record.reusable_location_id = id;
    }

    record.record_id = dao.add_record(record);
    if (record.record_id < 0) {
        return fail(core::ErrorCode::StorageError, "cannot save temporary workplace record");
    }

    if (policy.require_manager_approval) {
        db::ApprovalRequest approval;
        approval.source_event_id = request.attendance_event_id.empty()
            ? "temporary-record-" + std::to_string(record.record_id)
            : request.attendance_event_id;
        approval.user_id = request.user_id;
        approval.manager_id = request.manager_id;
        approval.type = db::ApprovalType::TemporaryWorkplace;
        approval.reason = record.reason;
        approval.requested_at = now;

        auto queued = approvals_.enqueue(approval, false);
        if (!queued.ok()) {
            return fail(queued.code(), queued.message());
        }
        outcome.approval_id = queued.value();
    }

    if (!tx.commit()) {
        return fail(core::ErrorCode::StorageError, "cannot commit temporary workplace punch");
    }

    if (record.reusable_location_id) {
        outcome.reusable = dao.get_reusable(*record.reusable_location_id);
    }
    if (outcome.approval_id) {
        approvals_.notify_requested(*outcome.approval_id);
    }

    std::cout << "Temporary workplace " << db::to_string(record.type) << " recorded: user=" << record.user_id
              << " record=" << record.record_id << " at " << record.date << " " << record.time
              << (outcome.approval_id ? " (pending approval)" : " (self-approved)") << std::endl;
    return outcome;
}

std::vector<db::TemporaryWorkplaceRecord> TemporaryWorkplaceHandler::list_records(int64_t user_id, std::time_t start_time,
                                                                                  std::time_t end_time) const {
    db::TemporaryWorkplaceDao dao;
    return dao.get_records_by_user(user_id, start_time, end_time);
}

std::vector<db::ReusableWorkplace> TemporaryWorkplaceHandler::list_reusable(int64_t user_id) const {
    db::TemporaryWorkplaceDao dao;
    return dao.get_reusable_by_user(user_id, true);
}

core::Status TemporaryWorkplaceHandler::deactivate_reusable(int64_t user_id, int64_t reusable_id) {
    db::TemporaryWorkplaceDao dao;
    auto reusable = dao.get_reusable(reusable_id);
    if (!reusable || reusable->user_id != user_id) {
        return core::Status(core::ErrorCode::NotFound, "reusable workplace " + std::to_string(reusable_id) + " not found");
    }
    if (!dao.set_reusable_active(reusable_id, false)) {
        return core::Status(core::ErrorCode::StorageError, "cannot deactivate reusable workplace");
    }
    return core::Status::success();
}

} // namespace service
