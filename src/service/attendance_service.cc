/**
 * @file attendance_service.cc
 * @brief 考勤业务逻辑实现
 * @details 串联定位、围栏匹配、人脸验证会话与临时地点打卡, 并对接受的打卡做迟到/早退/加班判定。
 */

#include "service/attendance_service.h"
#include "core/geodesy.h"
#include "service/approval_workflow.h"
#include "service/config_manager.h"
#include "service/location_provider.h"
#include "service/temporary_workplace_handler.h"
#include "service/verification_session_controller.h"
#include <ctime>
#include <iostream>

namespace service {

const char* to_string(AttendanceStatus status) {
    switch (status) {
        case AttendanceStatus::Pending:    return "pending";
        case AttendanceStatus::Normal:     return "normal";
        case AttendanceStatus::Late:       return "late";
        case AttendanceStatus::EarlyLeave: return "early-leave";
        case AttendanceStatus::Overtime:   return "overtime";
    }
    return "unknown";
}

AttendanceService::AttendanceService(core::GeofenceEngine& geofence, LocationProvider& location,
                                     VerificationSessionController& sessions, TemporaryWorkplaceHandler& temporary,
                                     ApprovalWorkflow& approvals, Clock clock)
    : geofence_(geofence), location_(location), sessions_(sessions), temporary_(temporary),
      approvals_(approvals), clock_(std::move(clock)) {}

core::Result<PunchResult> AttendanceService::begin_punch(const PunchRequest& request) {
    const AttendancePolicy policy = ConfigManager::instance().policy();

    db::LocationFix fix;
    if (request.fix) {
        fix = *request.fix;
    } else {
        auto located = location_.current_fix(std::chrono::milliseconds(policy.verification.location_timeout_ms));
        if (!located.ok()) {
            return core::Error{core::ErrorCode::LocationUnavailable, located.message()};
        }
        fix = located.value();
    }

    if (policy.geofence.max_fix_accuracy_meters > 0 &&
        fix.accuracy_meters > policy.geofence.max_fix_accuracy_meters) {
        return core::Error{core::ErrorCode::LocationUnavailable,
                           std::string("location accuracy too low (") + core::to_string(core::grade_accuracy(fix.accuracy_meters)) +
                           ", " + core::format_distance(fix.accuracy_meters) + ")"};
    }

    core::ZoneMatch match = geofence_.match(fix);
    PunchResult result;
    result.zone_match = match;

    if (match.within_zone) {
        std::cout << "User " << request.user_id << " " << db::to_string(request.type) << " in zone \""
                  << match.zone->name << "\" (" << core::format_distance(match.distance_meters) << ")" << std::endl;

        if (!match.zone->allowed_methods.count(db::PunchMethod::Face)) {
            return accept(request, match, clock_());
        }

        auto session = sessions_.open_session(request.user_id, request.attendance_event_id, request.type,
                                              policy.verification.max_attempts, fix);
        if (!session.ok()) {
            return session.error();
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            PendingPunch pending;
            pending.request = request;
            pending.request.fix = fix;
            pending.zone_match = match;
            pending_[session->session_id] = pending;
        }
        result.session_id = session->session_id;
        return result;
    }

    if (!policy.temporary_workplace.enabled) {
        std::string where = match.zone ? core::format_distance(match.distance_meters) + " from \"" + match.zone->name + "\""
                                       : std::string("no active workplace");
        return core::Error{core::ErrorCode::ZoneMismatch, "outside every workplace (" + where + ")"};
    }

    TemporaryPunchRequest temp;
    temp.user_id = request.user_id;
    temp.manager_id = request.manager_id;
    temp.attendance_event_id = request.attendance_event_id;
    temp.type = request.type;
    temp.fix = fix;
    temp.reason = request.reason;
    temp.photo_ref = request.photo_ref;
    temp.photo = request.photo;
    temp.notes = request.notes;
    temp.save_as_reusable = request.save_as_reusable;
    temp.reusable_name = request.reusable_name;
    temp.reusable_location_id = request.reusable_location_id;
    temp.distance_to_nearest_zone = match.distance_meters;

    auto recorded = temporary_.submit_punch(temp);
    if (!recorded.ok()) {
        return recorded.error();
    }

    result.record_id = recorded->record.record_id;
    if (recorded->approval_id) {
        // 等待主管审批, 台账按待审批记录
        result.accepted = false;
        result.pending_approval_ids.push_back(*recorded->approval_id);
        return result;
    }

    PunchResult accepted = accept(request, match, recorded->record.created_at);
    accepted.record_id = result.record_id;
    return accepted;
}

core::Result<PunchResult> AttendanceService::submit_verification(int64_t session_id, const VerificationSample& sample,
                                                                 std::chrono::milliseconds timeout) {
    auto verified = sessions_.submit_sample(session_id, sample, timeout);
    if (!verified.ok()) {
        if (verified.code() == core::ErrorCode::MaxAttemptsExceeded) {
            take_pending(session_id);
        }
        return verified.error();
    }

    auto pending = take_pending(session_id);
    PendingPunch punch;
    if (pending) {
        punch = *pending;
    } else {
        // 进程重启后恢复的会话, 没有原始请求上下文
        punch.request.user_id = verified->user_id;
        punch.request.attendance_event_id = verified->attendance_event_id;
        punch.request.type = verified->session_type;
        punch.request.fix = verified->location_fix;
        punch.zone_match = geofence_.match(verified->location_fix);
    }

    std::time_t at = verified->completed_at ? *verified->completed_at : clock_();
    PunchResult result = accept(punch.request, punch.zone_match, at);
    result.session_id = session_id;
    return result;
}

core::Status AttendanceService::cancel_punch(int64_t session_id) {
    auto cancelled = sessions_.cancel_session(session_id);
    if (!cancelled.ok()) {
        return core::Status(cancelled.code(), cancelled.message());
    }
    take_pending(session_id);
    return core::Status::success();
}

AttendanceStatus AttendanceService::classify(db::PunchType type, std::time_t at) const {
    const WorkHoursPolicy hours = ConfigManager::instance().policy().work_hours;

    std::tm local_tm{};
    localtime_r(&at, &local_tm);
    int minute_of_day = local_tm.tm_hour * 60 + local_tm.tm_min;
    int start = hours.start_hour * 60 + hours.start_minute;
    int end = hours.end_hour * 60 + hours.end_minute;

    if (type == db::PunchType::ClockIn) {
        return minute_of_day > start + hours.late_threshold ? AttendanceStatus::Late : AttendanceStatus::Normal;
    }
    if (minute_of_day < end - hours.early_leave_threshold) {
        return AttendanceStatus::EarlyLeave;
    }
    if (minute_of_day > end + hours.overtime_threshold) {
        return AttendanceStatus::Overtime;
    }
    return AttendanceStatus::Normal;
}

PunchResult AttendanceService::accept(const PunchRequest& request, const core::ZoneMatch& zone_match, std::time_t at) {
    PunchResult result;
    result.accepted = true;
    result.zone_match = zone_match;
    result.attendance_status = classify(request.type, at);

    std::cout << "User " << request.user_id << " " << db::to_string(request.type) << " accepted: "
              << to_string(result.attendance_status) << std::endl;

    if (result.attendance_status == AttendanceStatus::Normal ||
        !ConfigManager::instance().policy().work_hours.raise_exception_requests) {
        return result;
    }

    db::ApprovalRequest approval;
    approval.source_event_id = request.attendance_event_id;
    approval.user_id = request.user_id;
    approval.manager_id = request.manager_id;
    approval.requested_at = at;
    switch (result.attendance_status) {
        case AttendanceStatus::Late:       approval.type = db::ApprovalType::Late; break;
        case AttendanceStatus::EarlyLeave: approval.type = db::ApprovalType::EarlyLeave; break;
        default:                           approval.type = db::ApprovalType::Overtime; break;
    }

    std::tm local_tm{};
    localtime_r(&at, &local_tm);
    char when[16];
    std::strftime(when, sizeof(when), "%H:%M", &local_tm);
    approval.reason = std::string(db::to_string(request.type)) + " at " + when;
    if (!request.reason.empty()) {
        approval.reason += ": " + request.reason;
    }

    auto queued = approvals_.enqueue(approval);
    if (queued.ok()) {
        result.pending_approval_ids.push_back(queued.value());
    } else {
        std::cerr << "Failed to raise " << db::to_string(approval.type) << " request for user "
                  << request.user_id << ": " << queued.message() << std::endl;
    }
    return result;
}

std::optional<AttendanceService::PendingPunch> AttendanceService::take_pending(int64_t session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(session_id);
    if (it == pending_.end()) return std::nullopt;
    PendingPunch punch = it->second;
    pending_.erase(it);
    return punch;
}

} // namespace service
