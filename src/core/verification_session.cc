/**
 * @file verification_session.cc
 * @brief 身份验证会话状态机实现
 */

#include "core/verification_session.h"
#include <algorithm>

namespace core {

SessionEvent SessionEvent::start(std::time_t at) {
    SessionEvent e;
    e.type = SessionEventType::Start;
    e.at = at;
    return e;
}

SessionEvent SessionEvent::submit_sample(const std::string& image_ref, std::time_t at) {
    SessionEvent e;
    e.type = SessionEventType::SubmitSample;
    e.image_ref = image_ref;
    e.at = at;
    return e;
}

SessionEvent SessionEvent::report_outcome(const db::VerificationOutcome& outcome,
                                          const db::LocationFix& fix, std::time_t at) {
    SessionEvent e;
    e.type = SessionEventType::ReportOutcome;
    e.outcome = outcome;
    e.fix = fix;
    e.at = at;
    return e;
}

SessionEvent SessionEvent::provider_unavailable(std::time_t at) {
    SessionEvent e;
    e.type = SessionEventType::ProviderUnavailable;
    e.at = at;
    return e;
}

SessionEvent SessionEvent::cancel(std::time_t at) {
    SessionEvent e;
    e.type = SessionEventType::Cancel;
    e.at = at;
    return e;
}

db::VerificationSession make_session(int64_t user_id, const std::string& attendance_event_id,
                                     db::PunchType type, int max_attempts,
                                     const db::LocationFix& fix, std::time_t now) {
    db::VerificationSession s;
    s.user_id = user_id;
    s.attendance_event_id = attendance_event_id;
    s.session_type = type;
    s.state = db::SessionState::Pending;
    s.max_attempts = std::max(1, max_attempts);
    s.started_at = now;
    s.location_fix = fix;
    return s;
}

bool is_terminal(db::SessionState state) {
    return state == db::SessionState::Completed ||
           state == db::SessionState::Failed ||
           state == db::SessionState::Cancelled;
}

int remaining_attempts(const db::VerificationSession& session) {
    return std::max(0, session.max_attempts - static_cast<int>(session.attempts.size()));
}

namespace {

Error invalid(const db::VerificationSession& session, const char* event) {
    return Error{ErrorCode::InvalidTransition,
                 std::string("cannot apply ") + event + " in state " + db::to_string(session.state)};
}

// 结束会话并汇总结果
void finish(db::VerificationSession& s, db::SessionState state, std::time_t at) {
    s.state = state;
    s.completed_at = at;

    db::SessionResult r;
    r.success = (state == db::SessionState::Completed);
    r.total_attempts = static_cast<int>(s.attempts.size());

    float sum = 0.0f;
    int count = 0;
    for (const auto& a : s.attempts) {
        // 成功时只统计成功的次数, 失败时统计全部
        if (r.success && !a.outcome.success) continue;
        sum += a.outcome.confidence_percent;
        ++count;
    }
    r.average_confidence = count > 0 ? sum / count : 0.0f;

    if (r.success && !s.attempts.empty()) {
        r.final_image_ref = s.attempts.back().captured_image_ref;
    }
    s.result = r;
}

} // namespace

Result<db::VerificationSession> transition(const db::VerificationSession& session, const SessionEvent& event) {
    db::VerificationSession next = session;

    switch (event.type) {
    case SessionEventType::Start:
        if (session.state != db::SessionState::Pending) return invalid(session, "start");
        next.state = db::SessionState::Capturing;
        next.attempts.clear();
        return next;

    case SessionEventType::SubmitSample:
        if (session.state != db::SessionState::Capturing) return invalid(session, "submit_sample");
        if (event.image_ref.empty()) {
            return Error{ErrorCode::InvalidArgument, "sample has no image reference"};
        }
        next.state = db::SessionState::Verifying;
        next.pending_image_ref = event.image_ref;
        return next;

    case SessionEventType::ReportOutcome: {
        if (session.state != db::SessionState::Verifying) return invalid(session, "report_outcome");

        db::VerificationAttempt attempt;
        attempt.session_id = session.session_id;
        attempt.attempt_number = static_cast<int>(session.attempts.size()) + 1;
        attempt.captured_image_ref = session.pending_image_ref;
        attempt.outcome = event.outcome;
        attempt.outcome.confidence_percent = std::clamp(event.outcome.confidence_percent, 0.0f, 100.0f);
        if (attempt.outcome.success) attempt.outcome.failure_reason.clear();
        attempt.captured_at = event.at;
        attempt.location_fix = event.fix;

        next.attempts.push_back(attempt);
        next.pending_image_ref.clear();

        if (attempt.outcome.success) {
            finish(next, db::SessionState::Completed, event.at);
        } else if (attempt.attempt_number < session.max_attempts) {
            next.state = db::SessionState::Capturing;
        } else {
            finish(next, db::SessionState::Failed, event.at);
        }
        return next;
    }

    case SessionEventType::ProviderUnavailable:
        // 不计入次数, 回到采集状态允许无惩罚重试
        if (session.state != db::SessionState::Verifying) return invalid(session, "provider_unavailable");
        next.state = db::SessionState::Capturing;
        next.pending_image_ref.clear();
        return next;

    case SessionEventType::Cancel:
        if (is_terminal(session.state)) return invalid(session, "cancel");
        next.state = db::SessionState::Cancelled;
        next.completed_at = event.at;
        next.pending_image_ref.clear();
        return next;
    }

    return invalid(session, "unknown event");
}

} // namespace core
