/**
 * @file verification_session_controller.cc
 * @brief 身份验证会话控制器实现
 *
 * 锁的层次:
 *   registry_mutex_   保护会话表, 只在查找/开启/关闭时短暂持有
 *   Slot::mutex       保护单个会话的状态, 调用验证服务期间不持有
 * 先取 Slot::mutex 再取 registry_mutex_, 反之不允许。
 * 验证服务在 VerificationWorker 线程中执行, 提交方按调用方给定的超时等待;
 * 等待期间会话处于 verifying, 此时取消会话优先, 迟到的结果被丢弃。
 */

#include "service/verification_session_controller.h"
#include "core/verification_session.h"
#include "database/database_manager.h"
#include "database/session_dao.h"
#include "service/notification_hub.h"
#include "service/photo_store.h"
#include <iostream>

namespace service {

VerificationSessionController::VerificationSessionController(VerificationProvider& provider, Clock clock)
    : worker_(provider), clock_(std::move(clock)) {
    worker_.start();
}

VerificationSessionController::~VerificationSessionController() {
    worker_.stop();
}

size_t VerificationSessionController::load_from_database() {
    db::SessionDao dao;
    auto open = dao.get_open_sessions();

    std::lock_guard<std::mutex> lock(registry_mutex_);
    sessions_.clear();
    open_keys_.clear();
    for (auto& session : open) {
        if (session.state == db::SessionState::Verifying) {
            // 进程在等待验证结果时退出, 这次样本作废
            auto restored = core::transition(session, core::SessionEvent::provider_unavailable(clock_()));
            if (restored.ok()) {
                session = restored.value();
                if (!dao.update_session(session)) {
                    std::cerr << "Failed to reset session " << session.session_id << std::endl;
                }
            }
        } else if (session.state == db::SessionState::Pending) {
            auto restored = core::transition(session, core::SessionEvent::start(clock_()));
            if (restored.ok()) {
                session = restored.value();
                if (!dao.update_session(session)) {
                    std::cerr << "Failed to start session " << session.session_id << std::endl;
                }
            }
        }
        auto slot = std::make_shared<Slot>();
        slot->session = session;
        open_keys_[Key(session.user_id, session.attendance_event_id)] = session.session_id;
        sessions_[session.session_id] = slot;
    }

    std::cout << "Restored " << sessions_.size() << " open verification sessions." << std::endl;
    return sessions_.size();
}

core::Result<db::VerificationSession> VerificationSessionController::open_session(
    int64_t user_id, const std::string& attendance_event_id, db::PunchType type,
    int max_attempts, const db::LocationFix& fix) {
    if (attendance_event_id.empty()) {
        return core::Error{core::ErrorCode::InvalidArgument, "attendance event id is empty"};
    }

    std::lock_guard<std::mutex> lock(registry_mutex_);
    Key key(user_id, attendance_event_id);
    if (open_keys_.count(key)) {
        return core::Error{core::ErrorCode::SessionAlreadyOpen,
                           "user " + std::to_string(user_id) + " already has an open session for " + attendance_event_id};
    }

    auto started = core::transition(core::make_session(user_id, attendance_event_id, type, max_attempts, fix, clock_()),
                                    core::SessionEvent::start(clock_()));
    if (!started.ok()) {
        return started.error();
    }
    db::VerificationSession session = started.value();

    db::SessionDao dao;
    int64_t id = dao.create_session(session);
    if (id < 0) {
        // 唯一索引冲突: 其他进程已为该事件开启会话
        return core::Error{core::ErrorCode::SessionAlreadyOpen,
                           "cannot create session for " + attendance_event_id};
    }
    session.session_id = id;

    auto slot = std::make_shared<Slot>();
    slot->session = session;
    sessions_[id] = slot;
    open_keys_[key] = id;

    std::cout << "Session " << id << " opened: user=" << user_id << " event=" << attendance_event_id
              << " type=" << db::to_string(type) << " max_attempts=" << session.max_attempts << std::endl;
    return session;
}

core::Result<db::VerificationSession> VerificationSessionController::submit_sample(
    int64_t session_id, VerificationSample sample, std::chrono::milliseconds timeout) {
    auto slot = find_slot(session_id);
    if (!slot) {
        return missing_session(session_id);
    }

    // 第一段: capturing -> verifying, 之后释放 Slot::mutex, 取消与查询不必等待验证服务
    db::VerificationSession current;
    std::optional<std::string> archived;   // 本次存档的照片, 未被验证记录引用时删除
    {
        std::lock_guard<std::mutex> slot_lock(slot->mutex);
        if (slot->closed) {
            return missing_session(session_id);
        }
        current = slot->session;
        if (current.state != db::SessionState::Capturing) {
            return core::Error{core::ErrorCode::InvalidTransition,
                               std::string("session is ") + db::to_string(current.state)};
        }

        if (sample.image_ref.empty() && !sample.image.empty() && photo_store_) {
            auto saved = photo_store_->save(current.user_id, "verify", sample.image);
            if (!saved.ok()) {
                return saved.error();
            }
            sample.image_ref = saved.value();
            archived = saved.value();
        }

        auto verifying = core::transition(current, core::SessionEvent::submit_sample(sample.image_ref, clock_()));
        if (!verifying.ok()) {
            discard_photo(archived);
            return verifying.error();
        }
        slot->session = verifying.value();
    }

    sample.user_id = current.user_id;
    auto outcome = worker_.verify(sample, timeout);

    // 第二段: 会话期间可能已被取消
    std::lock_guard<std::mutex> slot_lock(slot->mutex);
    if (slot->closed || slot->session.state != db::SessionState::Verifying) {
        discard_photo(archived);
        std::cerr << "Dropping verification result of session " << session_id << ": session is "
                  << db::to_string(slot->session.state) << std::endl;
        return core::Error{core::ErrorCode::InvalidTransition,
                           std::string("session is ") + db::to_string(slot->session.state)};
    }

    if (!outcome.ok()) {
        // 不计入次数; capturing 与库中状态一致, 无需写库
        auto back = core::transition(slot->session, core::SessionEvent::provider_unavailable(clock_()));
        slot->session = back.ok() ? back.value() : current;
        discard_photo(archived);
        std::cerr << "Verification provider error on session " << session_id << ": "
                  << outcome.message() << std::endl;
        return core::Error{core::ErrorCode::ProviderUnavailable,
                           outcome.message().empty() ? "verification provider unavailable" : outcome.message()};
    }

    db::LocationFix fix = sample.fix ? *sample.fix : current.location_fix;
    auto reported = core::transition(slot->session,
                                     core::SessionEvent::report_outcome(outcome.value(), fix, clock_()));
    if (!reported.ok()) {
        slot->session = current;
        discard_photo(archived);
        return reported.error();
    }
    db::VerificationSession next = reported.value();

    {
        db::Transaction tx;
        db::SessionDao dao;
        int64_t attempt_id = tx.active() ? dao.add_attempt(next.attempts.back()) : -1;
        if (attempt_id < 0 || !dao.update_session(next) || !tx.commit()) {
            slot->session = current;
            discard_photo(archived);
            return core::Error{core::ErrorCode::StorageError,
                               "cannot persist attempt of session " + std::to_string(session_id)};
        }
        next.attempts.back().attempt_id = attempt_id;
    }
    slot->session = next;

    const auto& attempt = next.attempts.back();
    std::cout << "Session " << session_id << " attempt " << attempt.attempt_number << "/" << next.max_attempts
              << (attempt.outcome.success ? " passed" : " failed")
              << " confidence=" << attempt.outcome.confidence_percent << std::endl;

    switch (next.state) {
    case db::SessionState::Completed:
        close_slot(*slot);
        return next;
    case db::SessionState::Failed:
        close_slot(*slot);
        publish_failure(next);
        return core::Error{core::ErrorCode::MaxAttemptsExceeded,
                           "verification failed " + std::to_string(next.max_attempts) +
                           " times, face re-registration required"};
    default:
        return core::Error{core::ErrorCode::VerificationFailed,
                           (attempt.outcome.failure_reason.empty() ? std::string("verification failed")
                                                                   : attempt.outcome.failure_reason) +
                           ", " + std::to_string(core::remaining_attempts(next)) + " attempts left"};
    }
}

core::Result<db::VerificationSession> VerificationSessionController::cancel_session(int64_t session_id) {
    auto slot = find_slot(session_id);
    if (!slot) {
        return missing_session(session_id);
    }

    std::lock_guard<std::mutex> slot_lock(slot->mutex);
    if (slot->closed) {
        return missing_session(session_id);
    }

    auto cancelled = core::transition(slot->session, core::SessionEvent::cancel(clock_()));
    if (!cancelled.ok()) {
        return cancelled.error();
    }

    db::SessionDao dao;
    if (!dao.update_session(cancelled.value())) {
        return core::Error{core::ErrorCode::StorageError, "cannot persist cancellation"};
    }
    slot->session = cancelled.value();
    close_slot(*slot);

    std::cout << "Session " << session_id << " cancelled after "
              << slot->session.attempts.size() << " attempts" << std::endl;
    return slot->session;
}

std::optional<db::VerificationSession> VerificationSessionController::get_session(int64_t session_id) const {
    auto slot = find_slot(session_id);
    if (slot) {
        std::lock_guard<std::mutex> slot_lock(slot->mutex);
        return slot->session;
    }
    db::SessionDao dao;
    return dao.get_session(session_id);
}

size_t VerificationSessionController::open_session_count() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return sessions_.size();
}

std::shared_ptr<VerificationSessionController::Slot> VerificationSessionController::find_slot(int64_t session_id) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

core::Error VerificationSessionController::missing_session(int64_t session_id) const {
    db::SessionDao dao;
    auto stored = dao.get_session(session_id);
    if (stored && core::is_terminal(stored->state)) {
        return core::Error{core::ErrorCode::InvalidTransition,
                           "session " + std::to_string(session_id) + " is " + db::to_string(stored->state)};
    }
    return core::Error{core::ErrorCode::NotFound, "session " + std::to_string(session_id) + " not found"};
}

void VerificationSessionController::close_slot(Slot& slot) {
    slot.closed = true;
    std::lock_guard<std::mutex> lock(registry_mutex_);
    sessions_.erase(slot.session.session_id);
    open_keys_.erase(Key(slot.session.user_id, slot.session.attendance_event_id));
}

void VerificationSessionController::discard_photo(const std::optional<std::string>& ref) {
    if (ref && photo_store_) {
        photo_store_->remove(*ref);
    }
}

void VerificationSessionController::publish_failure(const db::VerificationSession& session) {
    std::cerr << "Session " << session.session_id << " failed after " << session.attempts.size()
              << " attempts, user " << session.user_id << " must re-register" << std::endl;
    if (!hub_) return;
    Notification n;
    n.type = NotificationType::VerificationFailed;
    n.entity_id = session.session_id;
    n.kind = db::to_string(session.session_type);
    n.status = db::to_string(session.state);
    n.emitted_at = clock_();
    hub_->publish(n);
}

} // namespace service
