/**
 * @file verification_session.h
 * @brief 身份验证会话状态机
 * @details 状态:
 *   pending -> capturing -> verifying -> completed | failed
 *   verifying -> capturing   (验证失败且仍有剩余次数, 或验证服务不可达)
 *   任意非终态 -> cancelled
 * transition() 为纯函数, 不修改输入会话。
 */

#ifndef VERIFICATION_SESSION_H
#define VERIFICATION_SESSION_H

#include "core/error.h"
#include "database/database_types.h"
#include <string>

namespace core {

enum class SessionEventType {
    Start,                 // 会话创建完成, 开始采集
    SubmitSample,          // 提交当前次的照片/生物特征样本
    ReportOutcome,         // 验证服务返回结果
    ProviderUnavailable,   // 验证服务不可达或超时
    Cancel,
};

struct SessionEvent {
    SessionEventType type = SessionEventType::Start;
    std::time_t at = 0;
    std::string image_ref;           // SubmitSample
    db::VerificationOutcome outcome; // ReportOutcome
    db::LocationFix fix;             // ReportOutcome

    static SessionEvent start(std::time_t at);
    static SessionEvent submit_sample(const std::string& image_ref, std::time_t at);
    static SessionEvent report_outcome(const db::VerificationOutcome& outcome,
                                       const db::LocationFix& fix, std::time_t at);
    static SessionEvent provider_unavailable(std::time_t at);
    static SessionEvent cancel(std::time_t at);
};

/**
 * @brief 创建处于 pending 状态的会话
 * @param max_attempts 小于 1 时按 1 处理
 */
db::VerificationSession make_session(int64_t user_id, const std::string& attendance_event_id,
                                     db::PunchType type, int max_attempts,
                                     const db::LocationFix& fix, std::time_t now);

/**
 * @brief 状态转移
 * @return 新会话; 当前状态不接受该事件时返回 InvalidTransition
 */
Result<db::VerificationSession> transition(const db::VerificationSession& session, const SessionEvent& event);

bool is_terminal(db::SessionState state);

int remaining_attempts(const db::VerificationSession& session);

} // namespace core

#endif // VERIFICATION_SESSION_H
