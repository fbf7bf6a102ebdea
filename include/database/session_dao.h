#ifndef SESSION_DAO_H
#define SESSION_DAO_H

#include "database/database_types.h"
#include <optional>
#include <vector>

namespace db {

/**
 * @brief 验证会话及其验证记录
 */
class SessionDao {
public:
    // 新建会话，返回 session_id；同一 (用户, 事件) 已有未结束会话时返回 -1
    int64_t create_session(const VerificationSession& session);

    // 更新状态与结果 (不涉及 attempts)
    bool update_session(const VerificationSession& session);

    // 追加一次验证记录，返回 attempt_id
    int64_t add_attempt(const VerificationAttempt& attempt);

    // 查询会话 (包含全部验证记录)
    std::optional<VerificationSession> get_session(int64_t session_id);

    // 未结束的会话 (pending/capturing/verifying)
    std::vector<VerificationSession> get_open_sessions();

    std::vector<VerificationAttempt> get_attempts(int64_t session_id);
};

} // namespace db

#endif // SESSION_DAO_H
