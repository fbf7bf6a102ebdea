/**
 * @file verification_session_controller.h
 * @brief 身份验证会话控制器
 * @details 管理进行中的验证会话: 原子开启、提交样本并调用验证服务、取消, 并将会话与验证记录落库。
 */

#ifndef VERIFICATION_SESSION_CONTROLLER_H
#define VERIFICATION_SESSION_CONTROLLER_H

#include "core/error.h"
#include "database/database_types.h"
#include "service/clock.h"
#include "service/verification_provider.h"
#include "service/verification_worker.h"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace service {

class NotificationHub;
class PhotoStore;

class VerificationSessionController {
public:
    explicit VerificationSessionController(VerificationProvider& provider, Clock clock = system_clock());
    ~VerificationSessionController();

    // 可选: 样本图像存档 / 下游通知
    void set_photo_store(PhotoStore* store) { photo_store_ = store; }
    void set_notification_hub(NotificationHub* hub) { hub_ = hub; }

    // 恢复数据库中未结束的会话 (verifying 状态按验证服务中断处理, 回到 capturing)
    size_t load_from_database();

    /**
     * @brief 开启会话 (pending -> capturing)
     * @return 同一 (用户, 考勤事件) 已有未结束会话时返回 SessionAlreadyOpen
     */
    core::Result<db::VerificationSession> open_session(int64_t user_id, const std::string& attendance_event_id,
                                                       db::PunchType type, int max_attempts,
                                                       const db::LocationFix& fix);

    /**
     * @brief 提交一次样本并最多等待 timeout
     * @return 验证通过返回已完成的会话; 其余情况返回错误:
     *   VerificationFailed    验证未通过, 仍有剩余次数
     *   MaxAttemptsExceeded   次数用尽, 会话已失败, 需要重新注册人脸
     *   ProviderUnavailable   验证服务不可达或超时, 不计入次数, 会话回到 capturing
     *   InvalidTransition     等待期间会话已被取消, 结果丢弃
     */
    core::Result<db::VerificationSession> submit_sample(int64_t session_id, VerificationSample sample,
                                                        std::chrono::milliseconds timeout);

    // 取消会话 (任意非终态 -> cancelled), 已有的验证记录保留; 不等待进行中的验证
    core::Result<db::VerificationSession> cancel_session(int64_t session_id);

    // 进行中的会话直接返回内存状态, 已结束的会话从数据库读取
    std::optional<db::VerificationSession> get_session(int64_t session_id) const;

    size_t open_session_count() const;

private:
    struct Slot {
        std::mutex mutex;
        db::VerificationSession session;
        bool closed = false;
    };
    using Key = std::pair<int64_t, std::string>;

    std::shared_ptr<Slot> find_slot(int64_t session_id) const;
    core::Error missing_session(int64_t session_id) const;
    void close_slot(Slot& slot);
    void discard_photo(const std::optional<std::string>& ref);
    void publish_failure(const db::VerificationSession& session);

    VerificationWorker worker_;
    Clock clock_;
    PhotoStore* photo_store_ = nullptr;
    NotificationHub* hub_ = nullptr;

    std::map<int64_t, std::shared_ptr<Slot>> sessions_;   // 仅未结束的会话
    std::map<Key, int64_t> open_keys_;
    mutable std::mutex registry_mutex_;
};

} // namespace service

#endif // VERIFICATION_SESSION_CONTROLLER_H
