/**
 * @file notification_hub.h
 * @brief 下游告警事件分发
 * @details 事件载荷仅包含实体 id 与类型/状态, 推送渠道由订阅方实现。
 */

#ifndef NOTIFICATION_HUB_H
#define NOTIFICATION_HUB_H

#include <cstdint>
#include <ctime>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace service {

enum class NotificationType {
    ApprovalRequested,
    ApprovalDecided,
    VerificationFailed,
};

// "approval.requested" / "approval.decided" / "verification.failed"
const char* to_string(NotificationType type);

struct Notification {
    NotificationType type = NotificationType::ApprovalRequested;
    int64_t entity_id = -1;           // 审批单 id 或会话 id
    std::string kind;                 // 审批类型, 或打卡类型
    std::string status;               // 审批状态, 或会话状态
    std::time_t emitted_at = 0;
};

class NotificationHub {
public:
    using Callback = std::function<void(const Notification&)>;

    // 返回订阅句柄, 用于取消订阅
    int subscribe(Callback callback);
    void unsubscribe(int token);

    void publish(const Notification& notification);

    size_t subscriber_count() const;

private:
    std::map<int, Callback> subscribers_;
    int next_token_ = 1;
    mutable std::mutex mutex_;
};

} // namespace service

#endif // NOTIFICATION_HUB_H
