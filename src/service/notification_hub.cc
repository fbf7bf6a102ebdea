/**
 * @file notification_hub.cc
 * @brief 下游告警事件分发实现
 */

#include "service/notification_hub.h"
#include <iostream>
#include <vector>

namespace service {

const char* to_string(NotificationType type) {
    switch (type) {
        case NotificationType::ApprovalRequested:  return "approval.requested";
        case NotificationType::ApprovalDecided:    return "approval.decided";
        case NotificationType::VerificationFailed: return "verification.failed";
    }
    return "unknown";
}

int NotificationHub::subscribe(Callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    int token = next_token_++;
    subscribers_[token] = std::move(callback);
    return token;
}

void NotificationHub::unsubscribe(int token) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(token);
}

void NotificationHub::publish(const Notification& notification) {
    // 复制一份回调列表, 回调中允许再订阅/取消订阅
    std::vector<Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : subscribers_) {
            callbacks.push_back(kv.second);
        }
    }

    std::cout << "[notify] " << to_string(notification.type) << " id=" << notification.entity_id
              << " kind=" << notification.kind << " status=" << notification.status << std::endl;

    for (const auto& cb : callbacks) {
        cb(notification);
    }
}

size_t NotificationHub::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

} // namespace service
