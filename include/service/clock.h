/**
 * @file clock.h
 * @brief 可注入的时间源
 * @details 服务层取当前时间都经过 Clock, 测试中替换为手动时钟。
 */

#ifndef SERVICE_CLOCK_H
#define SERVICE_CLOCK_H

#include <ctime>
#include <functional>

namespace service {

// 可注入的时间源 (测试中固定时间)
using Clock = std::function<std::time_t()>;

inline Clock system_clock() {
    return [] { return std::time(nullptr); };
}

} // namespace service

#endif // SERVICE_CLOCK_H
