/**
 * @file location_provider.h
 * @brief 定位服务接口 (GPS 硬件/系统定位由外部实现)
 */

#ifndef LOCATION_PROVIDER_H
#define LOCATION_PROVIDER_H

#include "core/error.h"
#include "database/database_types.h"
#include <chrono>

namespace service {

enum class LocationFailure {
    PermissionDenied,
    Unavailable,
    Timeout,
};

inline core::Error location_error(LocationFailure failure) {
    switch (failure) {
        case LocationFailure::PermissionDenied:
            return core::Error{core::ErrorCode::LocationUnavailable, "location permission denied"};
        case LocationFailure::Unavailable:
            return core::Error{core::ErrorCode::LocationUnavailable, "location unavailable"};
        case LocationFailure::Timeout:
            return core::Error{core::ErrorCode::LocationUnavailable, "location request timed out"};
    }
    return core::Error{core::ErrorCode::LocationUnavailable, "location error"};
}

class LocationProvider {
public:
    virtual ~LocationProvider() = default;

    /**
     * @brief 获取当前位置
     * @param timeout 超时后应返回 location_error(LocationFailure::Timeout)
     */
    virtual core::Result<db::LocationFix> current_fix(std::chrono::milliseconds timeout) = 0;
};

} // namespace service

#endif // LOCATION_PROVIDER_H
