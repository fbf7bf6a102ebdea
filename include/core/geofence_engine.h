/**
 * @file geofence_engine.h
 * @brief 地理围栏匹配
 */

#ifndef GEOFENCE_ENGINE_H
#define GEOFENCE_ENGINE_H

#include "database/database_types.h"
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace core {

struct ZoneMatch {
    std::optional<db::GeofenceZone> zone;   // 最近的有效围栏, 无有效围栏时为空
    double distance_meters = std::numeric_limits<double>::infinity();  // 无有效围栏时为 +inf
    bool within_zone = false;
};

/**
 * @brief 地理围栏引擎
 * 持有围栏注册表的只读快照, 匹配计算本身无副作用。
 * 围栏的增删改由外部管理端负责, 这里只在需要时重新加载快照。
 */
class GeofenceEngine {
public:
    GeofenceEngine();

    /**
     * @brief 找出距离最近的有效围栏并判断定位点是否在其半径内
     * @details 距离相同时取列表中靠前的围栏; 边界 (distance == radius) 视为在围栏内
     */
    static ZoneMatch match_zone(const db::LocationFix& fix, const std::vector<db::GeofenceZone>& zones);

    // 从数据库加载全部围栏 (按录入顺序)
    size_t load_from_database();

    void set_zones(std::vector<db::GeofenceZone> zones);
    std::vector<db::GeofenceZone> zones() const;

    // 使用当前快照匹配
    ZoneMatch match(const db::LocationFix& fix) const;

private:
    std::shared_ptr<const std::vector<db::GeofenceZone>> snapshot() const;

    std::shared_ptr<const std::vector<db::GeofenceZone>> zones_;
    mutable std::mutex mutex_;
};

} // namespace core

#endif // GEOFENCE_ENGINE_H
