/**
 * @file geofence_engine.cc
 * @brief 地理围栏匹配实现
 * @details 对每个启用的围栏计算 Haversine 距离, 取最小者并与其半径比较。
 *          快照以 shared_ptr<const> 形式发布, 匹配期间替换快照不会影响正在进行的计算。
 */

#include "core/geofence_engine.h"
#include "core/geodesy.h"
#include "database/zone_dao.h"
#include <iostream>

namespace core {

GeofenceEngine::GeofenceEngine()
    : zones_(std::make_shared<const std::vector<db::GeofenceZone>>()) {}

ZoneMatch GeofenceEngine::match_zone(const db::LocationFix& fix, const std::vector<db::GeofenceZone>& zones) {
    ZoneMatch result;

    const db::GeofenceZone* closest = nullptr;
    for (const auto& zone : zones) {
        if (!zone.is_active) continue;

        double distance = haversine_distance(fix.latitude, fix.longitude,
                                             zone.center_lat, zone.center_lng);
        // 严格小于: 距离相同时保留先出现的围栏
        if (distance < result.distance_meters) {
            result.distance_meters = distance;
            closest = &zone;
        }
    }

    if (closest) {
        result.zone = *closest;
        result.within_zone = result.distance_meters <= closest->radius_meters;
    }
    return result;
}

size_t GeofenceEngine::load_from_database() {
    db::ZoneDao dao;
    auto zones = dao.get_all_zones();
    size_t count = zones.size();
    set_zones(std::move(zones));

    std::cout << "Loaded " << count << " geofence zones from database." << std::endl;
    return count;
}

void GeofenceEngine::set_zones(std::vector<db::GeofenceZone> zones) {
    auto next = std::make_shared<const std::vector<db::GeofenceZone>>(std::move(zones));
    std::lock_guard<std::mutex> lock(mutex_);
    zones_ = std::move(next);
}

std::vector<db::GeofenceZone> GeofenceEngine::zones() const {
    return *snapshot();
}

ZoneMatch GeofenceEngine::match(const db::LocationFix& fix) const {
    auto current = snapshot();
    return match_zone(fix, *current);
}

std::shared_ptr<const std::vector<db::GeofenceZone>> GeofenceEngine::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return zones_;
}

} // namespace core
