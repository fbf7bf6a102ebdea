#ifndef ZONE_DAO_H
#define ZONE_DAO_H

#include "database/database_types.h"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace db {

// 打卡方式与 "face,gps,manual" 形式互转 (库中存储格式, 也用于命令行参数)
std::string format_punch_methods(const std::set<PunchMethod>& methods);
// 含未知方式时返回 std::nullopt
std::optional<std::set<PunchMethod>> parse_punch_methods(const std::string& text);

class ZoneDao {
public:
    // 添加围栏，返回 zone_id，半径非正或失败返回 -1
    int64_t add_zone(const GeofenceZone& zone);

    std::optional<GeofenceZone> get_zone(int64_t zone_id);

    // 全部围栏, 按录入顺序
    std::vector<GeofenceZone> get_all_zones();

    bool update_zone(const GeofenceZone& zone);
    bool set_active(int64_t zone_id, bool active);
    bool delete_zone(int64_t zone_id);
};

} // namespace db

#endif // ZONE_DAO_H
