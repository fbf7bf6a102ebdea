/**
 * @file zone_dao.cc
 * @brief 地理围栏数据访问对象实现
 */

#include "database/zone_dao.h"
#include "database/database_manager.h"
#include <iostream>
#include <sstream>

namespace db {

std::string format_punch_methods(const std::set<PunchMethod>& methods) {
    std::string out;
    for (auto m : methods) {
        if (!out.empty()) out += ",";
        out += to_string(m);
    }
    return out;
}

std::optional<std::set<PunchMethod>> parse_punch_methods(const std::string& text) {
    std::set<PunchMethod> methods;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item == "face") methods.insert(PunchMethod::Face);
        else if (item == "gps") methods.insert(PunchMethod::Gps);
        else if (item == "manual") methods.insert(PunchMethod::Manual);
        else return std::nullopt;
    }
    return methods;
}

namespace {

GeofenceZone read_zone(sqlite3_stmt* stmt) {
    GeofenceZone z;
    z.zone_id = sqlite3_column_int64(stmt, 0);
    const char* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
    if (name) z.name = name;
    z.center_lat = sqlite3_column_double(stmt, 2);
    z.center_lng = sqlite3_column_double(stmt, 3);
    z.radius_meters = sqlite3_column_double(stmt, 4);
    const char* addr = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 5));
    if (addr) z.address = addr;
    z.is_active = sqlite3_column_int(stmt, 6) != 0;
    const char* methods = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 7));
    auto parsed = parse_punch_methods(methods ? methods : "");
    if (parsed) {
        z.allowed_methods = *parsed;
    } else {
        std::cerr << "Zone " << z.zone_id << " has unknown punch methods: " << methods << std::endl;
        z.allowed_methods.clear();
    }
    return z;
}

} // namespace

int64_t ZoneDao::add_zone(const GeofenceZone& zone) {
    if (zone.radius_meters <= 0) {
        std::cerr << "Rejecting zone '" << zone.name << "': radius must be positive" << std::endl;
        return -1;
    }

    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return -1;

    const char* sql = "INSERT INTO geofence_zones (name, center_lat, center_lng, radius_meters, address, is_active, allowed_methods) VALUES (?, ?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return -1;
    }

    std::string methods = format_punch_methods(zone.allowed_methods);
    sqlite3_bind_text(stmt, 1, zone.name.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_double(stmt, 2, zone.center_lat);
    sqlite3_bind_double(stmt, 3, zone.center_lng);
    sqlite3_bind_double(stmt, 4, zone.radius_meters);
    sqlite3_bind_text(stmt, 5, zone.address.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 6, zone.is_active ? 1 : 0);
    sqlite3_bind_text(stmt, 7, methods.c_str(), -1, SQLITE_STATIC);

    int64_t new_id = -1;
    if (sqlite3_step(stmt) == SQLITE_DONE) {
        new_id = sqlite3_last_insert_rowid(db);
    } else {
        std::cerr << "Insert zone failed: " << sqlite3_errmsg(db) << std::endl;
    }

    sqlite3_finalize(stmt);
    return new_id;
}

std::optional<GeofenceZone> ZoneDao::get_zone(int64_t zone_id) {
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return std::nullopt;

    const char* sql = "SELECT zone_id, name, center_lat, center_lng, radius_meters, address, is_active, allowed_methods FROM geofence_zones WHERE zone_id = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return std::nullopt;

    sqlite3_bind_int64(stmt, 1, zone_id);

    std::optional<GeofenceZone> result = std::nullopt;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = read_zone(stmt);
    }

    sqlite3_finalize(stmt);
    return result;
}

std::vector<GeofenceZone> ZoneDao::get_all_zones() {
    std::vector<GeofenceZone> zones;
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return zones;

    const char* sql = "SELECT zone_id, name, center_lat, center_lng, radius_meters, address, is_active, allowed_methods FROM geofence_zones ORDER BY zone_id ASC";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return zones;

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        zones.push_back(read_zone(stmt));
    }

    sqlite3_finalize(stmt);
    return zones;
}

bool ZoneDao::update_zone(const GeofenceZone& zone) {
    if (zone.radius_meters <= 0) return false;

    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return false;

    const char* sql = "UPDATE geofence_zones SET name=?, center_lat=?, center_lng=?, radius_meters=?, address=?, is_active=?, allowed_methods=? WHERE zone_id=?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;

    std::string methods = format_punch_methods(zone.allowed_methods);
    sqlite3_bind_text(stmt, 1, zone.name.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_double(stmt, 2, zone.center_lat);
    sqlite3_bind_double(stmt, 3, zone.center_lng);
    sqlite3_bind_double(stmt, 4, zone.radius_meters);
    sqlite3_bind_text(stmt, 5, zone.address.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 6, zone.is_active ? 1 : 0);
    sqlite3_bind_text(stmt, 7, methods.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 8, zone.zone_id);

    bool success = (sqlite3_step(stmt) == SQLITE_DONE) && sqlite3_changes(db) > 0;
    sqlite3_finalize(stmt);
    return success;
}

bool ZoneDao::set_active(int64_t zone_id, bool active) {
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return false;

    const char* sql = "UPDATE geofence_zones SET is_active = ? WHERE zone_id = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;

    sqlite3_bind_int(stmt, 1, active ? 1 : 0);
    sqlite3_bind_int64(stmt, 2, zone_id);

    bool success = (sqlite3_step(stmt) == SQLITE_DONE) && sqlite3_changes(db) > 0;
    sqlite3_finalize(stmt);
    return success;
}

bool ZoneDao::delete_zone(int64_t zone_id) {
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return false;

    const char* sql = "DELETE FROM geofence_zones WHERE zone_id = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;

    sqlite3_bind_int64(stmt, 1, zone_id);

    bool success = (sqlite3_step(stmt) == SQLITE_DONE) && sqlite3_changes(db) > 0;
    sqlite3_finalize(stmt);
    return success;
}

} // namespace db
