/**
 * @file temporary_workplace_dao.cc
 * @brief 临时工作地点记录与常用地点数据访问对象实现
 */

#include "database/temporary_workplace_dao.h"
#include "database/database_manager.h"
#include <iostream>

namespace db {

namespace {

const char* kRecordColumns =
    "SELECT record_id, user_id, punch_date, punch_type, punch_time, latitude, longitude, accuracy, fix_time, "
    "reason, photo_ref, notes, is_reusable, reusable_id, created_at FROM temporary_workplace_records ";

const char* kReusableColumns =
    "SELECT reusable_id, user_id, name, latitude, longitude, accuracy, fix_time, reason, is_active, usage_count, last_used_at "
    "FROM reusable_workplaces ";

std::string column_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return column_text(stmt, col);
}

void bind_optional_text(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
    if (value) {
        sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_STATIC);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

TemporaryWorkplaceRecord read_record(sqlite3_stmt* stmt) {
    TemporaryWorkplaceRecord r;
    r.record_id = sqlite3_column_int64(stmt, 0);
    r.user_id = sqlite3_column_int64(stmt, 1);
    r.date = column_text(stmt, 2);
    r.type = static_cast<PunchType>(sqlite3_column_int(stmt, 3));
    r.time = column_text(stmt, 4);
    r.location_fix.latitude = sqlite3_column_double(stmt, 5);
    r.location_fix.longitude = sqlite3_column_double(stmt, 6);
    r.location_fix.accuracy_meters = sqlite3_column_double(stmt, 7);
    r.location_fix.captured_at = static_cast<std::time_t>(sqlite3_column_int64(stmt, 8));
    r.reason = column_text(stmt, 9);
    r.photo_ref = column_optional_text(stmt, 10);
    r.notes = column_optional_text(stmt, 11);
    r.is_reusable = sqlite3_column_int(stmt, 12) != 0;
    if (sqlite3_column_type(stmt, 13) != SQLITE_NULL) {
        r.reusable_location_id = sqlite3_column_int64(stmt, 13);
    }
    r.created_at = static_cast<std::time_t>(sqlite3_column_int64(stmt, 14));
    return r;
}

ReusableWorkplace read_reusable(sqlite3_stmt* stmt) {
    ReusableWorkplace w;
    w.reusable_id = sqlite3_column_int64(stmt, 0);
    w.user_id = sqlite3_column_int64(stmt, 1);
    w.name = column_text(stmt, 2);
    w.location_fix.latitude = sqlite3_column_double(stmt, 3);
    w.location_fix.longitude = sqlite3_column_double(stmt, 4);
    w.location_fix.accuracy_meters = sqlite3_column_double(stmt, 5);
    w.location_fix.captured_at = static_cast<std::time_t>(sqlite3_column_int64(stmt, 6));
    w.reason = column_text(stmt, 7);
    w.is_active = sqlite3_column_int(stmt, 8) != 0;
    w.usage_count = sqlite3_column_int(stmt, 9);
    w.last_used_at = static_cast<std::time_t>(sqlite3_column_int64(stmt, 10));
    return w;
}

} // namespace

int64_t TemporaryWorkplaceDao::add_record(const TemporaryWorkplaceRecord& record) {
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return -1;

    const char* sql = "INSERT INTO temporary_workplace_records (user_id, punch_date, punch_type, punch_time, latitude, longitude, accuracy, fix_time, reason, photo_ref, notes, is_reusable, reusable_id, created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return -1;
    }

    sqlite3_bind_int64(stmt, 1, record.user_id);
    sqlite3_bind_text(stmt, 2, record.date.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 3, static_cast<int>(record.type));
    sqlite3_bind_text(stmt, 4, record.time.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_double(stmt, 5, record.location_fix.latitude);
    sqlite3_bind_double(stmt, 6, record.location_fix.longitude);
    sqlite3_bind_double(stmt, 7, record.location_fix.accuracy_meters);
    sqlite3_bind_int64(stmt, 8, static_cast<int64_t>(record.location_fix.captured_at));
    sqlite3_bind_text(stmt, 9, record.reason.c_str(), -1, SQLITE_STATIC);
    bind_optional_text(stmt, 10, record.photo_ref);
    bind_optional_text(stmt, 11, record.notes);
    sqlite3_bind_int(stmt, 12, record.is_reusable ? 1 : 0);
    if (record.reusable_location_id) {
        sqlite3_bind_int64(stmt, 13, *record.reusable_location_id);
    } else {
        sqlite3_bind_null(stmt, 13);
    }
    sqlite3_bind_int64(stmt, 14, static_cast<int64_t>(record.created_at));

    int64_t new_id = -1;
    if (sqlite3_step(stmt) == SQLITE_DONE) {
        new_id = sqlite3_last_insert_rowid(db);
    } else {
        std::cerr << "Insert temporary record failed: " << sqlite3_errmsg(db) << std::endl;
    }

    sqlite3_finalize(stmt);
    return new_id;
}

std::optional<TemporaryWorkplaceRecord> TemporaryWorkplaceDao::get_record(int64_t record_id) {
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return std::nullopt;

    std::string sql = std::string(kRecordColumns) + "WHERE record_id = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) return std::nullopt;

    sqlite3_bind_int64(stmt, 1, record_id);

    std::optional<TemporaryWorkplaceRecord> result = std::nullopt;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = read_record(stmt);
    }

    sqlite3_finalize(stmt);
    return result;
}

std::vector<TemporaryWorkplaceRecord> TemporaryWorkplaceDao::get_records_by_user(int64_t user_id, std::time_t start_time, std::time_t end_time) {
    std::vector<TemporaryWorkplaceRecord> records;
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return records;

    std::string sql = std::string(kRecordColumns) + "WHERE user_id = ? AND created_at BETWEEN ? AND ? ORDER BY created_at ASC, record_id ASC";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) return records;

    sqlite3_bind_int64(stmt, 1, user_id);
    sqlite3_bind_int64(stmt, 2, static_cast<int64_t>(start_time));
    sqlite3_bind_int64(stmt, 3, static_cast<int64_t>(end_time));

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        records.push_back(read_record(stmt));
    }

    sqlite3_finalize(stmt);
    return records;
}

int64_t TemporaryWorkplaceDao::count_records() {
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return -1;

    const char* sql = "SELECT COUNT(*) FROM temporary_workplace_records";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return -1;

    int64_t count = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int64(stmt, 0);
    }

    sqlite3_finalize(stmt);
    return count;
}

int64_t TemporaryWorkplaceDao::add_reusable(const ReusableWorkplace& workplace) {
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return -1;

    const char* sql = "INSERT INTO reusable_workplaces (user_id, name, latitude, longitude, accuracy, fix_time, reason, is_active, usage_count, last_used_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return -1;
    }

    sqlite3_bind_int64(stmt, 1, workplace.user_id);
    sqlite3_bind_text(stmt, 2, workplace.name.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_double(stmt, 3, workplace.location_fix.latitude);
    sqlite3_bind_double(stmt, 4, workplace.location_fix.longitude);
    sqlite3_bind_double(stmt, 5, workplace.location_fix.accuracy_meters);
    sqlite3_bind_int64(stmt, 6, static_cast<int64_t>(workplace.location_fix.captured_at));
    sqlite3_bind_text(stmt, 7, workplace.reason.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 8, workplace.is_active ? 1 : 0);
    sqlite3_bind_int(stmt, 9, workplace.usage_count);
    sqlite3_bind_int64(stmt, 10, static_cast<int64_t>(workplace.last_used_at));

    int64_t new_id = -1;
    if (sqlite3_step(stmt) == SQLITE_DONE) {
        new_id = sqlite3_last_insert_rowid(db);
    } else {
        std::cerr << "Insert reusable workplace failed: " << sqlite3_errmsg(db) << std::endl;
    }

    sqlite3_finalize(stmt);
    return new_id;
}

std::optional<ReusableWorkplace> TemporaryWorkplaceDao::get_reusable(int64_t reusable_id) {
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return std::nullopt;

    std::string sql = std::string(kReusableColumns) + "WHERE reusable_id = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) return std::nullopt;

    sqlite3_bind_int64(stmt, 1, reusable_id);

    std::optional<ReusableWorkplace> result = std::nullopt;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = read_reusable(stmt);
    }

    sqlite3_finalize(stmt);
    return result;
}

std::optional<ReusableWorkplace> TemporaryWorkplaceDao::get_reusable_by_name(int64_t user_id, const std::string& name) {
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return std::nullopt;

    std::string sql = std::string(kReusableColumns) + "WHERE user_id = ? AND name = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) return std::nullopt;

    sqlite3_bind_int64(stmt, 1, user_id);
    sqlite3_bind_text(stmt, 2, name.c_str(), -1, SQLITE_STATIC);

    std::optional<ReusableWorkplace> result = std::nullopt;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = read_reusable(stmt);
    }

    sqlite3_finalize(stmt);
    return result;
}

std::vector<ReusableWorkplace> TemporaryWorkplaceDao::get_reusable_by_user(int64_t user_id, bool active_only) {
    std::vector<ReusableWorkplace> result;
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return result;

    std::string sql = std::string(kReusableColumns) + "WHERE user_id = ?";
    if (active_only) sql += " AND is_active = 1";
    sql += " ORDER BY last_used_at DESC, reusable_id ASC";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) return result;

    sqlite3_bind_int64(stmt, 1, user_id);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        result.push_back(read_reusable(stmt));
    }

    sqlite3_finalize(stmt);
    return result;
}

bool TemporaryWorkplaceDao::touch_reusable(int64_t reusable_id, std::time_t used_at) {
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return false;

    const char* sql = "UPDATE reusable_workplaces SET usage_count = usage_count + 1, last_used_at = ? WHERE reusable_id = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;

    sqlite3_bind_int64(stmt, 1, static_cast<int64_t>(used_at));
    sqlite3_bind_int64(stmt, 2, reusable_id);

    bool success = (sqlite3_step(stmt) == SQLITE_DONE) && sqlite3_changes(db) > 0;
    sqlite3_finalize(stmt);
    return success;
}

bool TemporaryWorkplaceDao::set_reusable_active(int64_t reusable_id, bool active) {
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return false;

    const char* sql = "UPDATE reusable_workplaces SET is_active = ? WHERE reusable_id = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;

    sqlite3_bind_int(stmt, 1, active ? 1 : 0);
    sqlite3_bind_int64(stmt, 2, reusable_id);

    bool success = (sqlite3_step(stmt) == SQLITE_DONE) && sqlite3_changes(db) > 0;
    sqlite3_finalize(stmt);
    return success;
}

} // namespace db
