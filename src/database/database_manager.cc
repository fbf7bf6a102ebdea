/**
 * @file database_manager.cc
 * @brief 数据库连接管理实现
 * @details 负责 SQLite 数据库的打开、关闭、事务处理以及基础表结构的自动创建。
 */

#include "database/database_manager.h"
#include <iostream>

namespace db {

DatabaseManager& DatabaseManager::instance() {
    static DatabaseManager instance;
    return instance;
}

DatabaseManager::DatabaseManager() {}

DatabaseManager::~DatabaseManager() {
    close();
}

bool DatabaseManager::open(const std::string& path) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (db_) {
        return true; // 已经打开
    }

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc) {
        std::cerr << "Can't open database: " << sqlite3_errmsg(db_) << std::endl;
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // 开启外键约束支持
    execute("PRAGMA foreign_keys = ON;");

    // 创建表结构
    if (!create_tables()) {
        close();
        return false;
    }

    std::cout << "Database opened: " << path << std::endl;
    return true;
}

void DatabaseManager::close() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool DatabaseManager::execute(const std::string& sql) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!db_) return false;

    char* zErrMsg = 0;
    int rc = sqlite3_exec(db_, sql.c_str(), 0, 0, &zErrMsg);
    if (rc != SQLITE_OK) {
        std::cerr << "SQL error: " << (zErrMsg ? zErrMsg : "unknown") << "\nSQL: " << sql << std::endl;
        sqlite3_free(zErrMsg);
        return false;
    }
    return true;
}

bool DatabaseManager::begin_transaction() {
    return execute("BEGIN TRANSACTION;");
}

bool DatabaseManager::commit_transaction() {
    return execute("COMMIT;");
}

bool DatabaseManager::rollback_transaction() {
    return execute("ROLLBACK;");
}

bool DatabaseManager::create_tables() {
    const char* sql_zones =
        "CREATE TABLE IF NOT EXISTS geofence_zones ("
        "zone_id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "name TEXT NOT NULL,"
        "center_lat REAL NOT NULL,"
        "center_lng REAL NOT NULL,"
        "radius_meters REAL NOT NULL CHECK(radius_meters > 0),"
        "address TEXT,"
        "is_active INTEGER DEFAULT 1,"
        "allowed_methods TEXT"
        ");";

    const char* sql_sessions =
        "CREATE TABLE IF NOT EXISTS verification_sessions ("
        "session_id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "user_id INTEGER NOT NULL,"
        "attendance_event_id TEXT NOT NULL,"
        "session_type INTEGER,"
        "state INTEGER,"
        "max_attempts INTEGER,"
        "started_at INTEGER,"
        "completed_at INTEGER,"
        "latitude REAL,"
        "longitude REAL,"
        "accuracy REAL,"
        "fix_time INTEGER,"
        "result_success INTEGER,"
        "final_image_ref TEXT,"
        "total_attempts INTEGER,"
        "average_confidence REAL"
        ");";

    // 同一 (用户, 打卡事件) 只允许一个未结束的会话
    const char* sql_idx_open_session =
        "CREATE UNIQUE INDEX IF NOT EXISTS idx_sessions_open ON verification_sessions(user_id, attendance_event_id) "
        "WHERE state IN (0, 1, 2);";

    const char* sql_attempts =
        "CREATE TABLE IF NOT EXISTS verification_attempts ("
        "attempt_id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "session_id INTEGER NOT NULL,"
        "attempt_number INTEGER NOT NULL,"
        "image_ref TEXT,"
        "success INTEGER,"
        "confidence REAL,"
        "failure_reason TEXT,"
        "captured_at INTEGER,"
        "latitude REAL,"
        "longitude REAL,"
        "accuracy REAL,"
        "fix_time INTEGER,"
        "UNIQUE(session_id, attempt_number),"
        "FOREIGN KEY(session_id) REFERENCES verification_sessions(session_id) ON DELETE CASCADE"
        ");";

    const char* sql_reusable =
        "CREATE TABLE IF NOT EXISTS reusable_workplaces ("
        "reusable_id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "user_id INTEGER NOT NULL,"
        "name TEXT NOT NULL,"
        "latitude REAL,"
        "longitude REAL,"
        "accuracy REAL,"
        "fix_time INTEGER,"
        "reason TEXT,"
        "is_active INTEGER DEFAULT 1,"
        "usage_count INTEGER DEFAULT 0,"
        "last_used_at INTEGER,"
        "UNIQUE(user_id, name)"
        ");";

    const char* sql_temp_records =
        "CREATE TABLE IF NOT EXISTS temporary_workplace_records ("
        "record_id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "user_id INTEGER NOT NULL,"
        "punch_date TEXT,"
        "punch_type INTEGER,"
        "punch_time TEXT,"
        "latitude REAL,"
        "longitude REAL,"
        "accuracy REAL,"
        "fix_time INTEGER,"
        "reason TEXT,"
        "photo_ref TEXT,"
        "notes TEXT,"
        "is_reusable INTEGER DEFAULT 0,"
        "reusable_id INTEGER,"
        "created_at INTEGER,"
        "FOREIGN KEY(reusable_id) REFERENCES reusable_workplaces(reusable_id)"
        ");";

    const char* sql_approvals =
        "CREATE TABLE IF NOT EXISTS approval_requests ("
        "request_id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "source_event_id TEXT,"
        "user_id INTEGER NOT NULL,"
        "manager_id INTEGER,"
        "request_type INTEGER,"
        "reason TEXT,"
        "status INTEGER DEFAULT 0,"
        "requested_at INTEGER,"
        "decided_at INTEGER,"
        "decided_by INTEGER,"
        "decision_notes TEXT"
        ");";

    const char* sql_features = 
        "CREATE TABLE IF NOT EXISTS face_features (" 
        "feature_id INTEGER PRIMARY KEY AUTOINCREMENT," 
        "user_id INTEGER NOT NULL," 
        "feature_vector BLOB," 
        "feature_quality REAL" 
        ");";

    // 索引
    const char* sql_idx_attempts = "CREATE INDEX IF NOT EXISTS idx_attempts_session ON verification_attempts(session_id);";
    const char* sql_idx_temp_user = "CREATE INDEX IF NOT EXISTS idx_temp_records_user ON temporary_workplace_records(user_id, created_at);";
    const char* sql_idx_approval_status = "CREATE INDEX IF NOT EXISTS idx_approvals_status ON approval_requests(status);";
    const char* sql_idx_approval_user = "CREATE INDEX IF NOT EXISTS idx_approvals_user ON approval_requests(user_id);";
    const char* sql_idx_features_user = "CREATE INDEX IF NOT EXISTS idx_features_user ON face_features(user_id);";

    return execute(sql_zones) &&
           execute(sql_sessions) &&
           execute(sql_idx_open_session) &&
           execute(sql_attempts) &&
           execute(sql_reusable) &&
           execute(sql_temp_records) &&
           execute(sql_approvals) &&
           execute(sql_features) &&
           execute(sql_idx_attempts) &&
           execute(sql_idx_temp_user) &&
           execute(sql_idx_approval_status) &&
           execute(sql_idx_approval_user) &&
           execute(sql_idx_features_user);
}

Transaction::Transaction()
    : lock_(DatabaseManager::instance().mutex()) {
    active_ = DatabaseManager::instance().begin_transaction();
}

Transaction::~Transaction() {
    if (active_) {
        DatabaseManager::instance().rollback_transaction();
    }
}

bool Transaction::commit() {
    if (!active_) return false;
    active_ = false;
    if (!DatabaseManager::instance().commit_transaction()) {
        DatabaseManager::instance().rollback_transaction();
        return false;
    }
    return true;
}

} // namespace db
