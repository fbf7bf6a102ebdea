/**
 * @file face_feature_dao.cc
 * @brief 已注册人脸特征数据访问对象实现
 */

#include "database/face_feature_dao.h"
#include "database/database_manager.h"
#include <cstring>
#include <iostream>

namespace db {

namespace {

FaceFeature read_feature(sqlite3_stmt* stmt) {
    FaceFeature f;
    f.feature_id = sqlite3_column_int64(stmt, 0);
    f.user_id = sqlite3_column_int64(stmt, 1);

    const void* blob = sqlite3_column_blob(stmt, 2);
    int bytes = sqlite3_column_bytes(stmt, 2);
    if (blob && bytes > 0) {
        f.feature_vector.resize(static_cast<size_t>(bytes) / sizeof(float));
        std::memcpy(f.feature_vector.data(), blob, f.feature_vector.size() * sizeof(float));
    }

    f.feature_quality = static_cast<float>(sqlite3_column_double(stmt, 3));
    return f;
}

} // namespace

int64_t FaceFeatureDao::insert(const FaceFeature& feature) {
    if (feature.user_id < 0 || feature.feature_vector.empty()) {
        std::cerr << "Rejecting enrollment for user " << feature.user_id << ": empty feature" << std::endl;
        return -1;
    }

    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return -1;

    const char* sql = "INSERT INTO face_features (user_id, feature_vector, feature_quality) VALUES (?, ?, ?)";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return -1;
    }

    sqlite3_bind_int64(stmt, 1, feature.user_id);
    sqlite3_bind_blob(stmt, 2, feature.feature_vector.data(),
                      static_cast<int>(feature.feature_vector.size() * sizeof(float)), SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 3, feature.feature_quality);

    int64_t id = -1;
    if (sqlite3_step(stmt) == SQLITE_DONE) {
        id = sqlite3_last_insert_rowid(db);
    } else {
        std::cerr << "Insert face feature failed: " << sqlite3_errmsg(db) << std::endl;
    }
    sqlite3_finalize(stmt);
    return id;
}

std::vector<FaceFeature> FaceFeatureDao::list_all() {
    std::vector<FaceFeature> out;
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return out;

    const char* sql = "SELECT feature_id, user_id, feature_vector, feature_quality "
                      "FROM face_features ORDER BY feature_id ASC";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return out;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        out.push_back(read_feature(stmt));
    }
    sqlite3_finalize(stmt);
    return out;
}

int FaceFeatureDao::count_by_user(int64_t user_id) {
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return 0;

    const char* sql = "SELECT COUNT(*) FROM face_features WHERE user_id = ?";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return 0;

    sqlite3_bind_int64(stmt, 1, user_id);
    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

bool FaceFeatureDao::remove_by_user(int64_t user_id) {
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return false;

    const char* sql = "DELETE FROM face_features WHERE user_id = ?";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;

    sqlite3_bind_int64(stmt, 1, user_id);
    bool ok = sqlite3_step(stmt) == SQLITE_DONE;
    if (!ok) {
        std::cerr << "Remove face features failed: " << sqlite3_errmsg(db) << std::endl;
    }
    sqlite3_finalize(stmt);
    return ok;
}

} // namespace db
