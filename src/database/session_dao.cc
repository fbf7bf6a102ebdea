/**
 * @file session_dao.cc
 * @brief 验证会话数据访问对象实现
 */

#include "database/session_dao.h"
#include "database/database_manager.h"
#include <iostream>

namespace db {

namespace {

const char* kSessionColumns =
    "SELECT session_id, user_id, attendance_event_id, session_type, state, max_attempts, started_at, completed_at, "
    "latitude, longitude, accuracy, fix_time, result_success, final_image_ref, total_attempts, average_confidence "
    "FROM verification_sessions ";

VerificationSession read_session(sqlite3_stmt* stmt) {
    VerificationSession s;
    s.session_id = sqlite3_column_int64(stmt, 0);
    s.user_id = sqlite3_column_int64(stmt, 1);
    const char* event_id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
    if (event_id) s.attendance_event_id = event_id;
    s.session_type = static_cast<PunchType>(sqlite3_column_int(stmt, 3));
    s.state = static_cast<SessionState>(sqlite3_column_int(stmt, 4));
    s.max_attempts = sqlite3_column_int(stmt, 5);
    s.started_at = static_cast<std::time_t>(sqlite3_column_int64(stmt, 6));
    if (sqlite3_column_type(stmt, 7) != SQLITE_NULL) {
        s.completed_at = static_cast<std::time_t>(sqlite3_column_int64(stmt, 7));
    }
    s.location_fix.latitude = sqlite3_column_double(stmt, 8);
    s.location_fix.longitude = sqlite3_column_double(stmt, 9);
    s.location_fix.accuracy_meters = sqlite3_column_double(stmt, 10);
    s.location_fix.captured_at = static_cast<std::time_t>(sqlite3_column_int64(stmt, 11));

    if (sqlite3_column_type(stmt, 12) != SQLITE_NULL) {
        SessionResult r;
        r.success = sqlite3_column_int(stmt, 12) != 0;
        const char* image = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 13));
        if (image) r.final_image_ref = image;
        r.total_attempts = sqlite3_column_int(stmt, 14);
        r.average_confidence = static_cast<float>(sqlite3_column_double(stmt, 15));
        s.result = r;
    }
    return s;
}

} // namespace

int64_t SessionDao::create_session(const VerificationSession& session) {
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return -1;

    const char* sql = "INSERT INTO verification_sessions (user_id, attendance_event_id, session_type, state, max_attempts, started_at, latitude, longitude, accuracy, fix_time) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return -1;
    }

    sqlite3_bind_int64(stmt, 1, session.user_id);
    sqlite3_bind_text(stmt, 2, session.attendance_event_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 3, static_cast<int>(session.session_type));
    sqlite3_bind_int(stmt, 4, static_cast<int>(session.state));
    sqlite3_bind_int(stmt, 5, session.max_attempts);
    sqlite3_bind_int64(stmt, 6, static_cast<int64_t>(session.started_at));
    sqlite3_bind_double(stmt, 7, session.location_fix.latitude);
    sqlite3_bind_double(stmt, 8, session.location_fix.longitude);
    sqlite3_bind_double(stmt, 9, session.location_fix.accuracy_meters);
    sqlite3_bind_int64(stmt, 10, static_cast<int64_t>(session.location_fix.captured_at));

    int64_t new_id = -1;
    if (sqlite3_step(stmt) == SQLITE_DONE) {
        new_id = sqlite3_last_insert_rowid(db);
    } else {
        std::cerr << "Insert session failed: " << sqlite3_errmsg(db) << std::endl;
    }

    sqlite3_finalize(stmt);
    return new_id;
}

bool SessionDao::update_session(const VerificationSession& session) {
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return false;

    const char* sql = "UPDATE verification_sessions SET state=?, completed_at=?, result_success=?, final_image_ref=?, total_attempts=?, average_confidence=? WHERE session_id=?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;

    sqlite3_bind_int(stmt, 1, static_cast<int>(session.state));
    if (session.completed_at) {
        sqlite3_bind_int64(stmt, 2, static_cast<int64_t>(*session.completed_at));
    } else {
        sqlite3_bind_null(stmt, 2);
    }
    if (session.result) {
        sqlite3_bind_int(stmt, 3, session.result->success ? 1 : 0);
        sqlite3_bind_text(stmt, 4, session.result->final_image_ref.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_int(stmt, 5, session.result->total_attempts);
        sqlite3_bind_double(stmt, 6, session.result->average_confidence);
    } else {
        sqlite3_bind_null(stmt, 3);
        sqlite3_bind_null(stmt, 4);
        sqlite3_bind_null(stmt, 5);
        sqlite3_bind_null(stmt, 6);
    }
    sqlite3_bind_int64(stmt, 7, session.session_id);

    bool success = (sqlite3_step(stmt) == SQLITE_DONE) && sqlite3_changes(db) > 0;
    if (!success) {
        std::cerr << "Update session " << session.session_id << " failed: " << sqlite3_errmsg(db) << std::endl;
    }
    sqlite3_finalize(stmt);
    return success;
}

int64_t SessionDao::add_attempt(const VerificationAttempt& attempt) {
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return -1;

    const char* sql = "INSERT INTO verification_attempts (session_id, attempt_number, image_ref, success, confidence, failure_reason, captured_at, latitude, longitude, accuracy, fix_time) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return -1;
    }

    sqlite3_bind_int64(stmt, 1, attempt.session_id);
    sqlite3_bind_int(stmt, 2, attempt.attempt_number);
    sqlite3_bind_text(stmt, 3, attempt.captured_image_ref.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 4, attempt.outcome.success ? 1 : 0);
    sqlite3_bind_double(stmt, 5, attempt.outcome.confidence_percent);
    sqlite3_bind_text(stmt, 6, attempt.outcome.failure_reason.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 7, static_cast<int64_t>(attempt.captured_at));
    sqlite3_bind_double(stmt, 8, attempt.location_fix.latitude);
    sqlite3_bind_double(stmt, 9, attempt.location_fix.longitude);
    sqlite3_bind_double(stmt, 10, attempt.location_fix.accuracy_meters);
    sqlite3_bind_int64(stmt, 11, static_cast<int64_t>(attempt.location_fix.captured_at));

    int64_t new_id = -1;
    if (sqlite3_step(stmt) == SQLITE_DONE) {
        new_id = sqlite3_last_insert_rowid(db);
    } else {
        std::cerr << "Insert attempt failed: " << sqlite3_errmsg(db) << std::endl;
    }

    sqlite3_finalize(stmt);
    return new_id;
}

std::optional<VerificationSession> SessionDao::get_session(int64_t session_id) {
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return std::nullopt;

    std::string sql = std::string(kSessionColumns) + "WHERE session_id = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) return std::nullopt;

    sqlite3_bind_int64(stmt, 1, session_id);

    std::optional<VerificationSession> result = std::nullopt;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = read_session(stmt);
    }
    sqlite3_finalize(stmt);

    if (result) {
        result->attempts = get_attempts(session_id);
    }
    return result;
}

std::vector<VerificationSession> SessionDao::get_open_sessions() {
    std::vector<VerificationSession> sessions;
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return sessions;

    std::string sql = std::string(kSessionColumns) + "WHERE state IN (0, 1, 2) ORDER BY session_id ASC";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) return sessions;

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        sessions.push_back(read_session(stmt));
    }
    sqlite3_finalize(stmt);

    for (auto& s : sessions) {
        s.attempts = get_attempts(s.session_id);
    }
    return sessions;
}

std::vector<VerificationAttempt> SessionDao::get_attempts(int64_t session_id) {
    std::vector<VerificationAttempt> attempts;
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return attempts;

    const char* sql = "SELECT attempt_id, session_id, attempt_number, image_ref, success, confidence, failure_reason, captured_at, latitude, longitude, accuracy, fix_time FROM verification_attempts WHERE session_id = ? ORDER BY attempt_number ASC";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return attempts;

    sqlite3_bind_int64(stmt, 1, session_id);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        VerificationAttempt a;
        a.attempt_id = sqlite3_column_int64(stmt, 0);
        a.session_id = sqlite3_column_int64(stmt, 1);
        a.attempt_number = sqlite3_column_int(stmt, 2);
        const char* image = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 3));
        if (image) a.captured_image_ref = image;
        a.outcome.success = sqlite3_column_int(stmt, 4) != 0;
        a.outcome.confidence_percent = static_cast<float>(sqlite3_column_double(stmt, 5));
        const char* reason = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 6));
        if (reason) a.outcome.failure_reason = reason;
        a.captured_at = static_cast<std::time_t>(sqlite3_column_int64(stmt, 7));
        a.location_fix.latitude = sqlite3_column_double(stmt, 8);
        a.location_fix.longitude = sqlite3_column_double(stmt, 9);
        a.location_fix.accuracy_meters = sqlite3_column_double(stmt, 10);
        a.location_fix.captured_at = static_cast<std::time_t>(sqlite3_column_int64(stmt, 11));
        attempts.push_back(a);
    }

    sqlite3_finalize(stmt);
    return attempts;
}

} // namespace db
