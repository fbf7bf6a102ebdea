/**
 * @file approval_dao.cc
 * @brief 审批单数据访问对象实现
 */

#include "database/approval_dao.h"
#include "database/database_manager.h"
#include <iostream>

namespace db {

namespace {

const char* kRequestColumns =
    "SELECT request_id, source_event_id, user_id, manager_id, request_type, reason, status, requested_at, "
    "decided_at, decided_by, decision_notes FROM approval_requests ";

ApprovalRequest read_request(sqlite3_stmt* stmt) {
    ApprovalRequest r;
    r.request_id = sqlite3_column_int64(stmt, 0);
    const char* source = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
    if (source) r.source_event_id = source;
    r.user_id = sqlite3_column_int64(stmt, 2);
    r.manager_id = sqlite3_column_int64(stmt, 3);
    r.type = static_cast<ApprovalType>(sqlite3_column_int(stmt, 4));
    const char* reason = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 5));
    if (reason) r.reason = reason;
    r.status = static_cast<ApprovalStatus>(sqlite3_column_int(stmt, 6));
    r.requested_at = static_cast<std::time_t>(sqlite3_column_int64(stmt, 7));
    if (sqlite3_column_type(stmt, 8) != SQLITE_NULL) {
        r.decided_at = static_cast<std::time_t>(sqlite3_column_int64(stmt, 8));
    }
    if (sqlite3_column_type(stmt, 9) != SQLITE_NULL) {
        r.decided_by = sqlite3_column_int64(stmt, 9);
    }
    const char* notes = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 10));
    if (notes) r.decision_notes = notes;
    return r;
}

} // namespace

int64_t ApprovalDao::add_request(const ApprovalRequest& request, bool* inserted) {
    if (inserted) *inserted = false;

    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return -1;

    const bool explicit_id = request.request_id > 0;
    const char* sql = explicit_id
        ? "INSERT OR IGNORE INTO approval_requests (source_event_id, user_id, manager_id, request_type, reason, status, requested_at, request_id) VALUES (?, ?, ?, ?, ?, ?, ?, ?)"
        : "INSERT INTO approval_requests (source_event_id, user_id, manager_id, request_type, reason, status, requested_at) VALUES (?, ?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return -1;
    }

    sqlite3_bind_text(stmt, 1, request.source_event_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, request.user_id);
    sqlite3_bind_int64(stmt, 3, request.manager_id);
    sqlite3_bind_int(stmt, 4, static_cast<int>(request.type));
    sqlite3_bind_text(stmt, 5, request.reason.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 6, static_cast<int>(ApprovalStatus::Pending));
    sqlite3_bind_int64(stmt, 7, static_cast<int64_t>(request.requested_at));
    if (explicit_id) {
        sqlite3_bind_int64(stmt, 8, request.request_id);
    }

    int64_t id = -1;
    if (sqlite3_step(stmt) == SQLITE_DONE) {
        bool added = sqlite3_changes(db) > 0;
        if (inserted) *inserted = added;
        id = explicit_id ? request.request_id : sqlite3_last_insert_rowid(db);
    } else {
        std::cerr << "Insert approval request failed: " << sqlite3_errmsg(db) << std::endl;
    }

    sqlite3_finalize(stmt);
    return id;
}

std::optional<ApprovalRequest> ApprovalDao::get_request(int64_t request_id) {
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return std::nullopt;

    std::string sql = std::string(kRequestColumns) + "WHERE request_id = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) return std::nullopt;

    sqlite3_bind_int64(stmt, 1, request_id);

    std::optional<ApprovalRequest> result = std::nullopt;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = read_request(stmt);
    }

    sqlite3_finalize(stmt);
    return result;
}

bool ApprovalDao::decide(int64_t request_id, ApprovalStatus status, std::time_t decided_at,
                         std::optional<int64_t> decided_by, const std::string& notes) {
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return false;

    const char* sql = "UPDATE approval_requests SET status=?, decided_at=?, decided_by=?, decision_notes=? WHERE request_id=? AND status=0";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;

    sqlite3_bind_int(stmt, 1, static_cast<int>(status));
    sqlite3_bind_int64(stmt, 2, static_cast<int64_t>(decided_at));
    if (decided_by) {
        sqlite3_bind_int64(stmt, 3, *decided_by);
    } else {
        sqlite3_bind_null(stmt, 3);
    }
    sqlite3_bind_text(stmt, 4, notes.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 5, request_id);

    bool success = (sqlite3_step(stmt) == SQLITE_DONE) && sqlite3_changes(db) > 0;
    sqlite3_finalize(stmt);
    return success;
}

std::vector<ApprovalRequest> ApprovalDao::query(const ApprovalFilter& filter) {
    std::vector<ApprovalRequest> requests;
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return requests;

    // 动态拼接条件, 参数一律绑定
    std::string sql = std::string(kRequestColumns) + "WHERE 1=1";
    if (filter.type) sql += " AND request_type = ?";
    if (filter.status) sql += " AND status = ?";
    if (filter.user_id) sql += " AND user_id = ?";
    if (filter.manager_id) sql += " AND manager_id = ?";
    if (filter.requested_from) sql += " AND requested_at >= ?";
    if (filter.requested_to) sql += " AND requested_at <= ?";
    if (!filter.search.empty()) sql += " AND (instr(reason, ?) > 0 OR instr(source_event_id, ?) > 0)";
    sql += " ORDER BY requested_at ASC, request_id ASC";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return requests;
    }

    int index = 1;
    if (filter.type) sqlite3_bind_int(stmt, index++, static_cast<int>(*filter.type));
    if (filter.status) sqlite3_bind_int(stmt, index++, static_cast<int>(*filter.status));
    if (filter.user_id) sqlite3_bind_int64(stmt, index++, *filter.user_id);
    if (filter.manager_id) sqlite3_bind_int64(stmt, index++, *filter.manager_id);
    if (filter.requested_from) sqlite3_bind_int64(stmt, index++, static_cast<int64_t>(*filter.requested_from));
    if (filter.requested_to) sqlite3_bind_int64(stmt, index++, static_cast<int64_t>(*filter.requested_to));
    if (!filter.search.empty()) {
        sqlite3_bind_text(stmt, index++, filter.search.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, index++, filter.search.c_str(), -1, SQLITE_STATIC);
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        requests.push_back(read_request(stmt));
    }

    sqlite3_finalize(stmt);
    return requests;
}

ApprovalCounts ApprovalDao::count_by_status() {
    ApprovalCounts counts;
    std::lock_guard<std::recursive_mutex> lock(DatabaseManager::instance().mutex());
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return counts;

    const char* sql = "SELECT status, COUNT(*) FROM approval_requests GROUP BY status";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return counts;

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        int status = sqlite3_column_int(stmt, 0);
        int64_t n = sqlite3_column_int64(stmt, 1);
        switch (static_cast<ApprovalStatus>(status)) {
            case ApprovalStatus::Pending:  counts.pending = n; break;
            case ApprovalStatus::Approved: counts.approved = n; break;
            case ApprovalStatus::Rejected: counts.rejected = n; break;
        }
    }
    sqlite3_finalize(stmt);

    const char* sql_avg = "SELECT AVG(decided_at - requested_at) FROM approval_requests WHERE status != 0 AND decided_at IS NOT NULL";
    if (sqlite3_prepare_v2(db, sql_avg, -1, &stmt, nullptr) != SQLITE_OK) return counts;

    if (sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_type(stmt, 0) != SQLITE_NULL) {
        counts.average_response_seconds = sqlite3_column_double(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return counts;
}

} // namespace db
