#ifndef TEMPORARY_WORKPLACE_DAO_H
#define TEMPORARY_WORKPLACE_DAO_H

#include "database/database_types.h"
#include <optional>
#include <string>
#include <vector>

namespace db {

class TemporaryWorkplaceDao {
public:
    // 临时地点打卡记录
    int64_t add_record(const TemporaryWorkplaceRecord& record);
    std::optional<TemporaryWorkplaceRecord> get_record(int64_t record_id);
    std::vector<TemporaryWorkplaceRecord> get_records_by_user(int64_t user_id, std::time_t start_time, std::time_t end_time);
    int64_t count_records();

    // 常用地点
    int64_t add_reusable(const ReusableWorkplace& workplace);
    std::optional<ReusableWorkplace> get_reusable(int64_t reusable_id);
    std::optional<ReusableWorkplace> get_reusable_by_name(int64_t user_id, const std::string& name);
    std::vector<ReusableWorkplace> get_reusable_by_user(int64_t user_id, bool active_only);

    // 使用次数 +1 并刷新最后使用时间
    bool touch_reusable(int64_t reusable_id, std::time_t used_at);
    bool set_reusable_active(int64_t reusable_id, bool active);
};

} // namespace db

#endif // TEMPORARY_WORKPLACE_DAO_H
