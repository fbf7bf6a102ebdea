/**
 * @file feature_library.h
 * @brief 已注册人脸特征库
 */

#ifndef FEATURE_LIBRARY_H
#define FEATURE_LIBRARY_H

#include "database/database_types.h"
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace service {

class FeatureLibrary {
public:
    // 从数据库加载特征, 返回加载数量
    size_t load_from_database();

    // 注册/追加单个用户的特征 (同时写库)
    bool enroll(int64_t user_id, const std::vector<float>& feature, float quality);

    // 删除用户全部特征
    bool remove_user(int64_t user_id);

    /**
     * @brief 重新注册: 在同一事务内清空旧特征并写入新特征
     * 验证会话失败 (达到最大次数) 后由管理端调用
     */
    bool reenroll(int64_t user_id, const std::vector<std::vector<float>>& features, float quality);

    int enrolled_count(int64_t user_id) const;

    /**
     * @brief 1:1 比对, 返回与该用户已注册特征的最高相似度
     * @return 用户未注册或输入为空时返回 std::nullopt
     */
    std::optional<float> best_similarity(int64_t user_id, const std::vector<float>& feature) const;

    bool loaded() const;
    size_t user_count() const;

    static float cosine_similarity(const std::vector<float>& f1, const std::vector<float>& f2);
    static void normalize(std::vector<float>& feature);

private:
    std::map<int64_t, std::vector<std::vector<float>>> features_;  // user_id -> 归一化特征
    bool loaded_ = false;
    mutable std::mutex mutex_;
};

} // namespace service

#endif // FEATURE_LIBRARY_H
