#ifndef FACE_FEATURE_DAO_H
#define FACE_FEATURE_DAO_H

#include "database/database_types.h"
#include <vector>

namespace db {

/**
 * @brief 已注册的人脸特征 (身份验证比对的基准)
 * 特征以 float BLOB 存储, 不做归一化
 */
class FaceFeatureDao {
public:
    // 空向量返回 -1
    int64_t insert(const FaceFeature& feature);

    // 按 feature_id 升序, 启动时加载到内存
    std::vector<FaceFeature> list_all();

    int count_by_user(int64_t user_id);

    bool remove_by_user(int64_t user_id);
};

} // namespace db

#endif // FACE_FEATURE_DAO_H
