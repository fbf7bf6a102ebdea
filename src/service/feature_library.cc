/**
 * @file feature_library.cc
 * @brief 已注册人脸特征库实现
 * @details 启动时从数据库加载特征并归一化, 打卡时按用户做 1:1 余弦相似度比对。
 */

#include "service/feature_library.h"
#include "database/database_manager.h"
#include "database/face_feature_dao.h"
#include <cmath>
#include <iostream>

namespace service {

size_t FeatureLibrary::load_from_database() {
    db::FaceFeatureDao dao;
    auto db_features = dao.list_all();

    std::lock_guard<std::mutex> lock(mutex_);
    features_.clear();
    for (const auto& df : db_features) {
        std::vector<float> feature = df.feature_vector;
        normalize(feature);
        features_[df.user_id].push_back(std::move(feature));
    }
    loaded_ = true;

    std::cout << "Loaded " << db_features.size() << " face features of "
              << features_.size() << " users from database." << std::endl;
    return db_features.size();
}

bool FeatureLibrary::enroll(int64_t user_id, const std::vector<float>& feature, float quality) {
    if (feature.empty()) return false;

    db::FaceFeature record;
    record.user_id = user_id;
    record.feature_vector = feature;
    record.feature_quality = quality;
    db::FaceFeatureDao dao;
    if (dao.insert(record) < 0) {
        return false;
    }

    std::vector<float> normalized = feature;
    normalize(normalized);
    std::lock_guard<std::mutex> lock(mutex_);
    features_[user_id].push_back(std::move(normalized));
    loaded_ = true;
    return true;
}

bool FeatureLibrary::remove_user(int64_t user_id) {
    db::FaceFeatureDao dao;
    if (!dao.remove_by_user(user_id)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    features_.erase(user_id);
    return true;
}

bool FeatureLibrary::reenroll(int64_t user_id, const std::vector<std::vector<float>>& features, float quality) {
    if (features.empty()) return false;

    std::vector<std::vector<float>> normalized;
    {
        db::Transaction tx;
        if (!tx.active()) return false;

        db::FaceFeatureDao dao;
        if (!dao.remove_by_user(user_id)) return false;
        for (const auto& feature : features) {
            db::FaceFeature record;
            record.user_id = user_id;
            record.feature_vector = feature;
            record.feature_quality = quality;
            if (dao.insert(record) < 0) return false;

            std::vector<float> n = feature;
            normalize(n);
            normalized.push_back(std::move(n));
        }
        if (!tx.commit()) return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    features_[user_id] = std::move(normalized);
    std::cout << "Re-enrolled user " << user_id << " with " << features.size() << " features." << std::endl;
    return true;
}

int FeatureLibrary::enrolled_count(int64_t user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = features_.find(user_id);
    return it == features_.end() ? 0 : static_cast<int>(it->second.size());
}

std::optional<float> FeatureLibrary::best_similarity(int64_t user_id, const std::vector<float>& feature) const {
    if (feature.empty()) return std::nullopt;

    // 输入特征也需要归一化
    std::vector<float> input_norm = feature;
    normalize(input_norm);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = features_.find(user_id);
    if (it == features_.end() || it->second.empty()) {
        return std::nullopt;
    }

    float max_sim = -1.0f;
    for (const auto& enrolled : it->second) {
        float sim = cosine_similarity(input_norm, enrolled);
        if (sim > max_sim) {
            max_sim = sim;
        }
    }
    return max_sim;
}

bool FeatureLibrary::loaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loaded_;
}

size_t FeatureLibrary::user_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return features_.size();
}

float FeatureLibrary::cosine_similarity(const std::vector<float>& f1, const std::vector<float>& f2) {
    if (f1.size() != f2.size() || f1.empty()) return 0.0f;

    // 两者都已归一化, 点积即余弦相似度
    float dot = 0.0f;
    for (size_t i = 0; i < f1.size(); ++i) {
        dot += f1[i] * f2[i];
    }
    return dot;
}

void FeatureLibrary::normalize(std::vector<float>& feature) {
    float sq_sum = 0.0f;
    for (float v : feature) {
        sq_sum += v * v;
    }
    float norm = std::sqrt(sq_sum);
    if (norm > 1e-6) {
        for (float& v : feature) {
            v /= norm;
        }
    }
}

} // namespace service
