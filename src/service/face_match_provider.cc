/**
 * @file face_match_provider.cc
 * @brief 基于已注册人脸特征的验证服务实现
 * @details 比对在内存中完成; 超时由调用线程 (VerificationWorker) 负责。
 */

#include "service/face_match_provider.h"
#include <algorithm>

namespace service {

FaceMatchProvider::FaceMatchProvider(const FeatureLibrary& library, float match_threshold)
    : library_(library), threshold_(match_threshold) {}

core::Result<db::VerificationOutcome> FaceMatchProvider::verify(const VerificationSample& sample,
                                                                std::chrono::milliseconds /*timeout*/) {
    // 本地比对不会阻塞, 超时参数仅对远程服务有意义
    if (!library_.loaded()) {
        return core::Error{core::ErrorCode::ProviderUnavailable, "feature library not loaded"};
    }

    db::VerificationOutcome outcome;
    if (sample.feature.empty()) {
        outcome.success = false;
        outcome.confidence_percent = 0.0f;
        outcome.failure_reason = "no face detected";
        return outcome;
    }

    auto similarity = library_.best_similarity(sample.user_id, sample.feature);
    if (!similarity) {
        outcome.success = false;
        outcome.confidence_percent = 0.0f;
        outcome.failure_reason = "no enrolled face";
        return outcome;
    }

    float sim = *similarity;
    outcome.confidence_percent = std::clamp(sim, 0.0f, 1.0f) * 100.0f;
    outcome.success = sim >= threshold_;
    if (!outcome.success) {
        outcome.failure_reason = "face does not match";
    }
    return outcome;
}

} // namespace service
