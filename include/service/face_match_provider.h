/**
 * @file face_match_provider.h
 * @brief 基于已注册人脸特征的验证服务
 */

#ifndef FACE_MATCH_PROVIDER_H
#define FACE_MATCH_PROVIDER_H

#include "service/feature_library.h"
#include "service/verification_provider.h"

namespace service {

/**
 * 比对样本中由前端模型提取的人脸特征与该用户已注册的特征。
 * 置信度 = 相似度 * 100, 相似度达到阈值即验证通过。
 */
class FaceMatchProvider : public VerificationProvider {
public:
    FaceMatchProvider(const FeatureLibrary& library, float match_threshold);

    core::Result<db::VerificationOutcome> verify(const VerificationSample& sample,
                                                 std::chrono::milliseconds timeout) override;

    void set_threshold(float threshold) { threshold_ = threshold; }
    float threshold() const { return threshold_; }

private:
    const FeatureLibrary& library_;
    float threshold_;
};

} // namespace service

#endif // FACE_MATCH_PROVIDER_H
