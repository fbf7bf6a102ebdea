/**
 * @file verification_provider.h
 * @brief 身份验证服务接口
 * @details 引擎本身不做人脸比对, 只解释验证服务返回的 {success, confidence}。
 */

#ifndef VERIFICATION_PROVIDER_H
#define VERIFICATION_PROVIDER_H

#include "core/error.h"
#include "database/database_types.h"
#include <opencv2/core.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace service {

struct VerificationSample {
    int64_t user_id = -1;               // 由会话控制器填写
    std::string image_ref;              // 已存档的图像引用
    cv::Mat image;                      // 原始图像 (BGR), 配置了 PhotoStore 时自动存档
    std::vector<float> feature;         // 前端模型提取的人脸特征
    std::optional<db::LocationFix> fix; // 为空时使用会话开启时的定位
};

class VerificationProvider {
public:
    virtual ~VerificationProvider() = default;

    /**
     * @brief 比对样本
     * @return 比对结果; 服务不可达或超时返回 ProviderUnavailable (不计入验证次数)
     */
    virtual core::Result<db::VerificationOutcome> verify(const VerificationSample& sample,
                                                         std::chrono::milliseconds timeout) = 0;
};

} // namespace service

#endif // VERIFICATION_PROVIDER_H
