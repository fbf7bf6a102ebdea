/**
 * @file photo_store.h
 * @brief 打卡照片存档
 */

#ifndef PHOTO_STORE_H
#define PHOTO_STORE_H

#include "core/error.h"
#include <opencv2/core.hpp>
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace service {

class PhotoStore {
public:
    explicit PhotoStore(const std::string& root_dir,
                        int max_dimension = 1280, int jpeg_quality = 90);

    /**
     * @brief 保存图像为 JPEG, 长边超过 max_dimension 时等比缩小
     * @param tag 文件名前缀, 例如 "verify" / "temp"
     * @return 文件路径 (作为 photo_ref / image_ref)
     */
    core::Result<std::string> save(int64_t user_id, const std::string& tag, const cv::Mat& image);

    // 保存客户端上传的已编码图像 (JPEG/PNG), 解码失败返回 InvalidArgument
    core::Result<std::string> save_encoded(int64_t user_id, const std::string& tag,
                                           const std::vector<uint8_t>& bytes);

    cv::Mat load(const std::string& ref) const;

    // 删除未被任何记录引用的照片 (验证中断或写库失败时回收)
    bool remove(const std::string& ref);

    const std::string& root_dir() const { return root_dir_; }

private:
    std::string root_dir_;
    int max_dimension_;
    int jpeg_quality_;
    std::atomic<uint64_t> sequence_{0};
};

} // namespace service

#endif // PHOTO_STORE_H
