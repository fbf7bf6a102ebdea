/**
 * @file photo_store.cc
 * @brief 打卡照片存档实现
 */

#include "service/photo_store.h"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace service {

PhotoStore::PhotoStore(const std::string& root_dir, int max_dimension, int jpeg_quality)
    : root_dir_(root_dir), max_dimension_(max_dimension), jpeg_quality_(jpeg_quality) {}

core::Result<std::string> PhotoStore::save(int64_t user_id, const std::string& tag, const cv::Mat& image) {
    if (image.empty()) {
        return core::Error{core::ErrorCode::InvalidArgument, "empty image"};
    }

    std::error_code ec;
    std::filesystem::create_directories(root_dir_, ec);
    if (ec) {
        std::cerr << "Can't create photo directory " << root_dir_ << ": " << ec.message() << std::endl;
        return core::Error{core::ErrorCode::StorageError, "cannot create photo directory"};
    }

    cv::Mat output = image;
    int longest = std::max(image.cols, image.rows);
    if (max_dimension_ > 0 && longest > max_dimension_) {
        double scale = static_cast<double>(max_dimension_) / longest;
        cv::resize(image, output, cv::Size(), scale, scale, cv::INTER_AREA);
    }

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::string name = tag + "_" + std::to_string(user_id) + "_" + std::to_string(ms) + "_" +
                       std::to_string(sequence_.fetch_add(1)) + ".jpg";
    std::string path = (std::filesystem::path(root_dir_) / name).string();

    std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, jpeg_quality_};
    bool written = false;
    try {
        written = cv::imwrite(path, output, params);
    } catch (const cv::Exception& e) {
        std::cerr << "imwrite failed: " << e.what() << std::endl;
    }
    if (!written) {
        return core::Error{core::ErrorCode::StorageError, "cannot write " + path};
    }
    return path;
}

core::Result<std::string> PhotoStore::save_encoded(int64_t user_id, const std::string& tag,
                                                   const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        return core::Error{core::ErrorCode::InvalidArgument, "empty image data"};
    }
    cv::Mat image = cv::imdecode(bytes, cv::IMREAD_COLOR);
    if (image.empty()) {
        return core::Error{core::ErrorCode::InvalidArgument, "image data cannot be decoded"};
    }
    return save(user_id, tag, image);
}

cv::Mat PhotoStore::load(const std::string& ref) const {
    return cv::imread(ref, cv::IMREAD_COLOR);
}

bool PhotoStore::remove(const std::string& ref) {
    std::error_code ec;
    bool removed = std::filesystem::remove(ref, ec);
    if (ec) {
        std::cerr << "Can't remove photo " << ref << ": " << ec.message() << std::endl;
        return false;
    }
    return removed;
}

} // namespace service
