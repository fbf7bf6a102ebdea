/**
 * @file verification_worker.h
 * @brief 验证服务调用线程
 * @details 在工作线程中调用 VerificationProvider, 提交方按调用方给定的超时等待结果。
 *          超时后提交方立即返回, 迟到的结果被丢弃。
 */

#ifndef VERIFICATION_WORKER_H
#define VERIFICATION_WORKER_H

#include "config.h"
#include "core/error.h"
#include "database/database_types.h"
#include "service/verification_provider.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace service {

class VerificationWorker {
public:
    explicit VerificationWorker(VerificationProvider& provider,
                                int thread_count = Config::Performance::VERIFY_WORKER_THREADS);
    ~VerificationWorker();

    VerificationWorker(const VerificationWorker&) = delete;
    VerificationWorker& operator=(const VerificationWorker&) = delete;

    void start();
    void stop();

    /**
     * @brief 提交样本并最多等待 timeout
     * @return 超时、队列已满或线程已停止时返回 ProviderUnavailable
     */
    core::Result<db::VerificationOutcome> verify(const VerificationSample& sample, std::chrono::milliseconds timeout);

    // 超时后被丢弃的调用次数
    uint64_t abandoned_count() const { return abandoned_.load(); }

private:
    struct Call {
        VerificationSample sample;
        std::chrono::milliseconds timeout{0};

        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
        bool abandoned = false;   // 提交方已放弃等待
        std::optional<core::Result<db::VerificationOutcome>> result;
    };

    void thread_loop();
    static void finish(Call& call, core::Result<db::VerificationOutcome> result);

    VerificationProvider& provider_;
    int thread_count_;

    std::vector<std::thread> threads_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> abandoned_{0};

    std::queue<std::shared_ptr<Call>> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
};

} // namespace service

#endif // VERIFICATION_WORKER_H
