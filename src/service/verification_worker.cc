/**
 * @file verification_worker.cc
 * @brief 验证服务调用线程实现
 * @details 职责:
 * 1. 任务消费: 从队列获取待验证样本。
 * 2. 调用验证服务: 服务可能阻塞, 由提交方的超时兜底。
 * 3. 结果回传: 提交方仍在等待时写回结果, 否则丢弃。
 */

#include "service/verification_worker.h"
#include <exception>
#include <utility>
#include <iostream>

namespace service {

VerificationWorker::VerificationWorker(VerificationProvider& provider, int thread_count)
    : provider_(provider)
    , thread_count_(thread_count > 0 ? thread_count : 1)
    , running_(false)
{
}

VerificationWorker::~VerificationWorker() {
    stop();
}

void VerificationWorker::start() {
    if (running_) return;
    running_ = true;
    for (int i = 0; i < thread_count_; ++i) {
        threads_.emplace_back(&VerificationWorker::thread_loop, this);
    }
}

void VerificationWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
    }
    queue_cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    threads_.clear();

    // 队列中尚未执行的任务直接失败, 唤醒等待方
    std::queue<std::shared_ptr<Call>> pending;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        std::swap(pending, task_queue_);
    }
    while (!pending.empty()) {
        finish(*pending.front(), core::Error{core::ErrorCode::ProviderUnavailable, "verification worker stopped"});
        pending.pop();
    }
}

core::Result<db::VerificationOutcome> VerificationWorker::verify(const VerificationSample& sample,
                                                                 std::chrono::milliseconds timeout) {
    auto call = std::make_shared<Call>();
    call->sample = sample;
    call->timeout = timeout;

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) {
            return core::Error{core::ErrorCode::ProviderUnavailable, "verification worker is not running"};
        }
        if (task_queue_.size() >= Config::Performance::VERIFY_QUEUE_MAX_SIZE) {
            return core::Error{core::ErrorCode::ProviderUnavailable, "verification queue is full"};
        }
        task_queue_.push(call);
    }
    queue_cv_.notify_one();

    std::unique_lock<std::mutex> lock(call->mutex);
    if (!call->cv.wait_for(lock, timeout, [&call] { return call->done; })) {
        call->abandoned = true;
        abandoned_++;
        std::cerr << "Verification of user " << sample.user_id << " timed out after "
                  << timeout.count() << "ms" << std::endl;
        return core::Error{core::ErrorCode::ProviderUnavailable,
                           "verification timed out after " + std::to_string(timeout.count()) + "ms"};
    }
    return std::move(*call->result);
}

void VerificationWorker::thread_loop() {
    while (true) {
        std::shared_ptr<Call> call;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !task_queue_.empty() || !running_; });

            if (!running_) break;

            call = task_queue_.front();
            task_queue_.pop();
        }

        {
            std::lock_guard<std::mutex> lock(call->mutex);
            if (call->abandoned) continue;   // 排队期间已超时
        }

        auto t0 = std::chrono::steady_clock::now();
        core::Result<db::VerificationOutcome> result =
            core::Error{core::ErrorCode::ProviderUnavailable, "verification provider failed"};
        try {
            result = provider_.verify(call->sample, call->timeout);
        } catch (const std::exception& e) {
            std::cerr << "Verification provider threw: " << e.what() << std::endl;
            result = core::Error{core::ErrorCode::ProviderUnavailable, e.what()};
        }
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0);

        bool late = false;
        {
            std::lock_guard<std::mutex> lock(call->mutex);
            late = call->abandoned;
        }
        if (late) {
            std::cerr << "Dropping verification result of user " << call->sample.user_id
                      << " that arrived after " << ms.count() << "ms" << std::endl;
            continue;
        }
        finish(*call, std::move(result));
    }
}

void VerificationWorker::finish(Call& call, core::Result<db::VerificationOutcome> result) {
    {
        std::lock_guard<std::mutex> lock(call.mutex);
        if (call.abandoned) return;
        call.result = std::move(result);
        call.done = true;
    }
    call.cv.notify_all();
}

} // namespace service
