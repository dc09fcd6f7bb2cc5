#pragma once

#include "domain/InvoiceDataStructure.hpp"
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <queue>

namespace invoice::infrastructure::tasks
{
    using invoice::domain::ProcessingOutcome;
    using invoice::domain::SubmissionRequest;

    // 一次提交對應一個 task，結果經由 promise 回傳給提交者
    struct SubmissionTask
    {
        SubmissionRequest request;
        std::shared_ptr<std::promise<ProcessingOutcome>> promise;

        SubmissionTask() : promise(nullptr) {}

        SubmissionTask(SubmissionRequest req, std::shared_ptr<std::promise<ProcessingOutcome>> p)
            : request(std::move(req)), promise(std::move(p)) {}
    };

    // Thread-safe task queue，shutdown 後 wait_and_pop 不再阻塞
    class SubmissionTaskQueue
    {
    public:
        // 已關閉時不收，task 原封不動留給呼叫端
        bool push(SubmissionTask &task)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
            {
                return false;
            }
            queue_.push(std::move(task));
            cv_.notify_one();
            return true;
        }

        bool try_pop(SubmissionTask &task)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.empty())
            {
                return false;
            }
            task = std::move(queue_.front());
            queue_.pop();
            return true;
        }

        /**
         * @brief 等待下一個 task
         * @return 佇列已關閉且清空時回傳 false
         */
        bool wait_and_pop(SubmissionTask &task)
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]
                     { return !queue_.empty() || closed_; });
            if (queue_.empty())
            {
                return false;
            }
            task = std::move(queue_.front());
            queue_.pop();
            return true;
        }

        void shutdown()
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                closed_ = true;
            }
            cv_.notify_all();
        }

        bool closed() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return closed_;
        }

        size_t size() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return queue_.size();
        }

    private:
        std::queue<SubmissionTask> queue_;
        bool closed_ = false;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
    };

} // namespace invoice::infrastructure::tasks
