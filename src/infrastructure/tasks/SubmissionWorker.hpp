#pragma once

#include "infrastructure/tasks/SubmissionTask.hpp"
#include <atomic>
#include <exception>
#include <functional>
#include <string>
#include <thread>
#include <vector>
#include <loguru.hpp>

namespace invoice::infrastructure::tasks
{
    using invoice::domain::OutcomeKind;

    using SubmissionProcessor = std::function<ProcessingOutcome(const SubmissionRequest &)>;

    /**
     * @brief 固定數量的工作執行緒，每個 task 各自跑完整條管線
     * @details stop() 會先讓已排入的 task 跑完；stop 之後送出的 task 直接以 FallbackPending 結束
     */
    class SubmissionWorker
    {
    public:
        SubmissionWorker(SubmissionProcessor processor, size_t thread_count)
            : processor_(std::move(processor)), thread_count_(thread_count == 0 ? 1 : thread_count), running_(false) {}

        ~SubmissionWorker()
        {
            stop();
        }

        SubmissionWorker(const SubmissionWorker &) = delete;
        SubmissionWorker &operator=(const SubmissionWorker &) = delete;

        // Start the worker threads
        void start()
        {
            if (running_.exchange(true))
            {
                return;
            }
            for (size_t i = 0; i < thread_count_; ++i)
            {
                threads_.emplace_back(&SubmissionWorker::process_tasks, this);
            }
            LOG_F(INFO, "SubmissionWorker: started %zu threads", thread_count_);
        }

        // Drain the queue and join the worker threads
        void stop()
        {
            task_queue_.shutdown();
            if (!running_.exchange(false))
            {
                // 從未啟動: 佇列中的 task 沒有人處理
                reject_remaining();
                return;
            }
            for (auto &t : threads_)
            {
                if (t.joinable())
                {
                    t.join();
                }
            }
            threads_.clear();
            LOG_F(INFO, "SubmissionWorker: stopped");
        }

        // Submit a request to the queue
        std::future<ProcessingOutcome> submit(SubmissionRequest request)
        {
            auto promise = std::make_shared<std::promise<ProcessingOutcome>>();
            auto future = promise->get_future();
            SubmissionTask task(std::move(request), promise);
            if (!task_queue_.push(task))
            {
                promise->set_value(rejected("worker pool is stopped"));
            }
            return future;
        }

        size_t thread_count() const noexcept { return thread_count_; }

    private:
        static ProcessingOutcome rejected(const std::string &reason)
        {
            ProcessingOutcome outcome;
            outcome.kind = OutcomeKind::FallbackPending;
            outcome.reason = reason;
            return outcome;
        }

        void reject_remaining()
        {
            SubmissionTask task;
            while (task_queue_.try_pop(task))
            {
                task.promise->set_value(rejected("worker pool is stopped"));
            }
        }

        void process_tasks()
        {
            SubmissionTask task;
            while (task_queue_.wait_and_pop(task))
            {
                try
                {
                    task.promise->set_value(processor_(task.request));
                }
                catch (const std::exception &e)
                {
                    LOG_F(ERROR, "SubmissionWorker: processor threw for %s: %s", task.request.url.c_str(), e.what());
                    task.promise->set_value(rejected(std::string("Exception in submission worker: ") + e.what()));
                }
            }
        }

        SubmissionProcessor processor_;
        size_t thread_count_;
        SubmissionTaskQueue task_queue_;
        std::vector<std::thread> threads_;
        std::atomic<bool> running_;
    };

} // namespace invoice::infrastructure::tasks
