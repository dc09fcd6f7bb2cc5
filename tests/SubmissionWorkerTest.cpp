#include <gtest/gtest.h>
#include "infrastructure/tasks/SubmissionWorker.hpp"
#include <atomic>
#include <chrono>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace invoice::domain;
using invoice::infrastructure::tasks::SubmissionTask;
using invoice::infrastructure::tasks::SubmissionTaskQueue;
using invoice::infrastructure::tasks::SubmissionWorker;

namespace
{
    SubmissionRequest requestFor(const std::string &url)
    {
        SubmissionRequest request;
        request.url = url;
        request.user_id = "u";
        return request;
    }

    ProcessingOutcome committedFor(const SubmissionRequest &request)
    {
        ProcessingOutcome outcome;
        outcome.kind = OutcomeKind::Committed;
        outcome.cufe = request.url;
        return outcome;
    }
}

TEST(SubmissionTaskQueueTest, ShutdownWakesWaiters)
{
    SubmissionTaskQueue queue;
    std::atomic<bool> returned{false};

    std::thread waiter([&]
                       {
                           SubmissionTask task;
                           EXPECT_FALSE(queue.wait_and_pop(task));
                           returned = true; });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(returned.load());
    queue.shutdown();
    waiter.join();
    EXPECT_TRUE(returned.load());
}

TEST(SubmissionTaskQueueTest, DrainsBeforeReportingClosed)
{
    SubmissionTaskQueue queue;
    SubmissionTask queued(requestFor("a"), nullptr);
    ASSERT_TRUE(queue.push(queued));
    queue.shutdown();

    SubmissionTask task;
    ASSERT_TRUE(queue.wait_and_pop(task));
    EXPECT_EQ(task.request.url, "a");
    EXPECT_FALSE(queue.wait_and_pop(task));
}

TEST(SubmissionTaskQueueTest, PushAfterShutdownIsRefused)
{
    SubmissionTaskQueue queue;
    queue.shutdown();

    SubmissionTask task(requestFor("late"), nullptr);
    EXPECT_FALSE(queue.push(task));
    EXPECT_EQ(task.request.url, "late"); // 未被搬走
    EXPECT_EQ(queue.size(), 0u);
}

TEST(SubmissionWorkerTest, EverySubmissionGetsItsOwnOutcome)
{
    SubmissionWorker worker(committedFor, 4);
    worker.start();

    std::vector<std::future<ProcessingOutcome>> futures;
    for (int i = 0; i < 32; ++i)
    {
        futures.push_back(worker.submit(requestFor("url-" + std::to_string(i))));
    }

    std::set<std::string> seen;
    for (auto &f : futures)
    {
        auto outcome = f.get();
        EXPECT_EQ(outcome.kind, OutcomeKind::Committed);
        seen.insert(outcome.cufe);
    }
    EXPECT_EQ(seen.size(), 32u);
    worker.stop();
}

// 多個提交可以同時執行，不會被單一執行緒序列化
TEST(SubmissionWorkerTest, RunsSubmissionsConcurrently)
{
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    SubmissionWorker worker([&](const SubmissionRequest &request)
                            {
                                int now = ++active;
                                int expected = peak.load();
                                while (now > expected && !peak.compare_exchange_weak(expected, now))
                                {
                                }
                                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                                --active;
                                return committedFor(request); },
                            4);
    worker.start();

    std::vector<std::future<ProcessingOutcome>> futures;
    for (int i = 0; i < 4; ++i)
        futures.push_back(worker.submit(requestFor("u" + std::to_string(i))));
    for (auto &f : futures)
        f.get();

    EXPECT_GT(peak.load(), 1);
}

TEST(SubmissionWorkerTest, ProcessorExceptionBecomesFallback)
{
    SubmissionWorker worker([](const SubmissionRequest &) -> ProcessingOutcome
                            { throw std::runtime_error("boom"); },
                            1);
    worker.start();

    auto outcome = worker.submit(requestFor("x")).get();

    EXPECT_EQ(outcome.kind, OutcomeKind::FallbackPending);
    EXPECT_NE(outcome.reason.find("boom"), std::string::npos);
}

TEST(SubmissionWorkerTest, StopDrainsQueuedWorkAndRejectsNewWork)
{
    std::atomic<int> processed{0};
    SubmissionWorker worker([&](const SubmissionRequest &request)
                            {
                                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                                ++processed;
                                return committedFor(request); },
                            1);
    worker.start();

    std::vector<std::future<ProcessingOutcome>> futures;
    for (int i = 0; i < 5; ++i)
        futures.push_back(worker.submit(requestFor("q" + std::to_string(i))));
    worker.stop();

    EXPECT_EQ(processed.load(), 5);
    for (auto &f : futures)
        EXPECT_EQ(f.get().kind, OutcomeKind::Committed);

    auto late = worker.submit(requestFor("late")).get();
    EXPECT_EQ(late.kind, OutcomeKind::FallbackPending);
}

// submit 與 stop 同時發生時，每個 future 都必須拿到結果
TEST(SubmissionWorkerTest, SubmitRacingStopNeverBreaksPromise)
{
    for (int round = 0; round < 200; ++round)
    {
        SubmissionWorker worker(committedFor, 2);
        worker.start();

        std::vector<std::future<ProcessingOutcome>> futures(20);
        std::vector<std::thread> submitters;
        for (size_t i = 0; i < futures.size(); ++i)
        {
            submitters.emplace_back([&worker, &futures, i]
                                    { futures[i] = worker.submit(requestFor("r" + std::to_string(i))); });
        }
        worker.stop();
        for (auto &t : submitters)
            t.join();

        for (auto &f : futures)
        {
            ProcessingOutcome outcome;
            ASSERT_NO_THROW(outcome = f.get());
            EXPECT_TRUE(outcome.kind == OutcomeKind::Committed || outcome.kind == OutcomeKind::FallbackPending);
        }
    }
}

TEST(SubmissionWorkerTest, StopWithoutStartRejectsQueuedWork)
{
    SubmissionWorker worker(committedFor, 1);
    auto queued = worker.submit(requestFor("never-run"));
    worker.stop();

    auto outcome = queued.get();
    EXPECT_EQ(outcome.kind, OutcomeKind::FallbackPending);
    EXPECT_EQ(outcome.reason, "worker pool is stopped");
}
