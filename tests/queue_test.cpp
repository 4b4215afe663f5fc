/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/flow.hpp"
#include "fanout/queue.hpp"
#include "test_util.hpp"
#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

using namespace fanout;
using namespace std::chrono_literals;
using fanout::testing::TempDir;

namespace {

std::size_t countEntries(const std::filesystem::path& dir) {
    std::error_code ec;
    std::size_t count = 0;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        ++count;
    }
    return count;
}

class JobQueueTest : public ::testing::Test {
protected:
    TempDir dir;
    RegistryPtr registry = fanout::testing::registryAt("http://localhost:1", {"image_hash", "example_model"});

    std::unique_ptr<JobQueue> makeQueue(QueueOptions options = {}) {
        return std::make_unique<JobQueue>(dir.path(), registry, options);
    }
};

}

TEST_F(JobQueueTest, UnknownServiceIsRejectedWithoutWritingAnything) {
    auto queue = makeQueue();
    auto result = queue->enqueue("face_detect", "payload");

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, ErrorCode::UnknownService);
    EXPECT_TRUE(result.id.empty());
    EXPECT_EQ(countEntries(dir.path() / "staging"), 0u);
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "queues" / "face_detect"));
}

TEST_F(JobQueueTest, EmptyAndOversizedPayloadsAreInvalid) {
    QueueOptions options;
    options.maxPayloadBytes = 8;
    auto queue = makeQueue(options);

    EXPECT_EQ(queue->enqueue("image_hash", "").error, ErrorCode::InvalidRequest);
    EXPECT_EQ(queue->enqueue("image_hash", "123456789").error, ErrorCode::InvalidRequest);
    EXPECT_TRUE(queue->enqueue("image_hash", "12345678"));
}

TEST_F(JobQueueTest, DeliversInEnqueueOrderPerService) {
    auto queue = makeQueue();
    std::vector<JobId> ids;
    for (int i = 0; i < 5; ++i) {
        auto result = queue->enqueue("image_hash", "payload-" + std::to_string(i));
        ASSERT_TRUE(result) << result.message;
        ids.push_back(result.id);
    }
    ASSERT_TRUE(queue->enqueue("example_model", "other"));

    for (int i = 0; i < 5; ++i) {
        auto job = queue->dequeue("image_hash", "owner", false);
        ASSERT_TRUE(job);
        EXPECT_EQ(job->id, ids[i]);
        EXPECT_EQ(job->payload, "payload-" + std::to_string(i));
        EXPECT_EQ(job->service, "image_hash");
        EXPECT_EQ(job->deliveries, 1);
    }
    EXPECT_FALSE(queue->dequeue("image_hash", "owner", false));
    EXPECT_EQ(queue->depth("example_model"), 1u);
}

TEST_F(JobQueueTest, AckSucceededMakesJobTerminal) {
    auto queue = makeQueue();
    Flow flow(dir.path());

    auto id = queue->enqueue("image_hash", "x").id;
    EXPECT_EQ(flow.status(id), Status::Queued);

    auto job = queue->dequeue("image_hash", "owner-1", false);
    ASSERT_TRUE(job);
    EXPECT_EQ(flow.status(id), Status::Running);

    EXPECT_FALSE(queue->ack(*job, Outcome::succeeded("")));
    ASSERT_TRUE(queue->ack(*job, Outcome::succeeded("results/" + id)));

    auto view = flow.get(id);
    ASSERT_TRUE(view);
    EXPECT_EQ(view->status, Status::Succeeded);
    EXPECT_EQ(view->resultRef, "results/" + id);
    EXPECT_EQ(view->deliveries, 1);

    // Terminal jobs never move again
    EXPECT_FALSE(queue->ack(*job, Outcome::failed(ErrorCode::BackendFailure, "late")));
    EXPECT_EQ(flow.status(id), Status::Succeeded);
}

TEST_F(JobQueueTest, AckFailedRecordsErrorCode) {
    auto queue = makeQueue();
    Flow flow(dir.path());

    auto id = queue->enqueue("image_hash", "x").id;
    auto job = queue->dequeue("image_hash", "owner-1", false);
    ASSERT_TRUE(job);
    ASSERT_TRUE(queue->ack(*job, Outcome::failed(ErrorCode::BackendFailure, "bad image")));

    auto view = flow.get(id);
    ASSERT_TRUE(view);
    EXPECT_EQ(view->status, Status::Failed);
    EXPECT_EQ(view->error, ErrorCode::BackendFailure);
    EXPECT_EQ(view->message, "bad image");
}

TEST_F(JobQueueTest, OnlyLeaseOwnerMayAck) {
    auto queue = makeQueue();
    queue->enqueue("image_hash", "x");
    auto job = queue->dequeue("image_hash", "owner-1", false);
    ASSERT_TRUE(job);

    Job impostor = *job;
    impostor.owner = "owner-2";
    EXPECT_FALSE(queue->ack(impostor, Outcome::succeeded("results/" + job->id)));
    EXPECT_FALSE(queue->renew(impostor));
    EXPECT_TRUE(queue->renew(*job));
    EXPECT_TRUE(queue->ack(*job, Outcome::succeeded("results/" + job->id)));
}

TEST_F(JobQueueTest, ConcurrentConsumersNeverShareAJob) {
    auto queue = makeQueue();
    constexpr int kJobs = 200;
    for (int i = 0; i < kJobs; ++i) {
        ASSERT_TRUE(queue->enqueue("image_hash", std::to_string(i)));
    }

    std::mutex mutex;
    std::multiset<JobId> claimed;
    std::vector<std::thread> consumers;
    for (int c = 0; c < 6; ++c) {
        consumers.emplace_back([&, c] {
            // Separate instances share only the directory, like separate processes
            JobQueue own(dir.path(), registry);
            const std::string owner = "consumer-" + std::to_string(c);
            while (auto job = own.dequeue("image_hash", owner, false)) {
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    claimed.insert(job->id);
                }
                EXPECT_TRUE(own.ack(*job, Outcome::succeeded("results/" + job->id)));
            }
        });
    }
    for (auto& t : consumers) {
        t.join();
    }

    EXPECT_EQ(claimed.size(), static_cast<std::size_t>(kJobs));
    for (const auto& id : claimed) {
        EXPECT_EQ(claimed.count(id), 1u) << id;
    }
    EXPECT_EQ(countEntries(dir.path() / "done"), static_cast<std::size_t>(kJobs));
}

TEST_F(JobQueueTest, ExpiredLeaseRequeuesOnceThenFailsAsWorkerCrash) {
    QueueOptions options;
    options.visibilityTimeout = 100ms;
    options.maxDeliveries = 2;
    auto queue = makeQueue(options);
    Flow flow(dir.path());

    auto id = queue->enqueue("image_hash", "x").id;
    auto first = queue->dequeue("image_hash", "crashed", false);
    ASSERT_TRUE(first);

    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(queue->reapExpired("image_hash"), 1u);
    // Requeued, but it never reports going back to Queued
    EXPECT_EQ(flow.status(id), Status::Running);

    auto second = queue->dequeue("image_hash", "also-crashed", false);
    ASSERT_TRUE(second);
    EXPECT_EQ(second->id, id);
    EXPECT_EQ(second->deliveries, 2);
    EXPECT_FALSE(queue->ack(*first, Outcome::succeeded("results/" + id)));

    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(queue->reapExpired("image_hash"), 1u);

    auto view = flow.get(id);
    ASSERT_TRUE(view);
    EXPECT_EQ(view->status, Status::Failed);
    EXPECT_EQ(view->error, ErrorCode::WorkerCrash);
    EXPECT_FALSE(queue->dequeue("image_hash", "late", false));
}

TEST_F(JobQueueTest, InterruptedCancelIsFinishedByReaper) {
    QueueOptions options;
    options.visibilityTimeout = 100ms;
    auto queue = makeQueue(options);
    Flow flow(dir.path());

    // cancel() claimed the job, then its process died before the ack
    auto id = queue->enqueue("image_hash", "x").id;
    ASSERT_TRUE(queue->dequeue("image_hash", "cancel@4242", false));

    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(queue->reapExpired("image_hash"), 1u);

    auto view = flow.get(id);
    ASSERT_TRUE(view);
    EXPECT_EQ(view->status, Status::Failed);
    EXPECT_EQ(view->error, ErrorCode::Cancelled);
    EXPECT_FALSE(queue->dequeue("image_hash", "worker", false));
}

TEST_F(JobQueueTest, CancelledRunningJobIsNotRedeliveredAfterCrash) {
    QueueOptions options;
    options.visibilityTimeout = 100ms;
    auto queue = makeQueue(options);
    Flow flow(dir.path());

    auto id = queue->enqueue("image_hash", "x").id;
    ASSERT_TRUE(queue->dequeue("image_hash", "crashed", false));
    EXPECT_EQ(queue->cancel(id), CancelResult::Requested);

    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(queue->reapExpired("image_hash"), 1u);
    EXPECT_EQ(flow.get(id)->error, ErrorCode::Cancelled);
    EXPECT_FALSE(queue->dequeue("image_hash", "worker", false));
}

TEST_F(JobQueueTest, RenewKeepsLeaseAlive) {
    QueueOptions options;
    options.visibilityTimeout = 300ms;
    auto queue = makeQueue(options);

    queue->enqueue("image_hash", "x");
    auto job = queue->dequeue("image_hash", "owner", false);
    ASSERT_TRUE(job);

    std::this_thread::sleep_for(200ms);
    ASSERT_TRUE(queue->renew(*job));
    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(queue->reapExpired("image_hash"), 0u);
    EXPECT_TRUE(queue->ack(*job, Outcome::succeeded("results/" + job->id)));
}

TEST_F(JobQueueTest, LeaselessProcessingJobGetsOneVisibilityWindow) {
    QueueOptions options;
    options.visibilityTimeout = 100ms;
    auto queue = makeQueue(options);

    auto id = queue->enqueue("image_hash", "x").id;
    auto job = queue->dequeue("image_hash", "owner", false);
    ASSERT_TRUE(job);
    std::filesystem::remove(dir.path() / "queues" / "image_hash" / "processing" / id / "lease.json");

    EXPECT_EQ(queue->reapExpired("image_hash"), 0u);
    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(queue->reapExpired("image_hash"), 1u);

    auto again = queue->dequeue("image_hash", "owner-2", false);
    ASSERT_TRUE(again);
    EXPECT_EQ(again->id, id);
}

TEST_F(JobQueueTest, CancelQueuedJobIsNeverDelivered) {
    auto queue = makeQueue();
    Flow flow(dir.path());

    auto id = queue->enqueue("image_hash", "x").id;
    EXPECT_EQ(queue->cancel(id), CancelResult::Cancelled);
    EXPECT_FALSE(queue->dequeue("image_hash", "owner", false));

    auto view = flow.get(id);
    ASSERT_TRUE(view);
    EXPECT_EQ(view->status, Status::Failed);
    EXPECT_EQ(view->error, ErrorCode::Cancelled);

    EXPECT_EQ(queue->cancel(id), CancelResult::AlreadyFinished);
    EXPECT_EQ(queue->cancel("0000000000000001_00000001_000000"), CancelResult::NotFound);
}

TEST_F(JobQueueTest, CancelRunningJobLeavesMarker) {
    auto queue = makeQueue();
    auto id = queue->enqueue("image_hash", "x").id;
    auto job = queue->dequeue("image_hash", "owner", false);
    ASSERT_TRUE(job);

    EXPECT_FALSE(queue->cancelRequested(*job));
    EXPECT_EQ(queue->cancel(id), CancelResult::Requested);
    EXPECT_TRUE(queue->cancelRequested(*job));
    EXPECT_TRUE(queue->ack(*job, Outcome::failed(ErrorCode::Cancelled, "stopped")));
}

TEST_F(JobQueueTest, BlockingDequeueWakesOnEnqueue) {
    QueueOptions options;
    options.pollInterval = 10s;
    auto queue = makeQueue(options);

    std::optional<Job> received;
    auto started = std::chrono::steady_clock::now();
    std::thread consumer([&] { received = queue->dequeue("image_hash", "owner"); });

    std::this_thread::sleep_for(50ms);
    auto id = queue->enqueue("image_hash", "x").id;
    consumer.join();

    ASSERT_TRUE(received);
    EXPECT_EQ(received->id, id);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST_F(JobQueueTest, ShutdownReleasesBlockedConsumer) {
    QueueOptions options;
    options.pollInterval = 10s;
    auto queue = makeQueue(options);

    std::atomic<bool> returned{false};
    std::optional<Job> received;
    std::thread consumer([&] {
        received = queue->dequeue("image_hash", "owner");
        returned.store(true);
    });

    std::this_thread::sleep_for(50ms);
    queue->shutdown();
    consumer.join();

    EXPECT_TRUE(returned.load());
    EXPECT_FALSE(received);
    EXPECT_TRUE(queue->isShutdown());
}

TEST_F(JobQueueTest, RegistrySwapAffectsNewEnqueues) {
    auto queue = makeQueue();
    EXPECT_EQ(queue->enqueue("face_detect", "x").error, ErrorCode::UnknownService);

    queue->setRegistry(fanout::testing::registryAt("http://localhost:1", {"face_detect"}));
    EXPECT_TRUE(queue->enqueue("face_detect", "x"));
    EXPECT_EQ(queue->enqueue("image_hash", "x").error, ErrorCode::UnknownService);
}
