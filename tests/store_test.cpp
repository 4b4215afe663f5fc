/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/flow.hpp"
#include "fanout/queue.hpp"
#include "fanout/store.hpp"
#include "test_util.hpp"
#include <fstream>

#include <gtest/gtest.h>

using namespace fanout;
using fanout::testing::TempDir;

TEST(ResultStore, PutThenGetByReference) {
    TempDir dir;
    ResultStore store(dir.path());

    auto ref = store.put("0000000000000042_00000001_000000", "{\"hash\":\"abc\"}");
    ASSERT_TRUE(ref);
    EXPECT_EQ(*ref, "results/0000000000000042_00000001_000000");
    EXPECT_EQ(*ref, ResultStore::refFor("0000000000000042_00000001_000000"));
    EXPECT_TRUE(store.exists(*ref));

    auto bytes = store.get(*ref);
    ASSERT_TRUE(bytes);
    EXPECT_EQ(*bytes, "{\"hash\":\"abc\"}");
}

TEST(ResultStore, BinaryArtifactsSurviveIntact) {
    TempDir dir;
    ResultStore store(dir.path());

    std::string bytes("\x00\x01\xff\n\x00z", 6);
    auto ref = store.put("1_1_1", bytes);
    ASSERT_TRUE(ref);
    EXPECT_EQ(store.get(*ref), bytes);
}

TEST(ResultStore, RejectsReferencesOutsideTheStore) {
    TempDir dir;
    ResultStore store(dir.path());

    EXPECT_FALSE(store.get("results/../queues"));
    EXPECT_FALSE(store.get("/etc/passwd"));
    EXPECT_FALSE(store.get("results/"));
    EXPECT_FALSE(store.exists("results/nothing-here"));
    EXPECT_FALSE(store.put("../escape", "x"));
}

TEST(Flow, UnknownAndMalformedIdsAreMissing) {
    TempDir dir;
    Flow flow(dir.path());

    EXPECT_FALSE(flow.get("0000000000000001_00000001_000000"));
    EXPECT_FALSE(flow.get("../../etc"));
    EXPECT_FALSE(flow.get(""));
    EXPECT_EQ(flow.status("nope"), Status::Missing);
    EXPECT_FALSE(flow.exists("0000000000000001_00000001_000000"));
}

TEST(Flow, StagingJobsAreInvisible) {
    TempDir dir;
    auto registry = fanout::testing::registryAt("http://localhost:1", {"image_hash"});
    JobQueue queue(dir.path(), registry);
    Flow flow(dir.path());

    const JobId id = "0000000000000007_00000001_000000";
    std::filesystem::create_directories(dir.path() / "staging" / id);
    std::ofstream(dir.path() / "staging" / id / "job.json") << R"({"id":"x","service":"image_hash"})";

    EXPECT_EQ(flow.status(id), Status::Missing);
}

TEST(Flow, ResultOnlyForSucceededJobs) {
    TempDir dir;
    auto registry = fanout::testing::registryAt("http://localhost:1", {"image_hash"});
    JobQueue queue(dir.path(), registry);
    ResultStore store(dir.path());
    Flow flow(dir.path());

    auto ok = queue.enqueue("image_hash", "a").id;
    auto bad = queue.enqueue("image_hash", "b").id;

    auto first = queue.dequeue("image_hash", "w", false);
    ASSERT_TRUE(first);
    EXPECT_FALSE(flow.result(ok));
    auto ref = store.put(first->id, "artifact");
    ASSERT_TRUE(ref);
    ASSERT_TRUE(queue.ack(*first, Outcome::succeeded(*ref)));

    auto second = queue.dequeue("image_hash", "w", false);
    ASSERT_TRUE(second);
    ASSERT_TRUE(queue.ack(*second, Outcome::failed(ErrorCode::BackendFailure, "boom")));

    EXPECT_EQ(flow.result(ok), std::optional<std::string>("artifact"));
    EXPECT_FALSE(flow.result(bad));

    auto recent = flow.recent(10);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(flow.recent(1).size(), 1u);
}
