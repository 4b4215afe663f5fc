/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/registry.hpp"
#include "test_util.hpp"
#include <fstream>

#include <gtest/gtest.h>

using namespace fanout;
using fanout::testing::TempDir;

TEST(ServiceRegistry, ResolvesRegisteredServices) {
    std::string error;
    auto registry = ServiceRegistry::parse(R"({"services": [
        {"name": "image_hash", "address": "http://localhost:5015/", "capability": "predict"},
        {"name": "mnist_fashion", "address": "http://localhost:6006", "capability": "train"}
    ]})", error);
    ASSERT_TRUE(registry) << error;
    EXPECT_EQ(registry->size(), 2u);

    auto hash = registry->resolve("image_hash");
    ASSERT_TRUE(hash);
    EXPECT_EQ(hash->address, "http://localhost:5015");
    EXPECT_EQ(hash->capability, Capability::Predict);

    auto mnist = registry->resolve("mnist_fashion");
    ASSERT_TRUE(mnist);
    EXPECT_EQ(mnist->capability, Capability::Train);

    EXPECT_FALSE(registry->resolve("face_detect"));
    EXPECT_FALSE(registry->contains("face_detect"));
}

TEST(ServiceRegistry, CapabilityDefaultsToPredict) {
    std::string error;
    auto registry = ServiceRegistry::parse(R"({"services": [{"name": "a", "address": "http://h:1"}]})", error);
    ASSERT_TRUE(registry) << error;
    EXPECT_EQ(registry->resolve("a")->capability, Capability::Predict);
}

TEST(ServiceRegistry, ListIsSortedByName) {
    auto registry = fanout::testing::registryAt("http://localhost:1", {"scene_detect", "example_model", "image_hash"});
    auto services = registry->list();
    ASSERT_EQ(services.size(), 3u);
    EXPECT_EQ(services[0].name, "example_model");
    EXPECT_EQ(services[1].name, "image_hash");
    EXPECT_EQ(services[2].name, "scene_detect");
}

TEST(ServiceRegistry, RejectsInvalidDocuments) {
    const char* invalid[] = {
        "not json",
        R"([])",
        R"({"services": {}})",
        R"({"services": [42]})",
        R"({"services": [{"name": "a"}]})",
        R"({"services": [{"name": "a", "address": 7}]})",
        R"({"services": [{"name": "../etc", "address": "http://h:1"}]})",
        R"({"services": [{"name": "", "address": "http://h:1"}]})",
        R"({"services": [{"name": "a", "address": "ftp://h:1"}]})",
        R"({"services": [{"name": "a", "address": "http://h:1", "capability": "juggle"}]})",
        R"({"services": [{"name": "a", "address": "http://h:1", "capability": 5}]})",
        R"({"services": [{"name": "a", "address": "http://h:1"}, {"name": "a", "address": "http://h:2"}]})"
    };
    for (const char* text : invalid) {
        std::string error;
        EXPECT_FALSE(ServiceRegistry::parse(text, error)) << text;
        EXPECT_FALSE(error.empty()) << text;
    }
}

TEST(ServiceRegistry, LoadsFromFile) {
    TempDir dir;
    auto path = dir.path() / "services.json";
    {
        std::ofstream out(path);
        out << R"({"services": [{"name": "example_model", "address": "http://localhost:5010"}]})";
    }

    std::string error;
    auto registry = ServiceRegistry::load(path, error);
    ASSERT_TRUE(registry) << error;
    EXPECT_TRUE(registry->contains("example_model"));

    EXPECT_FALSE(ServiceRegistry::load(dir.path() / "missing.json", error));
    EXPECT_NE(error.find("missing.json"), std::string::npos);
}

TEST(ServiceRegistry, NameValidation) {
    EXPECT_TRUE(ServiceRegistry::isValidName("face_detect"));
    EXPECT_TRUE(ServiceRegistry::isValidName("mnist-fashion2"));
    EXPECT_FALSE(ServiceRegistry::isValidName("a/b"));
    EXPECT_FALSE(ServiceRegistry::isValidName("a b"));
    EXPECT_FALSE(ServiceRegistry::isValidName(std::string(129, 'a')));
}
