/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <chrono>
#include <memory>
#include <thread>

#include <gtest/gtest.h>

#include "scriba/model.hpp"
#include "test_support.hpp"

using namespace scriba;
using namespace std::chrono_literals;
using scriba::test::CountingSibling;
using scriba::test::FakeLoader;
using scriba::test::TempDir;
using scriba::test::eventually;

namespace {

class ModelResourceManagerTest : public ::testing::Test {
protected:
    std::unique_ptr<ModelResourceManager> make(std::chrono::milliseconds idle) {
        return std::make_unique<ModelResourceManager>(loader, sibling, idle);
    }

    std::shared_ptr<FakeLoader> loader = std::make_shared<FakeLoader>();
    std::shared_ptr<CountingSibling> sibling = std::make_shared<CountingSibling>();
};

TEST_F(ModelResourceManagerTest, RequiresLoader) {
    EXPECT_THROW(ModelResourceManager(nullptr, nullptr, 0ms), std::invalid_argument);
}

TEST_F(ModelResourceManagerTest, AcquireLoadsOnceAndShares) {
    auto manager = make(0ms);
    auto first = manager->acquire("tiny");
    ASSERT_TRUE(first);
    auto second = manager->acquire("tiny");
    ASSERT_TRUE(second);

    EXPECT_EQ(loader->loads(), (std::vector<std::string>{"tiny"}));
    EXPECT_EQ(manager->activeRefcount(), 2);
    EXPECT_EQ(&first.lease.model(), &second.lease.model());
    EXPECT_EQ(first.lease.modelName(), "tiny");
    EXPECT_EQ(sibling->calls.load(), 1);
}

TEST_F(ModelResourceManagerTest, SwitchWhileInUseIsBusy) {
    auto manager = make(0ms);
    auto held = manager->acquire("tiny");
    ASSERT_TRUE(held);

    auto other = manager->acquire("base");
    EXPECT_FALSE(other);
    EXPECT_EQ(other.error, ErrorCode::ResourceBusy);
    EXPECT_FALSE(other.lease.valid());
    EXPECT_EQ(manager->loadedModel().value_or(""), "tiny");
    EXPECT_EQ(manager->activeRefcount(), 1);
}

TEST_F(ModelResourceManagerTest, SwitchWhenIdleEvictsAndLoadsFresh) {
    auto manager = make(0ms);
    {
        auto held = manager->acquire("tiny");
        ASSERT_TRUE(held);
    }
    EXPECT_EQ(manager->activeRefcount(), 0);

    auto other = manager->acquire("base");
    ASSERT_TRUE(other);
    EXPECT_EQ(manager->loadedModel().value_or(""), "base");
    EXPECT_EQ(loader->loads(), (std::vector<std::string>{"tiny", "base"}));
    EXPECT_EQ(sibling->calls.load(), 2);
}

TEST_F(ModelResourceManagerTest, LoadFailureLeavesSlotEmpty) {
    auto manager = make(0ms);
    auto result = manager->acquire("broken");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, ErrorCode::ResourceLoadFailed);
    EXPECT_NE(result.message.find("no such model"), std::string::npos);
    EXPECT_FALSE(manager->loadedModel().has_value());
    EXPECT_EQ(manager->activeRefcount(), 0);
    EXPECT_FALSE(manager->status().loaded);
}

TEST_F(ModelResourceManagerTest, ReleaseIsIdempotentPerLease) {
    auto manager = make(0ms);
    auto a = manager->acquire("tiny");
    auto b = manager->acquire("tiny");
    ASSERT_TRUE(a && b);

    manager->release(a.lease);
    manager->release(a.lease);
    EXPECT_EQ(manager->activeRefcount(), 1);

    ModelLease moved = std::move(b.lease);
    EXPECT_FALSE(b.lease.valid());
    moved.release();
    EXPECT_EQ(manager->activeRefcount(), 0);
}

TEST_F(ModelResourceManagerTest, UnloadRefusedWhileInUse) {
    auto manager = make(0ms);
    auto held = manager->acquire("tiny");
    ASSERT_TRUE(held);
    EXPECT_FALSE(manager->unload());
    EXPECT_TRUE(manager->status().loaded);

    held.lease.release();
    EXPECT_TRUE(manager->unload());
    EXPECT_FALSE(manager->status().loaded);
    EXPECT_FALSE(manager->unload());
}

TEST_F(ModelResourceManagerTest, IdleEvictionAfterWindow) {
    auto manager = make(150ms);
    {
        auto held = manager->acquire("tiny");
        ASSERT_TRUE(held);
    }
    EXPECT_TRUE(manager->status().loaded);

    ASSERT_TRUE(eventually([&] { return !manager->status().loaded; }, 3s));
    EXPECT_FALSE(manager->loadedModel().has_value());
}

TEST_F(ModelResourceManagerTest, NoEvictionWhileHeld) {
    auto manager = make(50ms);
    auto held = manager->acquire("tiny");
    ASSERT_TRUE(held);
    std::this_thread::sleep_for(250ms);
    EXPECT_TRUE(manager->status().loaded);
}

TEST_F(ModelResourceManagerTest, AcquireCancelsPendingEviction) {
    auto manager = make(300ms);
    {
        auto held = manager->acquire("tiny");
        ASSERT_TRUE(held);
    }
    std::this_thread::sleep_for(150ms);

    auto again = manager->acquire("tiny");
    ASSERT_TRUE(again);
    std::this_thread::sleep_for(400ms);
    EXPECT_TRUE(manager->status().loaded);
    EXPECT_EQ(loader->loads().size(), 1u);

    again.lease.release();
    ASSERT_TRUE(eventually([&] { return !manager->status().loaded; }, 3s));
}

TEST_F(ModelResourceManagerTest, ZeroTimeoutDisablesEviction) {
    auto manager = make(0ms);
    {
        auto held = manager->acquire("tiny");
        ASSERT_TRUE(held);
    }
    std::this_thread::sleep_for(100ms);
    EXPECT_TRUE(manager->status().loaded);
}

TEST_F(ModelResourceManagerTest, StatusReportsSlot) {
    auto manager = make(5000ms);
    auto empty = manager->status();
    EXPECT_FALSE(empty.loaded);
    EXPECT_FALSE(empty.modelName.has_value());
    EXPECT_FALSE(empty.memoryUsedMb.has_value());
    EXPECT_DOUBLE_EQ(empty.idleTimeoutSeconds, 5.0);

    auto held = manager->acquire("tiny");
    ASSERT_TRUE(held);
    auto status = manager->status();
    EXPECT_TRUE(status.loaded);
    EXPECT_EQ(status.modelName.value_or(""), "tiny");
    EXPECT_EQ(status.device, "cpu");
    ASSERT_TRUE(status.memoryUsedMb.has_value());
    EXPECT_DOUBLE_EQ(*status.memoryUsedMb, 75.0);
    EXPECT_TRUE(status.lastUsedAt.has_value());
    EXPECT_EQ(status.activeJobs, 1);
}

TEST(ResolveModelPathTest, NamesMapToGgmlFiles) {
    EXPECT_EQ(resolveModelPath("models", "tiny"), std::filesystem::path("models") / "ggml-tiny.bin");
    EXPECT_EQ(resolveModelPath("/m", "base.en"), std::filesystem::path("/m") / "ggml-base.en.bin");
}

TEST(ResolveModelPathTest, ExistingFileUsedDirectly) {
    TempDir dir;
    auto file = dir.write("custom.bin", "x");
    EXPECT_EQ(resolveModelPath("models", file.string()), file);
}

}
