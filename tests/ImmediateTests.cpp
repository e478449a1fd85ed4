#include <gtest/gtest.h>
#include "FakeVulkan.h"
#include <memory>
#include <string>
#include <vector>
import Command;
import Device;
import Error;
import Immediate;
import Logger;
import PhysicalDevice;

namespace {
class ImmediateTest : public ::testing::Test {
 protected:
  Luminary::ConsoleLogger logger{Luminary::LogLevel::Error};
  std::unique_ptr<Luminary::Device> device;

  void SetUp() override {
    Fake::install();
    device = std::make_unique<Luminary::Device>(Luminary::selectDevice(Fake::instance(), Fake::surface(), logger),
                                                logger);
    Fake::state().calls.clear();
  }
};
}  // namespace

TEST_F(ImmediateTest, SubmitAndWait) {
  Luminary::ImmediateSubmit immediate(Luminary::QueueType::Transfer, 1'000'000, *device);
  bool recorded = false;
  immediate.submit([&](const Luminary::CommandBuffer& commandBuffer) {
    EXPECT_TRUE(commandBuffer.getActive());
    Fake::state().calls.push_back("record");
    recorded = true;
  });

  EXPECT_TRUE(recorded);
  EXPECT_EQ(Fake::state().calls,
            (std::vector<std::string>{"vkResetCommandBuffer", "vkBeginCommandBuffer", "record", "vkEndCommandBuffer",
                                      "vkQueueSubmit2", "vkWaitForFences", "vkResetFences"}));
  ASSERT_EQ(Fake::state().submissions.size(), 1u);
  EXPECT_EQ(Fake::state().submissions[0].commandBuffers, 1u);
  EXPECT_EQ(Fake::state().submissions[0].waitSemaphores, 0u);
}

TEST_F(ImmediateTest, Reusable) {
  Luminary::ImmediateSubmit immediate(Luminary::QueueType::Transfer, 1'000'000, *device);
  immediate.submit([](const Luminary::CommandBuffer&) {});
  immediate.submit([](const Luminary::CommandBuffer&) {});
  EXPECT_EQ(Fake::state().submissions.size(), 2u);
  EXPECT_EQ(Fake::count("vkResetFences"), 2);
}

TEST_F(ImmediateTest, Timeout) {
  Fake::state().gpuStalled = true;
  Luminary::ImmediateSubmit immediate(Luminary::QueueType::Transfer, 1'000'000, *device);
  try {
    immediate.submit([](const Luminary::CommandBuffer&) {});
    FAIL() << "stalled submission has to time out";
  } catch (const Luminary::RendererError& error) {
    EXPECT_EQ(error.getResult(), VK_TIMEOUT);
  }
  EXPECT_EQ(Fake::count("vkResetFences"), 0);
}
