#include <gtest/gtest.h>
#include "FakeVulkan.h"
#include <algorithm>
#include <memory>
#include <string>
#include <vector>
import Command;
import Device;
import Error;
import FrameScheduler;
import Logger;
import PhysicalDevice;
import RenderPass;
import Settings;
import Swapchain;

namespace {
class RecordingPass final : public Luminary::RenderPass {
 public:
  std::vector<uint32_t> recorded;
  int resets = 0;

  void record(const Luminary::CommandBuffer& commandBuffer, const Luminary::SwapchainImage& image) override {
    EXPECT_TRUE(commandBuffer.getActive());
    recorded.push_back(image.index);
  }
  void reset(const Luminary::Swapchain&) override { resets++; }
};

class FailingPass final : public Luminary::RenderPass {
 public:
  void record(const Luminary::CommandBuffer&, const Luminary::SwapchainImage&) override {
    throw Luminary::RendererError("no descriptor set for image", VK_ERROR_INITIALIZATION_FAILED);
  }
  void reset(const Luminary::Swapchain&) override {}
};

class FrameSchedulerTest : public ::testing::Test {
 protected:
  Luminary::ConsoleLogger logger{Luminary::LogLevel::Error};
  Luminary::Settings settings;
  std::unique_ptr<Luminary::Device> device;
  std::unique_ptr<Luminary::Swapchain> swapchain;
  std::unique_ptr<Luminary::FrameScheduler> scheduler;
  RecordingPass pass;

  void SetUp() override {
    Fake::install();
    device = std::make_unique<Luminary::Device>(Luminary::selectDevice(Fake::instance(), Fake::surface(), logger),
                                                logger);
    swapchain = std::make_unique<Luminary::Swapchain>(VkExtent2D{1280, 720}, Fake::surface(), *device, logger);
    scheduler = std::make_unique<Luminary::FrameScheduler>(*swapchain, settings, *device, logger);
    Fake::state().calls.clear();
  }

  void TearDown() override {
    scheduler.reset();
    swapchain.reset();
    device.reset();
  }
};
}  // namespace

TEST_F(FrameSchedulerTest, SlotsAlternate) {
  for (int frame = 0; frame < 4; frame++) {
    EXPECT_EQ(scheduler->getCurrentSlot(), frame % Luminary::kFramesInFlight);
    EXPECT_FALSE(scheduler->drawFrame(pass));
  }

  EXPECT_EQ(scheduler->getFrameCounter(), 4u);
  EXPECT_EQ(pass.recorded, (std::vector<uint32_t>{0, 1, 2, 0}));
  EXPECT_EQ(Fake::state().presentedIndices, (std::vector<uint32_t>{0, 1, 2, 0}));
  ASSERT_EQ(Fake::state().submissions.size(), 4u);
  for (int frame = 0; frame < 4; frame++) {
    const auto& submission = Fake::state().submissions[frame];
    EXPECT_EQ(submission.waitSemaphores, 1u);
    EXPECT_EQ(submission.commandBuffers, 1u);
    EXPECT_EQ(submission.signalSemaphores, 1u);
    EXPECT_EQ(submission.fence, scheduler->getFrameSlot(frame % 2).getInFlight().getFence());
  }
  EXPECT_NE(scheduler->getFrameSlot(0).getInFlight().getFence(), scheduler->getFrameSlot(1).getInFlight().getFence());
  EXPECT_EQ(scheduler->getFrameSlot(0).getState(), Luminary::FrameSlotState::Submitted);
}

TEST_F(FrameSchedulerTest, FrameOrder) {
  scheduler->drawFrame(pass);
  EXPECT_EQ(Fake::state().calls,
            (std::vector<std::string>{"vkWaitForFences", "vkResetFences", "vkAcquireNextImageKHR",
                                      "vkResetCommandBuffer", "vkBeginCommandBuffer", "vkEndCommandBuffer",
                                      "vkQueueSubmit2", "vkQueuePresentKHR"}));
}

TEST_F(FrameSchedulerTest, SlowGpuTimesOut) {
  Fake::state().gpuStalled = true;
  scheduler->drawFrame(pass);
  scheduler->drawFrame(pass);
  EXPECT_EQ(Fake::state().fenceResets, 2);

  // slot 0 is still in flight
  EXPECT_THROW(scheduler->drawFrame(pass), Luminary::DrawTimeout);
  EXPECT_EQ(Fake::state().fenceResets, 2);
  EXPECT_EQ(scheduler->getFrameCounter(), 2u);
  EXPECT_EQ(scheduler->getFrameSlot(0).getState(), Luminary::FrameSlotState::Submitted);
  EXPECT_EQ(pass.recorded.size(), 2u);
}

TEST_F(FrameSchedulerTest, ResetOnlyAfterSuccessfulWait) {
  scheduler->drawFrame(pass);
  const auto& calls = Fake::state().calls;
  auto wait = std::ranges::find(calls, std::string("vkWaitForFences"));
  auto reset = std::ranges::find(calls, std::string("vkResetFences"));
  ASSERT_NE(wait, calls.end());
  EXPECT_TRUE(wait < reset);
  EXPECT_EQ(Fake::count("vkWaitForFences"), 1);
  EXPECT_EQ(Fake::count("vkResetFences"), 1);
}

TEST_F(FrameSchedulerTest, OutOfDateOnAcquire) {
  Fake::state().acquireResults = {VK_ERROR_OUT_OF_DATE_KHR};
  EXPECT_TRUE(scheduler->drawFrame(pass));

  EXPECT_EQ(scheduler->getFrameCounter(), 0u);
  EXPECT_TRUE(pass.recorded.empty());
  EXPECT_EQ(Fake::count("vkQueuePresentKHR"), 0);
  EXPECT_EQ(scheduler->getFrameSlot(0).getState(), Luminary::FrameSlotState::Idle);
  // the slot's fence was signaled again by an empty submission
  ASSERT_EQ(Fake::state().submissions.size(), 1u);
  EXPECT_EQ(Fake::state().submissions[0].batches, 0u);
  auto fence = scheduler->getFrameSlot(0).getInFlight().getFence();
  EXPECT_EQ(Fake::state().submissions[0].fence, fence);
  EXPECT_TRUE(Fake::state().fences[fence]);

  swapchain->recreate({1280, 720});
  EXPECT_EQ(scheduler->getCurrentSlot(), 0);
  EXPECT_FALSE(scheduler->drawFrame(pass));
  EXPECT_EQ(scheduler->getFrameCounter(), 1u);
}

TEST_F(FrameSchedulerTest, AcquireTimeoutKeepsSlotUsable) {
  Fake::state().acquireResults = {VK_TIMEOUT};
  EXPECT_THROW(scheduler->drawFrame(pass), Luminary::SwapchainTimeout);
  EXPECT_EQ(scheduler->getFrameSlot(0).getState(), Luminary::FrameSlotState::Idle);

  EXPECT_FALSE(scheduler->drawFrame(pass));
  EXPECT_EQ(scheduler->getFrameCounter(), 1u);
}

TEST_F(FrameSchedulerTest, RecordFailureReleasesSlot) {
  FailingPass failing;
  EXPECT_THROW(scheduler->drawFrame(failing), Luminary::RendererError);
  EXPECT_EQ(scheduler->getFrameSlot(0).getState(), Luminary::FrameSlotState::Idle);
  EXPECT_EQ(Fake::count("vkQueuePresentKHR"), 0);
  // the release batch consumes the acquire signal and signals the fence
  ASSERT_EQ(Fake::state().submissions.size(), 1u);
  const auto& release = Fake::state().submissions[0];
  EXPECT_EQ(release.waitSemaphores, 1u);
  EXPECT_EQ(release.commandBuffers, 0u);
  EXPECT_EQ(release.fence, scheduler->getFrameSlot(0).getInFlight().getFence());
  EXPECT_FALSE(Fake::state().semaphoreSignals[scheduler->getFrameSlot(0).getImageAvailable().getSemaphore()]);
  // the acquired image is only given back by recreation
  EXPECT_TRUE(swapchain->isSuboptimal());

  swapchain->recreate({1280, 720});
  EXPECT_FALSE(scheduler->drawFrame(pass));
  EXPECT_EQ(Fake::state().semaphoreReuses, 0);
  EXPECT_EQ(scheduler->getFrameCounter(), 1u);
}

TEST_F(FrameSchedulerTest, SubmitFailureReleasesSlot) {
  Fake::state().submitResults = {VK_ERROR_OUT_OF_HOST_MEMORY};
  try {
    scheduler->drawFrame(pass);
    FAIL() << "submission failure has to be reported";
  } catch (const Luminary::RendererError& error) {
    EXPECT_EQ(error.getResult(), VK_ERROR_OUT_OF_HOST_MEMORY);
  }
  EXPECT_EQ(scheduler->getFrameSlot(0).getState(), Luminary::FrameSlotState::Idle);
  auto fence = scheduler->getFrameSlot(0).getInFlight().getFence();
  EXPECT_TRUE(Fake::state().fences[fence]);
  ASSERT_EQ(Fake::state().submissions.size(), 1u);
  EXPECT_EQ(Fake::state().submissions[0].waitSemaphores, 1u);
  EXPECT_EQ(Fake::count("vkQueuePresentKHR"), 0);

  swapchain->recreate({1280, 720});
  EXPECT_FALSE(scheduler->drawFrame(pass));
  EXPECT_EQ(Fake::state().semaphoreReuses, 0);
}

TEST_F(FrameSchedulerTest, SuboptimalPresentRequestsRecreation) {
  Fake::state().presentResults = {VK_SUBOPTIMAL_KHR};
  EXPECT_TRUE(scheduler->drawFrame(pass));
  EXPECT_EQ(scheduler->getFrameCounter(), 1u);
  EXPECT_TRUE(swapchain->isSuboptimal());
}

TEST_F(FrameSchedulerTest, SuboptimalAcquireStillPresents) {
  Fake::state().acquireResults = {VK_SUBOPTIMAL_KHR};
  EXPECT_TRUE(scheduler->drawFrame(pass));
  EXPECT_EQ(Fake::count("vkQueuePresentKHR"), 1);
  EXPECT_EQ(pass.recorded.size(), 1u);
}

TEST_F(FrameSchedulerTest, DestructionWaitsForDevice) {
  scheduler->drawFrame(pass);
  auto waits = Fake::state().deviceWaitIdles;
  scheduler.reset();
  EXPECT_EQ(Fake::state().deviceWaitIdles, waits + 1);
}
