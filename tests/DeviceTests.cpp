#include <gtest/gtest.h>
#include "FakeVulkan.h"
#include <algorithm>
#include <string>
import Device;
import Error;
import Logger;
import PhysicalDevice;

namespace {
class DeviceTest : public ::testing::Test {
 protected:
  Luminary::ConsoleLogger logger{Luminary::LogLevel::Error};

  void SetUp() override { Fake::install(); }
};
}  // namespace

TEST(QueueCreateInfoTest, SingleFamily) {
  float priority = 1.f;
  auto createInfos = Luminary::getQueueCreateInfos({.graphics = 0, .present = 0, .transfer = 0, .compute = 0},
                                                   &priority);
  ASSERT_EQ(createInfos.size(), 1u);
  EXPECT_EQ(createInfos[0].queueFamilyIndex, 0u);
  EXPECT_EQ(createInfos[0].queueCount, 1u);
  EXPECT_EQ(createInfos[0].pQueuePriorities, &priority);
}

TEST(QueueCreateInfoTest, DistinctFamiliesSorted) {
  float priority = 1.f;
  auto createInfos = Luminary::getQueueCreateInfos({.graphics = 2, .present = 0, .transfer = 1, .compute = 2},
                                                   &priority);
  ASSERT_EQ(createInfos.size(), 3u);
  for (uint32_t i = 0; i < createInfos.size(); i++) {
    EXPECT_EQ(createInfos[i].queueFamilyIndex, i);
    EXPECT_EQ(createInfos[i].queueCount, 1u);
  }
}

TEST_F(DeviceTest, AllCapableFamily) {
  auto candidate = Luminary::selectDevice(Fake::instance(), Fake::surface(), logger);
  Luminary::Device device(candidate, logger);

  ASSERT_EQ(Fake::state().deviceCreations.size(), 1u);
  const auto& creation = Fake::state().deviceCreations[0];
  EXPECT_EQ(creation.queueFamilies, std::vector<uint32_t>{0});
  EXPECT_TRUE(creation.synchronization2);
  EXPECT_TRUE(creation.storageImageWriteWithoutFormat);
  EXPECT_EQ(std::ranges::count(creation.extensions, std::string(VK_KHR_SWAPCHAIN_EXTENSION_NAME)), 1);

  EXPECT_NE(device.getLogicalDevice(), nullptr);
  EXPECT_EQ(device.getPhysicalDevice(), Fake::physicalDevice(0));
  EXPECT_EQ(Fake::state().queueRequests.size(), 4u);
  EXPECT_EQ(device.getQueue(Luminary::QueueType::Graphics), device.getQueue(Luminary::QueueType::Transfer));
}

TEST_F(DeviceTest, SeparateFamilies) {
  Fake::PhysicalDevice physicalDevice;
  physicalDevice.queueFamilies = {VK_QUEUE_GRAPHICS_BIT | VK_QUEUE_COMPUTE_BIT | VK_QUEUE_TRANSFER_BIT,
                                  VK_QUEUE_TRANSFER_BIT, VK_QUEUE_COMPUTE_BIT | VK_QUEUE_TRANSFER_BIT};
  physicalDevice.presentSupport = {true, false, false};
  Fake::state().physicalDevices = {physicalDevice};

  auto candidate = Luminary::selectDevice(Fake::instance(), Fake::surface(), logger);
  Luminary::Device device(candidate, logger);

  const auto& creation = Fake::state().deviceCreations[0];
  EXPECT_EQ(creation.queueFamilies, (std::vector<uint32_t>{0, 1, 2}));
  EXPECT_EQ(creation.queueCounts, (std::vector<uint32_t>{1, 1, 1}));
  EXPECT_EQ(device.getQueueIndex(Luminary::QueueType::Graphics), 0u);
  EXPECT_EQ(device.getQueueIndex(Luminary::QueueType::Present), 0u);
  EXPECT_EQ(device.getQueueIndex(Luminary::QueueType::Transfer), 1u);
  EXPECT_EQ(device.getQueueIndex(Luminary::QueueType::Compute), 2u);
  EXPECT_NE(device.getQueue(Luminary::QueueType::Graphics), device.getQueue(Luminary::QueueType::Transfer));
  EXPECT_EQ(device.getQueue(Luminary::QueueType::Graphics), device.getQueue(Luminary::QueueType::Present));
}

TEST_F(DeviceTest, CreationFailure) {
  auto candidate = Luminary::selectDevice(Fake::instance(), Fake::surface(), logger);
  Fake::state().createDeviceResult = VK_ERROR_INITIALIZATION_FAILED;

  try {
    Luminary::Device device(candidate, logger);
    FAIL() << "device creation should fail";
  } catch (const Luminary::DeviceCreationFailed& error) {
    EXPECT_EQ(error.getResult(), VK_ERROR_INITIALIZATION_FAILED);
  }
}

TEST_F(DeviceTest, WaitIdle) {
  auto candidate = Luminary::selectDevice(Fake::instance(), Fake::surface(), logger);
  Luminary::Device device(candidate, logger);
  device.waitIdle();
  EXPECT_EQ(Fake::state().deviceWaitIdles, 1);
}
