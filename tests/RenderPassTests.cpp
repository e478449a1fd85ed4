#include <gtest/gtest.h>
#include "FakeVulkan.h"
#include <memory>
#include <vector>
import Command;
import CommandPool;
import DescriptorPool;
import DescriptorSet;
import Device;
import Error;
import Flycam;
import Logger;
import PhysicalDevice;
import Pipeline;
import RenderPass;
import Swapchain;
import Sync;

namespace {
class ComputePassTest : public ::testing::Test {
 protected:
  Luminary::ConsoleLogger logger{Luminary::LogLevel::Error};
  std::unique_ptr<Luminary::Device> device;
  std::unique_ptr<Luminary::Swapchain> swapchain;
  std::unique_ptr<Luminary::DescriptorSetLayout> layout;
  std::unique_ptr<Luminary::DescriptorPool> pool;
  std::unique_ptr<Luminary::Pipeline> pipeline;
  std::unique_ptr<Luminary::CommandPool> commandPool;
  std::unique_ptr<Luminary::CommandBuffer> commandBuffer;
  VkImageView voxels = VK_NULL_HANDLE;

  void SetUp() override {
    Fake::install();
    voxels = Fake::makeHandle<VkImageView>();
    device = std::make_unique<Luminary::Device>(Luminary::selectDevice(Fake::instance(), Fake::surface(), logger),
                                                logger);
    swapchain = std::make_unique<Luminary::Swapchain>(VkExtent2D{1280, 720}, Fake::surface(), *device, logger);

    layout = std::make_unique<Luminary::DescriptorSetLayout>(*device);
    layout->createCustom({{.binding = 0,
                           .descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_IMAGE,
                           .descriptorCount = 1,
                           .stageFlags = VK_SHADER_STAGE_COMPUTE_BIT},
                          {.binding = 1,
                           .descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_IMAGE,
                           .descriptorCount = 1,
                           .stageFlags = VK_SHADER_STAGE_COMPUTE_BIT}});
    pool = std::make_unique<Luminary::DescriptorPool>(Luminary::DescriptorPoolSize{}, *device);

    pipeline = std::make_unique<Luminary::Pipeline>(*device);
    VkPipelineShaderStageCreateInfo stage{.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO,
                                          .stage = VK_SHADER_STAGE_COMPUTE_BIT,
                                          .module = Fake::makeHandle<VkShaderModule>(),
                                          .pName = "main"};
    pipeline->createCompute(stage, {{"raymarch", layout.get()}},
                            {{"camera", {.stageFlags = VK_SHADER_STAGE_COMPUTE_BIT,
                                         .offset = 0,
                                         .size = sizeof(Luminary::CameraConstants)}}});

    commandPool = std::make_unique<Luminary::CommandPool>(Luminary::QueueType::Graphics, *device);
    commandBuffer = std::make_unique<Luminary::CommandBuffer>(*commandPool, *device);
  }

  std::unique_ptr<Luminary::ComputePass> createPass() {
    return std::make_unique<Luminary::ComputePass>(*pipeline, *layout, *pool, voxels, *device);
  }
};
}  // namespace

TEST(WorkgroupTest, Count) {
  auto count = Luminary::getWorkgroupCount({1280, 720});
  EXPECT_EQ(count.width, 80u);
  EXPECT_EQ(count.height, 45u);
  EXPECT_EQ(count.depth, 1u);

  count = Luminary::getWorkgroupCount({1281, 721});
  EXPECT_EQ(count.width, 81u);
  EXPECT_EQ(count.height, 46u);

  count = Luminary::getWorkgroupCount({1, 1});
  EXPECT_EQ(count.width, 1u);
  EXPECT_EQ(count.height, 1u);

  count = Luminary::getWorkgroupCount({16, 32});
  EXPECT_EQ(count.width, 1u);
  EXPECT_EQ(count.height, 2u);
}

TEST_F(ComputePassTest, ResetWritesOneSetPerImage) {
  auto pass = createPass();
  pass->reset(*swapchain);

  EXPECT_EQ(Fake::state().allocatedDescriptorSets, 3);
  const auto& writes = Fake::state().descriptorWrites;
  ASSERT_EQ(writes.size(), 6u);
  for (uint32_t i = 0; i < 3; i++) {
    const auto& target = writes[2 * i];
    const auto& volume = writes[2 * i + 1];
    EXPECT_EQ(target.binding, 0u);
    EXPECT_EQ(target.type, VK_DESCRIPTOR_TYPE_STORAGE_IMAGE);
    EXPECT_EQ(target.imageView, swapchain->getImageView(i).getImageView());
    EXPECT_EQ(target.imageLayout, VK_IMAGE_LAYOUT_GENERAL);
    EXPECT_EQ(volume.binding, 1u);
    EXPECT_EQ(volume.imageView, voxels);
    EXPECT_EQ(volume.set, target.set);
  }
}

TEST_F(ComputePassTest, ResetAfterRecreationReplacesSets) {
  auto pass = createPass();
  pass->reset(*swapchain);
  Fake::state().swapchainImageCount = 2;
  swapchain->recreate({640, 480});
  pass->reset(*swapchain);

  EXPECT_EQ(Fake::state().freedDescriptorSets, 3);
  EXPECT_EQ(Fake::state().allocatedDescriptorSets, 5);
}

TEST_F(ComputePassTest, Record) {
  auto pass = createPass();
  pass->reset(*swapchain);
  Luminary::Flycam flycam(0.001f);
  pass->setCamera(flycam.getConstants());

  Luminary::Semaphore semaphore(*device);
  Fake::state().acquireIndices = {1};
  auto image = swapchain->acquireImage(semaphore, UINT64_MAX);
  commandBuffer->beginCommands();
  pass->record(*commandBuffer, image);
  commandBuffer->endCommands();

  const auto& fake = Fake::state();
  ASSERT_EQ(fake.barriers.size(), 2u);
  EXPECT_EQ(fake.barriers[0].image, image.image);
  EXPECT_EQ(fake.barriers[0].oldLayout, VK_IMAGE_LAYOUT_UNDEFINED);
  EXPECT_EQ(fake.barriers[0].newLayout, VK_IMAGE_LAYOUT_GENERAL);
  EXPECT_EQ(fake.barriers[1].oldLayout, VK_IMAGE_LAYOUT_GENERAL);
  EXPECT_EQ(fake.barriers[1].newLayout, VK_IMAGE_LAYOUT_PRESENT_SRC_KHR);

  EXPECT_EQ(fake.boundPipelines, std::vector<VkPipeline>{pipeline->getPipeline()});
  ASSERT_EQ(fake.boundDescriptorSets.size(), 1u);
  // second image's set, writes are ordered by image and then by binding
  EXPECT_EQ(fake.boundDescriptorSets[0], fake.descriptorWrites[2].set);
  EXPECT_EQ(fake.pushConstantSizes, std::vector<uint32_t>{64});
  ASSERT_EQ(fake.dispatches.size(), 1u);
  EXPECT_EQ(fake.dispatches[0][0], 80u);
  EXPECT_EQ(fake.dispatches[0][1], 45u);
  EXPECT_EQ(fake.dispatches[0][2], 1u);
}

TEST_F(ComputePassTest, RecordWithoutResetFails) {
  auto pass = createPass();
  Luminary::Semaphore semaphore(*device);
  auto image = swapchain->acquireImage(semaphore, UINT64_MAX);
  commandBuffer->beginCommands();
  EXPECT_THROW(pass->record(*commandBuffer, image), Luminary::RendererError);
  EXPECT_TRUE(Fake::state().dispatches.empty());
}
