module;
#include <volk.h>
#include <memory>
#include <utility>
#include <vector>
module RenderPass;
import Error;
import Image;
import Settings;
using namespace Luminary;

VkExtent3D Luminary::getWorkgroupCount(VkExtent2D extent) noexcept {
  return {.width = (extent.width + kWorkgroupSize - 1) / kWorkgroupSize,
          .height = (extent.height + kWorkgroupSize - 1) / kWorkgroupSize,
          .depth = 1};
}

ComputePass::ComputePass(const Pipeline& pipeline,
                         const DescriptorSetLayout& descriptorSetLayout,
                         const DescriptorPool& descriptorPool,
                         VkImageView voxels,
                         const Device& device) noexcept
    : _device(&device),
      _pipeline(&pipeline),
      _descriptorSetLayout(&descriptorSetLayout),
      _descriptorPool(&descriptorPool),
      _voxels(voxels) {}

void ComputePass::setCamera(const CameraConstants& camera) noexcept { _camera = camera; }

void ComputePass::reset(const Swapchain& swapchain) {
  _descriptorSets.clear();
  for (uint32_t i = 0; i < swapchain.getImageCount(); i++) {
    auto descriptorSet = std::make_unique<DescriptorSet>(*_descriptorSetLayout, *_descriptorPool, *_device);
    descriptorSet->updateCustom(
        {}, {{0, {{.imageView = swapchain.getImageView(i).getImageView(), .imageLayout = VK_IMAGE_LAYOUT_GENERAL}}},
             {1, {{.imageView = _voxels, .imageLayout = VK_IMAGE_LAYOUT_GENERAL}}}});
    _descriptorSets.push_back(std::move(descriptorSet));
  }
  _extent = swapchain.getExtent();
}

void ComputePass::record(const CommandBuffer& commandBuffer, const SwapchainImage& image) {
  if (image.index >= _descriptorSets.size())
    throw RendererError("compute pass wasn't reset for the current swapchain");

  auto buffer = commandBuffer.getCommandBuffer();
  // previous content is overwritten, so UNDEFINED is fine
  transitionImage(commandBuffer, image.image, VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_GENERAL);

  vkCmdBindPipeline(buffer, VK_PIPELINE_BIND_POINT_COMPUTE, _pipeline->getPipeline());
  auto descriptorSet = _descriptorSets[image.index]->getDescriptorSet();
  vkCmdBindDescriptorSets(buffer, VK_PIPELINE_BIND_POINT_COMPUTE, _pipeline->getPipelineLayout(), 0, 1,
                          &descriptorSet, 0, nullptr);
  vkCmdPushConstants(buffer, _pipeline->getPipelineLayout(), VK_SHADER_STAGE_COMPUTE_BIT, 0, sizeof(CameraConstants),
                     &_camera);
  auto workgroups = getWorkgroupCount(_extent);
  vkCmdDispatch(buffer, workgroups.width, workgroups.height, workgroups.depth);

  transitionImage(commandBuffer, image.image, VK_IMAGE_LAYOUT_GENERAL, VK_IMAGE_LAYOUT_PRESENT_SRC_KHR);
}
