module;
#include <volk.h>
#include <memory>
#include <vector>
export module RenderPass;
import Command;
import DescriptorPool;
import DescriptorSet;
import Device;
import Flycam;
import Pipeline;
import Swapchain;

export namespace Luminary {
// ceil(extent / kWorkgroupSize) in x and y, 1 in z
VkExtent3D getWorkgroupCount(VkExtent2D extent) noexcept;

// records the commands rendering into one swapchain image
class RenderPass {
 public:
  // commandBuffer is already in recording state
  virtual void record(const CommandBuffer& commandBuffer, const SwapchainImage& image) = 0;
  // called once at startup and after every swapchain recreation, device is idle
  virtual void reset(const Swapchain& swapchain) = 0;
  virtual ~RenderPass() = default;
};

// binding 0: swapchain image, binding 1: voxel volume, both storage images in GENERAL layout
class ComputePass final : public RenderPass {
 private:
  const Device* _device;
  const Pipeline* _pipeline;
  const DescriptorSetLayout* _descriptorSetLayout;
  const DescriptorPool* _descriptorPool;
  VkImageView _voxels;
  // one per swapchain image
  std::vector<std::unique_ptr<DescriptorSet>> _descriptorSets;
  VkExtent2D _extent{};
  CameraConstants _camera{};

 public:
  ComputePass(const Pipeline& pipeline,
              const DescriptorSetLayout& descriptorSetLayout,
              const DescriptorPool& descriptorPool,
              VkImageView voxels,
              const Device& device) noexcept;
  ComputePass(const ComputePass&) = delete;
  ComputePass& operator=(const ComputePass&) = delete;
  ComputePass(ComputePass&&) = delete;
  ComputePass& operator=(ComputePass&&) = delete;

  void setCamera(const CameraConstants& camera) noexcept;
  void record(const CommandBuffer& commandBuffer, const SwapchainImage& image) override;
  void reset(const Swapchain& swapchain) override;
};
}  // namespace Luminary
