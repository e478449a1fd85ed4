module;
#include <volk.h>
#include <memory>
export module Renderer;
import Allocator;
import DescriptorPool;
import DescriptorSet;
import Device;
import Flycam;
import FrameScheduler;
import Immediate;
import Instance;
import Logger;
import Pipeline;
import RenderPass;
import Settings;
import Shader;
import Surface;
import Swapchain;
import Voxels;
import Window;

export namespace Luminary {
// owns the whole Vulkan object graph, members are declared in creation order
class Renderer final {
 private:
  Window* _window;
  const Logger* _logger;
  std::unique_ptr<Instance> _instance;
  std::unique_ptr<Surface> _surface;
  std::unique_ptr<Device> _device;
  std::unique_ptr<MemoryAllocator> _memoryAllocator;
  std::unique_ptr<Swapchain> _swapchain;
  std::unique_ptr<FrameScheduler> _frameScheduler;
  std::unique_ptr<ImmediateSubmit> _immediate;
  std::unique_ptr<VoxelVolume> _voxels;
  std::unique_ptr<DescriptorPool> _descriptorPool;
  std::unique_ptr<Shader> _shader;
  std::unique_ptr<DescriptorSetLayout> _descriptorSetLayout;
  std::unique_ptr<Pipeline> _pipeline;
  std::unique_ptr<ComputePass> _computePass;

  VkExtent2D _getFramebufferExtent() const noexcept;

 public:
  // window has to be initialized
  Renderer(Window& window, const Settings& settings, const Logger& logger);
  Renderer(const Renderer&) = delete;
  Renderer& operator=(const Renderer&) = delete;
  Renderer(Renderer&&) = delete;
  Renderer& operator=(Renderer&&) = delete;

  void setCamera(const CameraConstants& camera) noexcept;
  // recreates the swapchain first if the window was resized or the previous frame asked for it
  void drawFrame();
  // blocks while the window is minimized
  void recreateSwapchain();
  const Device& getDevice() const noexcept;
  const Swapchain& getSwapchain() const noexcept;
  const FrameScheduler& getFrameScheduler() const noexcept;
  ~Renderer();
};
}  // namespace Luminary
