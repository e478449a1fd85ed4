module;
#include <volk.h>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>
module Renderer;
import Error;
import PhysicalDevice;
using namespace Luminary;

Renderer::Renderer(Window& window, const Settings& settings, const Logger& logger)
    : _window(&window),
      _logger(&logger) {
  _instance = std::make_unique<Instance>(settings.applicationName, settings.validation,
                                         window.getRequiredExtensions(), logger);
  _surface = std::make_unique<Surface>(window, *_instance);
  _device = std::make_unique<Device>(selectDevice(_instance->getInstance(), _surface->getSurface(), logger), logger);
  _memoryAllocator = std::make_unique<MemoryAllocator>(*_device, *_instance);
  _swapchain = std::make_unique<Swapchain>(_getFramebufferExtent(), _surface->getSurface(), *_device, logger);
  _frameScheduler = std::make_unique<FrameScheduler>(*_swapchain, settings, *_device, logger);

  _immediate = std::make_unique<ImmediateSubmit>(QueueType::Transfer, settings.fenceTimeout, *_device);
  _voxels = std::make_unique<VoxelVolume>(generateVoxelScene(), *_immediate, *_memoryAllocator, *_device, logger);
  _descriptorPool = std::make_unique<DescriptorPool>(DescriptorPoolSize{}, *_device);

  _shader = std::make_unique<Shader>(*_device);
  _shader->add(loadShaderCode(settings.shaderPath));
  auto pushConstantSize = _shader->getPushConstantSize(VK_SHADER_STAGE_COMPUTE_BIT);
  if (pushConstantSize != sizeof(CameraConstants))
    throw RendererError("shader " + settings.shaderPath.string() + " declares " + std::to_string(pushConstantSize) +
                            " bytes of push constants, expected " + std::to_string(sizeof(CameraConstants)),
                        VK_ERROR_INITIALIZATION_FAILED);

  _descriptorSetLayout = std::make_unique<DescriptorSetLayout>(*_device);
  _descriptorSetLayout->createCustom(_shader->getDescriptorSetLayoutBindings());
  _pipeline = std::make_unique<Pipeline>(*_device);
  _pipeline->createCompute(_shader->getShaderStageInfo(VK_SHADER_STAGE_COMPUTE_BIT),
                           {{"raymarch", _descriptorSetLayout.get()}},
                           {{"camera", {.stageFlags = VK_SHADER_STAGE_COMPUTE_BIT,
                                        .offset = 0,
                                        .size = static_cast<uint32_t>(sizeof(CameraConstants))}}});

  _computePass = std::make_unique<ComputePass>(*_pipeline, *_descriptorSetLayout, *_descriptorPool,
                                               _voxels->getImageView().getImageView(), *_device);
  _computePass->reset(*_swapchain);
  _logger->info("renderer", "renderer is ready");
}

VkExtent2D Renderer::_getFramebufferExtent() const noexcept {
  auto resolution = _window->getResolution();
  return {.width = static_cast<uint32_t>(resolution.x), .height = static_cast<uint32_t>(resolution.y)};
}

void Renderer::setCamera(const CameraConstants& camera) noexcept { _computePass->setCamera(camera); }

void Renderer::drawFrame() {
  if (_window->consumeResized() || _swapchain->isSuboptimal()) recreateSwapchain();
  if (_window->shouldClose()) return;

  if (_frameScheduler->drawFrame(*_computePass)) recreateSwapchain();
}

void Renderer::recreateSwapchain() {
  auto extent = _getFramebufferExtent();
  // a minimized window has a zero sized framebuffer, which can't back a swapchain
  while ((extent.width == 0 || extent.height == 0) && !_window->shouldClose()) {
    _window->waitEvents();
    extent = _getFramebufferExtent();
  }
  if (_window->shouldClose()) return;

  _swapchain->recreate(extent);
  _computePass->reset(*_swapchain);
  _window->consumeResized();
}

const Device& Renderer::getDevice() const noexcept { return *_device; }

const Swapchain& Renderer::getSwapchain() const noexcept { return *_swapchain; }

const FrameScheduler& Renderer::getFrameScheduler() const noexcept { return *_frameScheduler; }

Renderer::~Renderer() {
  auto result = vkDeviceWaitIdle(_device->getLogicalDevice());
  if (result != VK_SUCCESS) _logger->error("renderer", "failed to wait for device idle: {}", toString(result));
}
