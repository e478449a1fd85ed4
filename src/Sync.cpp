module;
#include <volk.h>
#include <cstdint>
module Sync;
import Error;
using namespace Luminary;

Semaphore::Semaphore(const Device& device) : _device(&device) {
  VkSemaphoreCreateInfo semaphoreInfo{.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO};
  auto result = vkCreateSemaphore(device.getLogicalDevice(), &semaphoreInfo, nullptr, &_semaphore);
  if (result != VK_SUCCESS) throw RendererError("failed to create semaphore!", result);
}

VkSemaphore Semaphore::getSemaphore() const noexcept { return _semaphore; }

Semaphore::~Semaphore() { vkDestroySemaphore(_device->getLogicalDevice(), _semaphore, nullptr); }

Fence::Fence(bool signaled, const Device& device) : _device(&device) {
  VkFenceCreateInfo fenceInfo{.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO,
                              .flags = signaled ? VK_FENCE_CREATE_SIGNALED_BIT : VkFenceCreateFlags{0}};
  auto result = vkCreateFence(device.getLogicalDevice(), &fenceInfo, nullptr, &_fence);
  if (result != VK_SUCCESS) throw RendererError("failed to create fence!", result);
}

VkResult Fence::wait(uint64_t timeout) const {
  auto result = vkWaitForFences(_device->getLogicalDevice(), 1, &_fence, VK_TRUE, timeout);
  if (result != VK_SUCCESS && result != VK_TIMEOUT) throw RendererError("failed to wait for fence!", result);
  return result;
}

void Fence::reset() const {
  auto result = vkResetFences(_device->getLogicalDevice(), 1, &_fence);
  if (result != VK_SUCCESS) throw RendererError("failed to reset fence!", result);
}

VkFence Fence::getFence() const noexcept { return _fence; }

Fence::~Fence() { vkDestroyFence(_device->getLogicalDevice(), _fence, nullptr); }
