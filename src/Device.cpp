module;
#include <volk.h>
#include <algorithm>
#include <cstdint>
#include <vector>
module Device;
import Error;
using namespace Luminary;

std::vector<VkDeviceQueueCreateInfo> Luminary::getQueueCreateInfos(const QueueFamilyAssignment& queueFamilies,
                                                                   const float* priority) {
  std::vector<uint32_t> indices{queueFamilies.graphics, queueFamilies.present, queueFamilies.transfer,
                                queueFamilies.compute};
  std::ranges::sort(indices);
  auto duplicates = std::ranges::unique(indices);
  indices.erase(duplicates.begin(), duplicates.end());

  std::vector<VkDeviceQueueCreateInfo> createInfos;
  createInfos.reserve(indices.size());
  for (auto index : indices) {
    createInfos.push_back({.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO,
                           .queueFamilyIndex = index,
                           .queueCount = 1,
                           .pQueuePriorities = priority});
  }
  return createInfos;
}

Device::Device(const PhysicalDeviceCandidate& candidate, const Logger& logger) : _candidate(candidate) {
  const float priority = 1.f;
  auto queueCreateInfos = getQueueCreateInfos(candidate.queueFamilies, &priority);

  VkPhysicalDeviceVulkan13Features features13{.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES,
                                              .synchronization2 = VK_TRUE};
  // compute shader writes the BGRA swapchain image through an unformatted storage image, selection
  // rejects devices without it
  VkPhysicalDeviceFeatures2 features{.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2,
                                     .pNext = &features13,
                                     .features = {.shaderStorageImageWriteWithoutFormat = VK_TRUE}};

  const auto& extensions = getRequiredDeviceExtensions();
  VkDeviceCreateInfo createInfo{.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO,
                                .pNext = &features,
                                .queueCreateInfoCount = static_cast<uint32_t>(queueCreateInfos.size()),
                                .pQueueCreateInfos = queueCreateInfos.data(),
                                .enabledExtensionCount = static_cast<uint32_t>(extensions.size()),
                                .ppEnabledExtensionNames = extensions.data()};

  auto result = vkCreateDevice(candidate.device, &createInfo, nullptr, &_device);
  if (result != VK_SUCCESS) {
    throw DeviceCreationFailed("failed to create logical device!", result);
  }
  volkLoadDevice(_device);

  for (auto type : {QueueType::Graphics, QueueType::Present, QueueType::Transfer, QueueType::Compute}) {
    vkGetDeviceQueue(_device, candidate.queueFamilies.get(type), 0, &_queues[static_cast<int>(type)]);
  }
  logger.debug("device", "logical device created with {} queue families", queueCreateInfos.size());
}

void Device::waitIdle() const {
  auto result = vkDeviceWaitIdle(_device);
  if (result != VK_SUCCESS) throw RendererError("failed to wait for device idle!", result);
}

VkDevice Device::getLogicalDevice() const noexcept { return _device; }

VkPhysicalDevice Device::getPhysicalDevice() const noexcept { return _candidate.device; }

VkQueue Device::getQueue(QueueType type) const noexcept { return _queues[static_cast<int>(type)]; }

uint32_t Device::getQueueIndex(QueueType type) const noexcept { return _candidate.queueFamilies.get(type); }

const PhysicalDeviceCandidate& Device::getCandidate() const noexcept { return _candidate; }

Device::~Device() { vkDestroyDevice(_device, nullptr); }
