module;
#include <volk.h>
#define VMA_IMPLEMENTATION
#define VMA_STATIC_VULKAN_FUNCTIONS 0
#define VMA_DYNAMIC_VULKAN_FUNCTIONS 1
// it's mandatory to include here for VMA_IMPLEMENTATION, otherwise if we compile Allocator after some other module
// it will be cached without VMA_IMPLEMENTATION defined and cause linker errors.
#include <vk_mem_alloc.h>
module Allocator;
import Error;
using namespace Luminary;

MemoryAllocator::MemoryAllocator(const Device& device, const Instance& instance) {
  // the rest is fetched by VMA through these two
  VmaVulkanFunctions vmaVulkanFunctions{.vkGetInstanceProcAddr = vkGetInstanceProcAddr,
                                        .vkGetDeviceProcAddr = vkGetDeviceProcAddr};
  VmaAllocatorCreateInfo createInfo{
      .physicalDevice = device.getPhysicalDevice(),
      .device = device.getLogicalDevice(),
      .pVulkanFunctions = &vmaVulkanFunctions,
      .instance = instance.getInstance(),
      .vulkanApiVersion = VK_API_VERSION_1_3,
  };

  auto result = vmaCreateAllocator(&createInfo, &_allocator);
  if (result != VK_SUCCESS) {
    throw RendererError("Can't create vma allocator", result);
  }
}

ImageAllocation MemoryAllocator::createImage(const VkImageCreateInfo& imageInfo,
                                             VkMemoryPropertyFlags memoryFlags,
                                             VmaMemoryUsage usage) const {
  VmaAllocationCreateInfo allocCreateInfo{.usage = usage, .requiredFlags = memoryFlags};
  ImageAllocation image;
  auto result = vmaCreateImage(_allocator, &imageInfo, &allocCreateInfo, &image.image, &image.allocation, nullptr);
  if (result != VK_SUCCESS) throw RendererError("Can't create an image", result);
  return image;
}

void MemoryAllocator::destroyImage(const ImageAllocation& image) const noexcept {
  vmaDestroyImage(_allocator, image.image, image.allocation);
}

BufferAllocation MemoryAllocator::createBuffer(const VkBufferCreateInfo& bufferInfo,
                                               VmaAllocationCreateFlags flags,
                                               VmaMemoryUsage usage) const {
  VmaAllocationCreateInfo allocCreateInfo{.flags = flags, .usage = usage};
  BufferAllocation buffer;
  auto result =
      vmaCreateBuffer(_allocator, &bufferInfo, &allocCreateInfo, &buffer.buffer, &buffer.allocation, &buffer.info);
  if (result != VK_SUCCESS) throw RendererError("Can't vmaCreateBuffer", result);
  return buffer;
}

void MemoryAllocator::destroyBuffer(const BufferAllocation& buffer) const noexcept {
  vmaDestroyBuffer(_allocator, buffer.buffer, buffer.allocation);
}

VmaAllocator MemoryAllocator::getAllocator() const noexcept { return _allocator; }

MemoryAllocator::~MemoryAllocator() { vmaDestroyAllocator(_allocator); }
