module;
#include <volk.h>
#define VMA_STATIC_VULKAN_FUNCTIONS 0
#define VMA_DYNAMIC_VULKAN_FUNCTIONS 1
#include <vk_mem_alloc.h>
#include <cstddef>
#include <span>
#include <string>
module Buffer;
import Error;
using namespace Luminary;

Buffer::Buffer(VkDeviceSize size,
               VkBufferUsageFlags usage,
               VmaAllocationCreateFlags flags,
               const MemoryAllocator& memoryAllocator)
    : _memoryAllocator(&memoryAllocator),
      _size(size) {
  VkBufferCreateInfo bufferInfo{.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO,
                                .size = size,
                                .usage = usage,
                                .sharingMode = VK_SHARING_MODE_EXCLUSIVE};
  _buffer = memoryAllocator.createBuffer(bufferInfo, flags, VMA_MEMORY_USAGE_AUTO);
}

void Buffer::setData(std::span<const std::byte> data) {
  if (data.size() > _size)
    throw RendererError("data of " + std::to_string(data.size()) + " bytes doesn't fit buffer of " +
                        std::to_string(_size) + " bytes");
  // Calling vmaCopyMemoryToAllocation() does vmaMapMemory(), memcpy(), vmaUnmapMemory(), and vmaFlushAllocation().
  auto result =
      vmaCopyMemoryToAllocation(_memoryAllocator->getAllocator(), data.data(), _buffer.allocation, 0, data.size());
  if (result != VK_SUCCESS) throw RendererError("Can't vmaCopyMemoryToAllocation", result);
}

VkDeviceSize Buffer::getSize() const noexcept { return _size; }

VmaAllocation Buffer::getAllocation() const noexcept { return _buffer.allocation; }

VkBuffer Buffer::getBuffer() const noexcept { return _buffer.buffer; }

Buffer::~Buffer() { _memoryAllocator->destroyBuffer(_buffer); }
