module;
#include <volk.h>
#define VMA_STATIC_VULKAN_FUNCTIONS 0
#define VMA_DYNAMIC_VULKAN_FUNCTIONS 1
#include <vk_mem_alloc.h>
export module Allocator;
import Device;
import Instance;

export namespace Luminary {
struct ImageAllocation {
  VkImage image = VK_NULL_HANDLE;
  VmaAllocation allocation = nullptr;
};

struct BufferAllocation {
  VkBuffer buffer = VK_NULL_HANDLE;
  VmaAllocation allocation = nullptr;
  VmaAllocationInfo info{};
};

class MemoryAllocator final {
 private:
  VmaAllocator _allocator;

 public:
  MemoryAllocator(const Device& device, const Instance& instance);
  MemoryAllocator(const MemoryAllocator&) = delete;
  MemoryAllocator& operator=(const MemoryAllocator&) = delete;
  MemoryAllocator(MemoryAllocator&&) = delete;
  MemoryAllocator& operator=(MemoryAllocator&&) = delete;

  ImageAllocation createImage(const VkImageCreateInfo& imageInfo,
                              VkMemoryPropertyFlags memoryFlags,
                              VmaMemoryUsage usage) const;
  void destroyImage(const ImageAllocation& image) const noexcept;
  BufferAllocation createBuffer(const VkBufferCreateInfo& bufferInfo,
                                VmaAllocationCreateFlags flags,
                                VmaMemoryUsage usage) const;
  void destroyBuffer(const BufferAllocation& buffer) const noexcept;
  VmaAllocator getAllocator() const noexcept;
  ~MemoryAllocator();
};
}  // namespace Luminary
