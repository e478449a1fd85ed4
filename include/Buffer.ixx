module;
#include <volk.h>
#define VMA_STATIC_VULKAN_FUNCTIONS 0
#define VMA_DYNAMIC_VULKAN_FUNCTIONS 1
#include <vk_mem_alloc.h>
#include <cstddef>
#include <span>
export module Buffer;
import Allocator;

export namespace Luminary {
class Buffer final {
 private:
  const MemoryAllocator* _memoryAllocator;
  BufferAllocation _buffer;
  VkDeviceSize _size;

 public:
  Buffer(VkDeviceSize size,
         VkBufferUsageFlags usage,
         VmaAllocationCreateFlags flags,
         const MemoryAllocator& memoryAllocator);
  Buffer(const Buffer&) = delete;
  Buffer& operator=(const Buffer&) = delete;
  Buffer(Buffer&&) = delete;
  Buffer& operator=(Buffer&&) = delete;

  // buffer has to be host visible, queue submission makes the write visible to the device
  void setData(std::span<const std::byte> data);
  VkBuffer getBuffer() const noexcept;
  VkDeviceSize getSize() const noexcept;
  VmaAllocation getAllocation() const noexcept;
  ~Buffer();
};
}  // namespace Luminary
