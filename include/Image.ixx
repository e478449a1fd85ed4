module;
#include <volk.h>
#define VMA_STATIC_VULKAN_FUNCTIONS 0
#define VMA_DYNAMIC_VULKAN_FUNCTIONS 1
#include <vk_mem_alloc.h>
#include <cstdint>
#include <vector>
export module Image;
import Allocator;
import Buffer;
import Command;
import Device;

export namespace Luminary {
// full barrier: all commands to all commands, memory read and write on both sides
void transitionImage(const CommandBuffer& commandBuffer,
                     VkImage image,
                     VkImageLayout oldLayout,
                     VkImageLayout newLayout,
                     VkImageAspectFlags aspectMask = VK_IMAGE_ASPECT_COLOR_BIT);

class Image final {
 private:
  const MemoryAllocator* _memoryAllocator;
  ImageAllocation _image;
  VkFormat _format;
  VkExtent3D _extent;
  VkImageLayout _imageLayout = VK_IMAGE_LAYOUT_UNDEFINED;

 public:
  // more than one distinct queue family makes the image concurrently shared between them
  Image(VkImageType type,
        VkFormat format,
        VkExtent3D extent,
        VkImageUsageFlags usage,
        std::vector<uint32_t> queueFamilies,
        const MemoryAllocator& memoryAllocator);
  Image(const Image&) = delete;
  Image& operator=(const Image&) = delete;
  Image(Image&&) = delete;
  Image& operator=(Image&&) = delete;

  void changeLayout(VkImageLayout newLayout, const CommandBuffer& commandBuffer);
  // demands image to be in VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL
  void copyFrom(const Buffer& buffer, const CommandBuffer& commandBuffer);
  VkImage getImage() const noexcept;
  VkFormat getFormat() const noexcept;
  VkExtent3D getExtent() const noexcept;
  VkImageLayout getImageLayout() const noexcept;
  ~Image();
};

class ImageView final {
 private:
  const Device* _device;
  VkImageView _imageView;
  VkImageViewType _type;

 public:
  ImageView(VkImage image, VkFormat format, VkImageViewType type, const Device& device);
  ImageView(const ImageView&) = delete;
  ImageView& operator=(const ImageView&) = delete;
  ImageView(ImageView&&) = delete;
  ImageView& operator=(ImageView&&) = delete;

  VkImageView getImageView() const noexcept;
  VkImageViewType getType() const noexcept;
  ~ImageView();
};
}  // namespace Luminary
