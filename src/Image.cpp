module;
#include <volk.h>
#define VMA_STATIC_VULKAN_FUNCTIONS 0
#define VMA_DYNAMIC_VULKAN_FUNCTIONS 1
#include <vk_mem_alloc.h>
#include <algorithm>
#include <cstdint>
#include <vector>
module Image;
import Error;
using namespace Luminary;

void Luminary::transitionImage(const CommandBuffer& commandBuffer,
                               VkImage image,
                               VkImageLayout oldLayout,
                               VkImageLayout newLayout,
                               VkImageAspectFlags aspectMask) {
  VkImageMemoryBarrier2 barrier{.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER_2,
                                .srcStageMask = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT,
                                .srcAccessMask = VK_ACCESS_2_MEMORY_READ_BIT | VK_ACCESS_2_MEMORY_WRITE_BIT,
                                .dstStageMask = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT,
                                .dstAccessMask = VK_ACCESS_2_MEMORY_READ_BIT | VK_ACCESS_2_MEMORY_WRITE_BIT,
                                .oldLayout = oldLayout,
                                .newLayout = newLayout,
                                .srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED,
                                .dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED,
                                .image = image,
                                .subresourceRange = {.aspectMask = aspectMask,
                                                     .baseMipLevel = 0,
                                                     .levelCount = VK_REMAINING_MIP_LEVELS,
                                                     .baseArrayLayer = 0,
                                                     .layerCount = VK_REMAINING_ARRAY_LAYERS}};
  VkDependencyInfo dependencyInfo{.sType = VK_STRUCTURE_TYPE_DEPENDENCY_INFO,
                                  .imageMemoryBarrierCount = 1,
                                  .pImageMemoryBarriers = &barrier};
  vkCmdPipelineBarrier2(commandBuffer.getCommandBuffer(), &dependencyInfo);
}

Image::Image(VkImageType type,
             VkFormat format,
             VkExtent3D extent,
             VkImageUsageFlags usage,
             std::vector<uint32_t> queueFamilies,
             const MemoryAllocator& memoryAllocator)
    : _memoryAllocator(&memoryAllocator),
      _format(format),
      _extent(extent) {
  std::ranges::sort(queueFamilies);
  auto duplicates = std::ranges::unique(queueFamilies);
  queueFamilies.erase(duplicates.begin(), duplicates.end());
  bool concurrent = queueFamilies.size() > 1;

  VkImageCreateInfo imageInfo{
      .sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO,
      .imageType = type,
      .format = format,
      .extent = extent,
      .mipLevels = 1,
      .arrayLayers = 1,
      .samples = VK_SAMPLE_COUNT_1_BIT,
      .tiling = VK_IMAGE_TILING_OPTIMAL,
      .usage = usage,
      .sharingMode = concurrent ? VK_SHARING_MODE_CONCURRENT : VK_SHARING_MODE_EXCLUSIVE,
      .queueFamilyIndexCount = concurrent ? static_cast<uint32_t>(queueFamilies.size()) : 0u,
      .pQueueFamilyIndices = concurrent ? queueFamilies.data() : nullptr,
      .initialLayout = _imageLayout,
  };

  _image = memoryAllocator.createImage(imageInfo, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT, VMA_MEMORY_USAGE_AUTO);
}

void Image::changeLayout(VkImageLayout newLayout, const CommandBuffer& commandBuffer) {
  transitionImage(commandBuffer, _image.image, _imageLayout, newLayout);
  _imageLayout = newLayout;
}

void Image::copyFrom(const Buffer& buffer, const CommandBuffer& commandBuffer) {
  if (_imageLayout != VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL)
    throw RendererError("image has to be in VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL before copy");

  VkBufferImageCopy region{
      .bufferOffset = 0,
      .bufferRowLength = 0,
      .bufferImageHeight = 0,
      .imageSubresource = {.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT, .mipLevel = 0, .baseArrayLayer = 0, .layerCount = 1},
      .imageOffset = {0, 0, 0},
      .imageExtent = _extent};
  vkCmdCopyBufferToImage(commandBuffer.getCommandBuffer(), buffer.getBuffer(), _image.image,
                         VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &region);
}

VkImage Image::getImage() const noexcept { return _image.image; }

VkFormat Image::getFormat() const noexcept { return _format; }

VkExtent3D Image::getExtent() const noexcept { return _extent; }

VkImageLayout Image::getImageLayout() const noexcept { return _imageLayout; }

Image::~Image() { _memoryAllocator->destroyImage(_image); }

ImageView::ImageView(VkImage image, VkFormat format, VkImageViewType type, const Device& device)
    : _device(&device),
      _type(type) {
  VkImageViewCreateInfo viewInfo{.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO,
                                 .image = image,
                                 .viewType = type,
                                 .format = format,
                                 .components = VkComponentMapping{.r = VK_COMPONENT_SWIZZLE_IDENTITY,
                                                                  .g = VK_COMPONENT_SWIZZLE_IDENTITY,
                                                                  .b = VK_COMPONENT_SWIZZLE_IDENTITY,
                                                                  .a = VK_COMPONENT_SWIZZLE_IDENTITY},
                                 .subresourceRange = {
                                     .aspectMask = VK_IMAGE_ASPECT_COLOR_BIT,
                                     .baseMipLevel = 0,
                                     .levelCount = 1,
                                     .baseArrayLayer = 0,
                                     .layerCount = 1,
                                 }};

  auto result = vkCreateImageView(device.getLogicalDevice(), &viewInfo, nullptr, &_imageView);
  if (result != VK_SUCCESS) {
    throw RendererError("failed to create image view!", result);
  }
}

VkImageView ImageView::getImageView() const noexcept { return _imageView; }

VkImageViewType ImageView::getType() const noexcept { return _type; }

ImageView::~ImageView() { vkDestroyImageView(_device->getLogicalDevice(), _imageView, nullptr); }
