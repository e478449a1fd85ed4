module;
#include <volk.h>
#define VMA_STATIC_VULKAN_FUNCTIONS 0
#define VMA_DYNAMIC_VULKAN_FUNCTIONS 1
#include <vk_mem_alloc.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>
module Voxels;
import Buffer;
import Command;
import Error;
import PhysicalDevice;
using namespace Luminary;

namespace {
uint32_t distance(uint32_t a, uint32_t b) { return a > b ? a - b : b - a; }
}  // namespace

std::vector<uint32_t> Luminary::generateVoxelScene() {
  constexpr uint32_t last = kVoxelGridSize - 1;
  constexpr uint32_t center = kVoxelGridSize / 2;
  std::vector<uint32_t> voxels(kVoxelGridSize * kVoxelGridSize * kVoxelGridSize, 0);
  for (uint32_t i = 0; i < voxels.size(); i++) {
    uint32_t x = i % kVoxelGridSize;
    uint32_t y = (i / kVoxelGridSize) % kVoxelGridSize;
    uint32_t z = i / (kVoxelGridSize * kVoxelGridSize);

    bool corner = (x == 0 || x == last) && (y == 0 || y == last) && (z == 0 || z == last);
    auto dx = distance(x, center), dy = distance(y, center), dz = distance(z, center);
    bool ball = dx * dx + dy * dy + dz * dz <= 120;
    // tunnels along every axis through the middle of the ball
    bool cross = (dx <= 1 && dy <= 1) || (dx <= 1 && dz <= 1) || (dy <= 1 && dz <= 1);

    if ((corner || ball) && !cross) voxels[i] = 1 + i % 3;
  }
  return voxels;
}

VoxelVolume::VoxelVolume(const std::vector<uint32_t>& voxels,
                         ImmediateSubmit& immediate,
                         const MemoryAllocator& memoryAllocator,
                         const Device& device,
                         const Logger& logger) {
  if (voxels.size() != kVoxelGridSize * kVoxelGridSize * kVoxelGridSize)
    throw RendererError("voxel grid has to contain " + std::to_string(kVoxelGridSize) + "^3 entries",
                        VK_ERROR_INITIALIZATION_FAILED);

  // uploaded on one queue and read on the other, concurrent sharing avoids ownership transfers
  _image = std::make_unique<Image>(
      VK_IMAGE_TYPE_3D, VK_FORMAT_R32_UINT,
      VkExtent3D{.width = kVoxelGridSize, .height = kVoxelGridSize, .depth = kVoxelGridSize},
      VK_IMAGE_USAGE_STORAGE_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT,
      std::vector{device.getQueueIndex(immediate.getType()), device.getQueueIndex(QueueType::Graphics)},
      memoryAllocator);

  auto bytes = std::as_bytes(std::span(voxels));
  Buffer staging(bytes.size(), VK_BUFFER_USAGE_TRANSFER_SRC_BIT,
                 VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT,
                 memoryAllocator);
  staging.setData(bytes);

  immediate.submit([&](const CommandBuffer& commandBuffer) {
    _image->changeLayout(VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, commandBuffer);
    _image->copyFrom(staging, commandBuffer);
    _image->changeLayout(VK_IMAGE_LAYOUT_GENERAL, commandBuffer);
  });

  _imageView = std::make_unique<ImageView>(_image->getImage(), VK_FORMAT_R32_UINT, VK_IMAGE_VIEW_TYPE_3D, device);
  logger.info("voxels", "uploaded {}^3 voxel grid, {} bytes", kVoxelGridSize, bytes.size());
}

const Image& VoxelVolume::getImage() const noexcept { return *_image; }

const ImageView& VoxelVolume::getImageView() const noexcept { return *_imageView; }
