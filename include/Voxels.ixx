module;
#include <volk.h>
#include <cstdint>
#include <memory>
#include <vector>
export module Voxels;
import Allocator;
import Device;
import Image;
import Immediate;
import Logger;

export namespace Luminary {
// edge length of the dense voxel grid
constexpr uint32_t kVoxelGridSize = 32;

// kVoxelGridSize^3 entries indexed by x + 32 * y + 1024 * z, 0 is empty, otherwise a palette index
std::vector<uint32_t> generateVoxelScene();

// R32_UINT 3D storage image in GENERAL layout, readable by the compute shader
class VoxelVolume final {
 private:
  std::unique_ptr<Image> _image;
  std::unique_ptr<ImageView> _imageView;

 public:
  VoxelVolume(const std::vector<uint32_t>& voxels,
              ImmediateSubmit& immediate,
              const MemoryAllocator& memoryAllocator,
              const Device& device,
              const Logger& logger);
  VoxelVolume(const VoxelVolume&) = delete;
  VoxelVolume& operator=(const VoxelVolume&) = delete;
  VoxelVolume(VoxelVolume&&) = delete;
  VoxelVolume& operator=(VoxelVolume&&) = delete;

  const Image& getImage() const noexcept;
  const ImageView& getImageView() const noexcept;
};
}  // namespace Luminary
