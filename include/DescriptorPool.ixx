module;
#include <volk.h>
export module DescriptorPool;
import Device;

export namespace Luminary {
struct DescriptorPoolSize {
  // number of DESCRIPTORS in descriptor pool
  int storageImage = 32;
  // number of DESCRIPTOR SETs in descriptor pool
  int descriptorSets = 16;
};

// sets can be freed one by one, they are reallocated on swapchain recreation
class DescriptorPool final {
 private:
  const Device* _device;
  VkDescriptorPool _descriptorPool;

 public:
  DescriptorPool(DescriptorPoolSize poolSize, const Device& device);
  DescriptorPool(const DescriptorPool&) = delete;
  DescriptorPool& operator=(const DescriptorPool&) = delete;
  DescriptorPool(DescriptorPool&&) = delete;
  DescriptorPool& operator=(DescriptorPool&&) = delete;

  VkDescriptorPool getDescriptorPool() const noexcept;
  ~DescriptorPool();
};
}  // namespace Luminary
