module;
#include <volk.h>
#include <map>
#include <vector>
export module DescriptorSet;
import DescriptorPool;
import Device;

export namespace Luminary {
class DescriptorSetLayout final {
 private:
  const Device* _device;
  VkDescriptorSetLayout _descriptorSetLayout = VK_NULL_HANDLE;
  std::vector<VkDescriptorSetLayoutBinding> _info;

 public:
  DescriptorSetLayout(const Device& device) noexcept;
  DescriptorSetLayout(const DescriptorSetLayout&) = delete;
  DescriptorSetLayout& operator=(const DescriptorSetLayout&) = delete;
  DescriptorSetLayout(DescriptorSetLayout&&) = delete;
  DescriptorSetLayout& operator=(DescriptorSetLayout&&) = delete;

  void createCustom(const std::vector<VkDescriptorSetLayoutBinding>& info);
  const std::vector<VkDescriptorSetLayoutBinding>& getLayoutInfo() const noexcept;
  VkDescriptorSetLayout getDescriptorSetLayout() const noexcept;
  ~DescriptorSetLayout();
};

class DescriptorSet final {
 private:
  const DescriptorPool* _descriptorPool;
  const Device* _device;
  VkDescriptorSet _descriptorSet;
  std::vector<VkDescriptorSetLayoutBinding> _layoutInfo;

 public:
  DescriptorSet(const DescriptorSetLayout& layout, const DescriptorPool& descriptorPool, const Device& device);
  DescriptorSet(const DescriptorSet&) = delete;
  DescriptorSet& operator=(const DescriptorSet&) = delete;
  DescriptorSet(DescriptorSet&&) = delete;
  DescriptorSet& operator=(DescriptorSet&&) = delete;

  // key is the binding, descriptor type is taken from the layout
  void updateCustom(const std::map<int, std::vector<VkDescriptorBufferInfo>>& buffers,
                    const std::map<int, std::vector<VkDescriptorImageInfo>>& images);
  VkDescriptorSet getDescriptorSet() const noexcept;
  ~DescriptorSet();
};
}  // namespace Luminary
