module;
#include <volk.h>
#include <algorithm>
#include <map>
#include <string>
#include <vector>
module DescriptorSet;
import Error;
using namespace Luminary;

DescriptorSetLayout::DescriptorSetLayout(const Device& device) noexcept : _device(&device) {}

void DescriptorSetLayout::createCustom(const std::vector<VkDescriptorSetLayoutBinding>& info) {
  _info = info;

  auto layoutInfo = VkDescriptorSetLayoutCreateInfo{.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO,
                                                    .bindingCount = static_cast<uint32_t>(_info.size()),
                                                    .pBindings = _info.data()};
  auto result = vkCreateDescriptorSetLayout(_device->getLogicalDevice(), &layoutInfo, nullptr, &_descriptorSetLayout);
  if (result != VK_SUCCESS) {
    throw RendererError("failed to create descriptor set layout!", result);
  }
}

const std::vector<VkDescriptorSetLayoutBinding>& DescriptorSetLayout::getLayoutInfo() const noexcept { return _info; }

VkDescriptorSetLayout DescriptorSetLayout::getDescriptorSetLayout() const noexcept { return _descriptorSetLayout; }

DescriptorSetLayout::~DescriptorSetLayout() {
  vkDestroyDescriptorSetLayout(_device->getLogicalDevice(), _descriptorSetLayout, nullptr);
}

DescriptorSet::DescriptorSet(const DescriptorSetLayout& layout,
                             const DescriptorPool& descriptorPool,
                             const Device& device)
    : _descriptorPool(&descriptorPool),
      _device(&device),
      _layoutInfo(layout.getLayoutInfo()) {
  auto layoutRaw = layout.getDescriptorSetLayout();
  VkDescriptorSetAllocateInfo allocInfo{.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO,
                                        .descriptorPool = descriptorPool.getDescriptorPool(),
                                        .descriptorSetCount = 1,
                                        .pSetLayouts = &layoutRaw};
  auto result = vkAllocateDescriptorSets(device.getLogicalDevice(), &allocInfo, &_descriptorSet);
  if (result != VK_SUCCESS) {
    throw RendererError("failed to allocate descriptor sets!", result);
  }
}

void DescriptorSet::updateCustom(const std::map<int, std::vector<VkDescriptorBufferInfo>>& buffers,
                                 const std::map<int, std::vector<VkDescriptorImageInfo>>& images) {
  auto descriptorType = [this](int binding) {
    auto info = std::ranges::find_if(_layoutInfo, [binding](const VkDescriptorSetLayoutBinding& layoutBinding) {
      return layoutBinding.binding == static_cast<uint32_t>(binding);
    });
    if (info == _layoutInfo.end()) throw RendererError("layout has no binding " + std::to_string(binding));
    return info->descriptorType;
  };

  std::vector<VkWriteDescriptorSet> descriptorWrites;
  for (auto&& [binding, info] : buffers) {
    descriptorWrites.push_back({.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET,
                                .dstSet = _descriptorSet,
                                .dstBinding = static_cast<uint32_t>(binding),
                                .dstArrayElement = 0,
                                .descriptorCount = static_cast<uint32_t>(info.size()),
                                .descriptorType = descriptorType(binding),
                                .pBufferInfo = info.data()});
  }
  for (auto&& [binding, info] : images) {
    descriptorWrites.push_back({.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET,
                                .dstSet = _descriptorSet,
                                .dstBinding = static_cast<uint32_t>(binding),
                                .dstArrayElement = 0,
                                .descriptorCount = static_cast<uint32_t>(info.size()),
                                .descriptorType = descriptorType(binding),
                                .pImageInfo = info.data()});
  }

  vkUpdateDescriptorSets(_device->getLogicalDevice(), static_cast<uint32_t>(descriptorWrites.size()),
                         descriptorWrites.data(), 0, nullptr);
}

VkDescriptorSet DescriptorSet::getDescriptorSet() const noexcept { return _descriptorSet; }

DescriptorSet::~DescriptorSet() {
  vkFreeDescriptorSets(_device->getLogicalDevice(), _descriptorPool->getDescriptorPool(), 1, &_descriptorSet);
}
