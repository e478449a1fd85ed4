module;
#include <volk.h>
#include <map>
#include <ranges>
#include <string>
#include <utility>
#include <vector>
module Pipeline;
import Error;
using namespace Luminary;

Pipeline::Pipeline(const Device& device) noexcept : _device(&device) {}

void Pipeline::createCompute(
    const VkPipelineShaderStageCreateInfo& shaderStage,
    const std::vector<std::pair<std::string, const DescriptorSetLayout*>>& descriptorSetLayout,
    const std::map<std::string, VkPushConstantRange>& pushConstants) {
  _descriptorSetLayout = descriptorSetLayout;
  _pushConstants = pushConstants;

  // create pipeline layout
  auto descriptorSetLayoutRaw = _descriptorSetLayout | std::views::transform([](const auto& layout) {
                                  return layout.second->getDescriptorSetLayout();
                                }) |
                                std::ranges::to<std::vector<VkDescriptorSetLayout>>();
  auto pushConstantsRaw = _pushConstants | std::views::values | std::ranges::to<std::vector<VkPushConstantRange>>();

  VkPipelineLayoutCreateInfo pipelineLayoutInfo{
      .sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO,
      .setLayoutCount = static_cast<uint32_t>(descriptorSetLayoutRaw.size()),
      .pSetLayouts = descriptorSetLayoutRaw.data(),
      .pushConstantRangeCount = static_cast<uint32_t>(pushConstantsRaw.size()),
      .pPushConstantRanges = pushConstantsRaw.empty() ? nullptr : pushConstantsRaw.data()};

  auto result = vkCreatePipelineLayout(_device->getLogicalDevice(), &pipelineLayoutInfo, nullptr, &_pipelineLayout);
  if (result != VK_SUCCESS) {
    throw RendererError("failed to create pipeline layout!", result);
  }

  VkComputePipelineCreateInfo computePipelineCreateInfo{.sType = VK_STRUCTURE_TYPE_COMPUTE_PIPELINE_CREATE_INFO,
                                                        .stage = shaderStage,
                                                        .layout = _pipelineLayout};
  result = vkCreateComputePipelines(_device->getLogicalDevice(), VK_NULL_HANDLE, 1, &computePipelineCreateInfo,
                                    nullptr, &_pipeline);
  if (result != VK_SUCCESS) throw RendererError("failed to create compute pipeline!", result);
}

const std::vector<std::pair<std::string, const DescriptorSetLayout*>>& Pipeline::getDescriptorSetLayout()
    const noexcept {
  return _descriptorSetLayout;
}

const std::map<std::string, VkPushConstantRange>& Pipeline::getPushConstants() const noexcept {
  return _pushConstants;
}

VkPipeline Pipeline::getPipeline() const noexcept { return _pipeline; }

VkPipelineLayout Pipeline::getPipelineLayout() const noexcept { return _pipelineLayout; }

Pipeline::~Pipeline() {
  vkDestroyPipeline(_device->getLogicalDevice(), _pipeline, nullptr);
  vkDestroyPipelineLayout(_device->getLogicalDevice(), _pipelineLayout, nullptr);
}
