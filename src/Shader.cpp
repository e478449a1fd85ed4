module;
#include <volk.h>
#include <spirv_reflect.h>
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>
module Shader;
import Error;
using namespace Luminary;

std::vector<char> Luminary::loadShaderCode(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::ate | std::ios::binary);
  if (!file.is_open()) throw RendererError("failed to open shader " + path.string());

  auto size = static_cast<size_t>(file.tellg());
  std::vector<char> code(size);
  file.seekg(0);
  file.read(code.data(), size);
  if (!file || size % sizeof(uint32_t) != 0) throw RendererError("failed to read SPIR-V from " + path.string());
  return code;
}

VkShaderModule Shader::_createShaderModule(const std::vector<char>& code) {
  VkShaderModuleCreateInfo createInfo{.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO,
                                      .codeSize = code.size(),
                                      .pCode = reinterpret_cast<const uint32_t*>(code.data())};

  VkShaderModule shaderModule;
  auto result = vkCreateShaderModule(_device->getLogicalDevice(), &createInfo, nullptr, &shaderModule);
  if (result != VK_SUCCESS) {
    throw RendererError("failed to create shader module!", result);
  }

  return shaderModule;
}

Shader::Shader(const Device& device) noexcept : _device(&device) {}

void Shader::add(const std::vector<char>& shaderCode) {
  // parse spirv code
  SpvReflectShaderModule module;
  SpvReflectResult r = spvReflectCreateShaderModule(shaderCode.size(), shaderCode.data(), &module);
  if (r != SPV_REFLECT_RESULT_SUCCESS) {
    throw RendererError("Failed to reflect shader module");
  }
  auto stage = static_cast<VkShaderStageFlagBits>(module.shader_stage);

  uint32_t count = 0;
  spvReflectEnumerateDescriptorBindings(&module, &count, nullptr);
  std::vector<SpvReflectDescriptorBinding*> bindings(count);
  spvReflectEnumerateDescriptorBindings(&module, &count, bindings.data());

  for (auto b : bindings) {
    VkDescriptorSetLayoutBinding layoutBinding{.binding = b->binding,
                                               .descriptorType = static_cast<VkDescriptorType>(b->descriptor_type),
                                               .descriptorCount = b->count,
                                               .stageFlags = static_cast<VkShaderStageFlags>(stage),
                                               .pImmutableSamplers = nullptr};

    auto it = std::lower_bound(_descriptorSetLayoutBindings.begin(), _descriptorSetLayoutBindings.end(), layoutBinding,
                               [](auto const& x, auto const& v) { return x.binding < v.binding; });
    _descriptorSetLayoutBindings.insert(it, layoutBinding);
  }

  count = 0;
  spvReflectEnumeratePushConstantBlocks(&module, &count, nullptr);
  std::vector<SpvReflectBlockVariable*> blocks(count);
  spvReflectEnumeratePushConstantBlocks(&module, &count, blocks.data());
  _pushConstantSize[stage] = 0;
  for (auto block : blocks) _pushConstantSize[stage] = std::max(_pushConstantSize[stage], block->offset + block->size);
  spvReflectDestroyShaderModule(&module);

  VkShaderModule shaderModule = _createShaderModule(shaderCode);
  _shaders[stage] = {.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO,
                     .stage = stage,
                     .module = shaderModule,
                     .pName = "main"};
}

const VkPipelineShaderStageCreateInfo& Shader::getShaderStageInfo(VkShaderStageFlagBits stage) const {
  auto it = _shaders.find(stage);
  if (it == _shaders.end()) throw RendererError("shader stage wasn't added");
  return it->second;
}

const std::vector<VkDescriptorSetLayoutBinding>& Shader::getDescriptorSetLayoutBindings() const noexcept {
  return _descriptorSetLayoutBindings;
}

uint32_t Shader::getPushConstantSize(VkShaderStageFlagBits stage) const noexcept {
  auto it = _pushConstantSize.find(stage);
  return it != _pushConstantSize.end() ? it->second : 0;
}

Shader::~Shader() {
  for (auto&& [type, shader] : _shaders) vkDestroyShaderModule(_device->getLogicalDevice(), shader.module, nullptr);
}
