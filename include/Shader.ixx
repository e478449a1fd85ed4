module;
#include <volk.h>
#include <spirv_reflect.h>
#include <cstdint>
#include <filesystem>
#include <unordered_map>
#include <vector>
export module Shader;
import Device;

export namespace Luminary {
std::vector<char> loadShaderCode(const std::filesystem::path& path);

class Shader final {
 private:
  const Device* _device;
  std::unordered_map<VkShaderStageFlagBits, VkPipelineShaderStageCreateInfo> _shaders;
  std::vector<VkDescriptorSetLayoutBinding> _descriptorSetLayoutBindings;
  std::unordered_map<VkShaderStageFlagBits, uint32_t> _pushConstantSize;
  VkShaderModule _createShaderModule(const std::vector<char>& code);

 public:
  Shader(const Device& device) noexcept;
  Shader(const Shader&) = delete;
  Shader& operator=(const Shader&) = delete;
  Shader(Shader&&) = delete;
  Shader& operator=(Shader&&) = delete;

  void add(const std::vector<char>& shaderCode);
  const VkPipelineShaderStageCreateInfo& getShaderStageInfo(VkShaderStageFlagBits stage) const;
  // sorted by binding
  const std::vector<VkDescriptorSetLayoutBinding>& getDescriptorSetLayoutBindings() const noexcept;
  // 0 if the stage doesn't declare a push constant block
  uint32_t getPushConstantSize(VkShaderStageFlagBits stage) const noexcept;
  ~Shader();
};
}  // namespace Luminary
