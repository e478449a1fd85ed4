module;
#include <volk.h>
#include <map>
#include <string>
#include <utility>
#include <vector>
export module Pipeline;
import DescriptorSet;
import Device;

export namespace Luminary {
class Pipeline final {
 private:
  const Device* _device;
  std::vector<std::pair<std::string, const DescriptorSetLayout*>> _descriptorSetLayout;
  std::map<std::string, VkPushConstantRange> _pushConstants;
  VkPipeline _pipeline = VK_NULL_HANDLE;
  VkPipelineLayout _pipelineLayout = VK_NULL_HANDLE;

 public:
  Pipeline(const Device& device) noexcept;
  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;
  Pipeline(Pipeline&&) = delete;
  Pipeline& operator=(Pipeline&&) = delete;

  // layouts are bound in the given order, set = position in the vector
  void createCompute(const VkPipelineShaderStageCreateInfo& shaderStage,
                     const std::vector<std::pair<std::string, const DescriptorSetLayout*>>& descriptorSetLayout,
                     const std::map<std::string, VkPushConstantRange>& pushConstants);

  const std::vector<std::pair<std::string, const DescriptorSetLayout*>>& getDescriptorSetLayout() const noexcept;
  const std::map<std::string, VkPushConstantRange>& getPushConstants() const noexcept;
  VkPipeline getPipeline() const noexcept;
  VkPipelineLayout getPipelineLayout() const noexcept;
  ~Pipeline();
};
}  // namespace Luminary
