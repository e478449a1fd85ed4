module;
#include <volk.h>
module CommandPool;
import Error;
using namespace Luminary;

CommandPool::CommandPool(QueueType type, const Device& device) : _device(&device), _type(type) {
  // command buffers are reset one by one every frame
  VkCommandPoolCreateInfo poolInfo{.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO,
                                   .flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT,
                                   .queueFamilyIndex = device.getQueueIndex(type)};

  auto result = vkCreateCommandPool(device.getLogicalDevice(), &poolInfo, nullptr, &_commandPool);
  if (result != VK_SUCCESS) {
    throw RendererError("failed to create command pool!", result);
  }
}

QueueType CommandPool::getType() const noexcept { return _type; }

VkCommandPool CommandPool::getCommandPool() const noexcept { return _commandPool; }

CommandPool::~CommandPool() { vkDestroyCommandPool(_device->getLogicalDevice(), _commandPool, nullptr); }
