module;
#include <volk.h>
module Command;
import Error;
using namespace Luminary;

CommandBuffer::CommandBuffer(const CommandPool& pool, const Device& device) : _pool(&pool), _device(&device) {
  VkCommandBufferAllocateInfo allocInfo{.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO,
                                        .commandPool = pool.getCommandPool(),
                                        .level = VK_COMMAND_BUFFER_LEVEL_PRIMARY,
                                        .commandBufferCount = 1};

  auto result = vkAllocateCommandBuffers(device.getLogicalDevice(), &allocInfo, &_buffer);
  if (result != VK_SUCCESS) {
    throw RendererError("failed to allocate command buffers!", result);
  }
}

void CommandBuffer::reset() {
  auto result = vkResetCommandBuffer(_buffer, 0);
  if (result != VK_SUCCESS) throw RendererError("failed to reset command buffer!", result);
  _active = false;
}

void CommandBuffer::beginCommands() {
  VkCommandBufferBeginInfo beginInfo{.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO,
                                     .flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT};

  auto result = vkBeginCommandBuffer(_buffer, &beginInfo);
  if (result != VK_SUCCESS) throw RendererError("failed to begin recording command buffer!", result);
  _active = true;
}

void CommandBuffer::endCommands() {
  auto result = vkEndCommandBuffer(_buffer);
  if (result != VK_SUCCESS) throw RendererError("failed to record command buffer!", result);
  _active = false;
}

bool CommandBuffer::getActive() const noexcept { return _active; }

VkCommandBuffer CommandBuffer::getCommandBuffer() const noexcept { return _buffer; }

CommandBuffer::~CommandBuffer() {
  vkFreeCommandBuffers(_device->getLogicalDevice(), _pool->getCommandPool(), 1, &_buffer);
}
