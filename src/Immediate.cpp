module;
#include <volk.h>
#include <cstdint>
#include <functional>
#include <memory>
module Immediate;
import Error;
using namespace Luminary;

ImmediateSubmit::ImmediateSubmit(QueueType type, uint64_t timeout, const Device& device)
    : _device(&device),
      _type(type),
      _timeout(timeout) {
  _commandPool = std::make_unique<CommandPool>(type, device);
  _commandBuffer = std::make_unique<CommandBuffer>(*_commandPool, device);
  _fence = std::make_unique<Fence>(false, device);
}

void ImmediateSubmit::submit(const std::function<void(const CommandBuffer&)>& record) {
  _commandBuffer->reset();
  _commandBuffer->beginCommands();
  record(*_commandBuffer);
  _commandBuffer->endCommands();

  VkCommandBufferSubmitInfo commandBufferInfo{.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO,
                                              .commandBuffer = _commandBuffer->getCommandBuffer()};
  VkSubmitInfo2 submitInfo{.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO_2,
                           .commandBufferInfoCount = 1,
                           .pCommandBufferInfos = &commandBufferInfo};
  auto result = vkQueueSubmit2(_device->getQueue(_type), 1, &submitInfo, _fence->getFence());
  if (result != VK_SUCCESS) throw RendererError("failed to submit immediate command buffer!", result);

  if (_fence->wait(_timeout) == VK_TIMEOUT)
    throw RendererError("immediate submission didn't finish in time!", VK_TIMEOUT);
  _fence->reset();
}

QueueType ImmediateSubmit::getType() const noexcept { return _type; }
