module;
#include <volk.h>
#include <cstdint>
#include <functional>
#include <memory>
export module Immediate;
import Command;
import CommandPool;
import Device;
import PhysicalDevice;
import Sync;

export namespace Luminary {
// one-off command submission that blocks until the GPU is done, used for uploads at startup
class ImmediateSubmit final {
 private:
  const Device* _device;
  QueueType _type;
  uint64_t _timeout;
  std::unique_ptr<CommandPool> _commandPool;
  std::unique_ptr<CommandBuffer> _commandBuffer;
  std::unique_ptr<Fence> _fence;

 public:
  ImmediateSubmit(QueueType type, uint64_t timeout, const Device& device);
  ImmediateSubmit(const ImmediateSubmit&) = delete;
  ImmediateSubmit& operator=(const ImmediateSubmit&) = delete;
  ImmediateSubmit(ImmediateSubmit&&) = delete;
  ImmediateSubmit& operator=(ImmediateSubmit&&) = delete;

  void submit(const std::function<void(const CommandBuffer&)>& record);
  QueueType getType() const noexcept;
};
}  // namespace Luminary
