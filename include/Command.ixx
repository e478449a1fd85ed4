module;
#include <volk.h>
export module Command;
import Device;
import CommandPool;

export namespace Luminary {
class CommandBuffer final {
 private:
  const CommandPool* _pool;
  const Device* _device;
  VkCommandBuffer _buffer;
  bool _active = false;

 public:
  CommandBuffer(const CommandPool& pool, const Device& device);
  CommandBuffer(const CommandBuffer&) = delete;
  CommandBuffer& operator=(const CommandBuffer&) = delete;
  CommandBuffer(CommandBuffer&&) = delete;
  CommandBuffer& operator=(CommandBuffer&&) = delete;

  // only legal once the previous submission of this buffer has retired
  void reset();
  void beginCommands();
  void endCommands();
  bool getActive() const noexcept;
  VkCommandBuffer getCommandBuffer() const noexcept;
  ~CommandBuffer();
};
}  // namespace Luminary
