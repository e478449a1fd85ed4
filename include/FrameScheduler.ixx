module;
#include <volk.h>
#include <array>
#include <cstdint>
#include <memory>
export module FrameScheduler;
import Command;
import CommandPool;
import Device;
import Logger;
import RenderPass;
import Settings;
import Swapchain;
import Sync;

export namespace Luminary {
enum class FrameSlotState { Idle, Recording, Submitted };

// per frame-in-flight resources, reused every kFramesInFlight frames
class FrameSlot final {
 private:
  std::unique_ptr<CommandPool> _commandPool;
  std::unique_ptr<CommandBuffer> _commandBuffer;
  // signaled by image acquisition, waited by the submission
  std::unique_ptr<Semaphore> _imageAvailable;
  // signaled by the submission, waited by the presentation
  std::unique_ptr<Semaphore> _renderFinished;
  // created signaled so the very first wait passes
  std::unique_ptr<Fence> _inFlight;
  FrameSlotState _state = FrameSlotState::Idle;

 public:
  FrameSlot(const Device& device);
  FrameSlot(const FrameSlot&) = delete;
  FrameSlot& operator=(const FrameSlot&) = delete;
  FrameSlot(FrameSlot&&) = delete;
  FrameSlot& operator=(FrameSlot&&) = delete;

  CommandBuffer& getCommandBuffer() noexcept;
  const Semaphore& getImageAvailable() const noexcept;
  const Semaphore& getRenderFinished() const noexcept;
  const Fence& getInFlight() const noexcept;
  FrameSlotState getState() const noexcept;
  void setState(FrameSlotState state) noexcept;
};

class FrameScheduler final {
 private:
  const Device* _device;
  Swapchain* _swapchain;
  const Logger* _logger;
  uint64_t _fenceTimeout;
  uint64_t _acquireTimeout;
  std::array<std::unique_ptr<FrameSlot>, kFramesInFlight> _slots;
  uint64_t _frameCounter = 0;

  // signals the slot's fence again after it was reset for a frame that won't be submitted. A pending
  // acquire signal is waited on by the same batch so the semaphore can be handed to the next acquire.
  void _releaseSlot(FrameSlot& slot, const Semaphore* pendingAcquire);

 public:
  FrameScheduler(Swapchain& swapchain, const Settings& settings, const Device& device, const Logger& logger);
  FrameScheduler(const FrameScheduler&) = delete;
  FrameScheduler& operator=(const FrameScheduler&) = delete;
  FrameScheduler(FrameScheduler&&) = delete;
  FrameScheduler& operator=(FrameScheduler&&) = delete;

  // records, submits and presents one frame in the next slot,
  // true if the swapchain has to be recreated before the next frame
  bool drawFrame(RenderPass& renderPass);
  // incremented by every presented frame
  uint64_t getFrameCounter() const noexcept;
  int getCurrentSlot() const noexcept;
  const FrameSlot& getFrameSlot(int index) const noexcept;
  ~FrameScheduler();
};
}  // namespace Luminary
