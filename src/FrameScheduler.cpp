module;
#include <volk.h>
#include <array>
#include <cstdint>
#include <memory>
module FrameScheduler;
import Error;
import PhysicalDevice;
using namespace Luminary;

FrameSlot::FrameSlot(const Device& device) {
  _commandPool = std::make_unique<CommandPool>(QueueType::Graphics, device);
  _commandBuffer = std::make_unique<CommandBuffer>(*_commandPool, device);
  _imageAvailable = std::make_unique<Semaphore>(device);
  _renderFinished = std::make_unique<Semaphore>(device);
  _inFlight = std::make_unique<Fence>(true, device);
}

CommandBuffer& FrameSlot::getCommandBuffer() noexcept { return *_commandBuffer; }

const Semaphore& FrameSlot::getImageAvailable() const noexcept { return *_imageAvailable; }

const Semaphore& FrameSlot::getRenderFinished() const noexcept { return *_renderFinished; }

const Fence& FrameSlot::getInFlight() const noexcept { return *_inFlight; }

FrameSlotState FrameSlot::getState() const noexcept { return _state; }

void FrameSlot::setState(FrameSlotState state) noexcept { _state = state; }

FrameScheduler::FrameScheduler(Swapchain& swapchain,
                               const Settings& settings,
                               const Device& device,
                               const Logger& logger)
    : _device(&device),
      _swapchain(&swapchain),
      _logger(&logger),
      _fenceTimeout(settings.fenceTimeout),
      _acquireTimeout(settings.acquireTimeout) {
  for (auto& slot : _slots) slot = std::make_unique<FrameSlot>(device);
}

bool FrameScheduler::drawFrame(RenderPass& renderPass) {
  auto& slot = *_slots[getCurrentSlot()];

  // the slot's previous submission has to retire before its resources are touched
  if (slot.getInFlight().wait(_fenceTimeout) == VK_TIMEOUT)
    throw DrawTimeout("previous frame in this slot didn't finish in time!", VK_TIMEOUT);
  slot.getInFlight().reset();
  slot.setState(FrameSlotState::Recording);

  SwapchainImage image;
  try {
    image = _swapchain->acquireImage(slot.getImageAvailable(), _acquireTimeout);
  } catch (const SwapchainOutOfDate& error) {
    _logger->debug("frame", "{}", error.what());
    _releaseSlot(slot, nullptr);
    return true;
  } catch (const RendererError&) {
    _releaseSlot(slot, nullptr);
    throw;
  }

  auto& commandBuffer = slot.getCommandBuffer();
  try {
    commandBuffer.reset();
    commandBuffer.beginCommands();
    renderPass.record(commandBuffer, image);
    commandBuffer.endCommands();
  } catch (const RendererError&) {
    // the acquired image is never presented, only recreation gives it back
    _swapchain->requestRecreation();
    _releaseSlot(slot, &slot.getImageAvailable());
    throw;
  }

  VkSemaphoreSubmitInfo waitInfo{.sType = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO,
                                 .semaphore = slot.getImageAvailable().getSemaphore(),
                                 .stageMask = VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT};
  VkSemaphoreSubmitInfo signalInfo{.sType = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO,
                                   .semaphore = slot.getRenderFinished().getSemaphore(),
                                   .stageMask = VK_PIPELINE_STAGE_2_ALL_GRAPHICS_BIT};
  VkCommandBufferSubmitInfo commandBufferInfo{.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO,
                                              .commandBuffer = commandBuffer.getCommandBuffer()};
  VkSubmitInfo2 submitInfo{.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO_2,
                           .waitSemaphoreInfoCount = 1,
                           .pWaitSemaphoreInfos = &waitInfo,
                           .commandBufferInfoCount = 1,
                           .pCommandBufferInfos = &commandBufferInfo,
                           .signalSemaphoreInfoCount = 1,
                           .pSignalSemaphoreInfos = &signalInfo};
  auto result = vkQueueSubmit2(_device->getQueue(QueueType::Graphics), 1, &submitInfo, slot.getInFlight().getFence());
  if (result != VK_SUCCESS) {
    _swapchain->requestRecreation();
    _releaseSlot(slot, &slot.getImageAvailable());
    throw RendererError("failed to submit draw command buffer!", result);
  }
  slot.setState(FrameSlotState::Submitted);

  auto recreate = _swapchain->present(_device->getQueue(QueueType::Present), image.index, slot.getRenderFinished());
  _frameCounter++;
  return recreate;
}

void FrameScheduler::_releaseSlot(FrameSlot& slot, const Semaphore* pendingAcquire) {
  VkSemaphoreSubmitInfo waitInfo{.sType = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO,
                                 .semaphore = pendingAcquire ? pendingAcquire->getSemaphore() : VK_NULL_HANDLE,
                                 .stageMask = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT};
  VkSubmitInfo2 submitInfo{.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO_2,
                           .waitSemaphoreInfoCount = 1,
                           .pWaitSemaphoreInfos = &waitInfo};
  // without a pending acquire an empty batch list is enough to signal the fence
  auto result = vkQueueSubmit2(_device->getQueue(QueueType::Graphics), pendingAcquire ? 1 : 0,
                               pendingAcquire ? &submitInfo : nullptr, slot.getInFlight().getFence());
  if (result != VK_SUCCESS) throw RendererError("failed to signal frame fence!", result);
  slot.setState(FrameSlotState::Idle);
}

uint64_t FrameScheduler::getFrameCounter() const noexcept { return _frameCounter; }

int FrameScheduler::getCurrentSlot() const noexcept { return static_cast<int>(_frameCounter % kFramesInFlight); }

const FrameSlot& FrameScheduler::getFrameSlot(int index) const noexcept { return *_slots[index]; }

FrameScheduler::~FrameScheduler() {
  // slots can't be destroyed while their submissions are in flight
  auto result = vkDeviceWaitIdle(_device->getLogicalDevice());
  if (result != VK_SUCCESS) _logger->error("frame", "failed to wait for device idle: {}", toString(result));
}
