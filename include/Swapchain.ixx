module;
#include <volk.h>
#include <cstdint>
#include <memory>
#include <vector>
export module Swapchain;
import Device;
import Image;
import Logger;
import Sync;

export namespace Luminary {
struct SwapchainImage {
  uint32_t index;
  VkImage image;
  VkImageView view;
};

// B8G8R8A8_UNORM + SRGB_NONLINEAR if offered, otherwise the first entry
VkSurfaceFormatKHR preferredFormat(const std::vector<VkSurfaceFormatKHR>& formats);
// MAILBOX if offered, otherwise FIFO which is always available
VkPresentModeKHR preferredPresentMode(const std::vector<VkPresentModeKHR>& presentModes) noexcept;
VkExtent2D chooseExtent(const VkSurfaceCapabilitiesKHR& capabilities, VkExtent2D desiredExtent) noexcept;
uint32_t chooseImageCount(const VkSurfaceCapabilitiesKHR& capabilities) noexcept;

class Swapchain final {
 private:
  const Device* _device;
  VkSurfaceKHR _surface;
  const Logger* _logger;
  VkSwapchainKHR _swapchain = VK_NULL_HANDLE;
  VkSurfaceFormatKHR _format;
  VkPresentModeKHR _presentMode;
  VkExtent2D _extent;
  std::vector<VkImage> _images;
  std::vector<std::unique_ptr<ImageView>> _imageViews;
  // set by suboptimal and out of date results, cleared by recreation
  bool _suboptimal = false;

  void _create(VkExtent2D desiredExtent);
  void _destroy() noexcept;

 public:
  Swapchain(VkExtent2D desiredExtent, VkSurfaceKHR surface, const Device& device, const Logger& logger);
  Swapchain(const Swapchain&) = delete;
  Swapchain& operator=(const Swapchain&) = delete;
  Swapchain(Swapchain&&) = delete;
  Swapchain& operator=(Swapchain&&) = delete;

  // waits for the device to go idle and replaces the swapchain, reusing the old one as oldSwapchain
  void recreate(VkExtent2D desiredExtent);
  SwapchainImage acquireImage(const Semaphore& semaphore, uint64_t timeout);
  // doesn't block, throws SwapchainNotReady if no image is available right now
  SwapchainImage tryAcquireImage(const Semaphore& semaphore);
  // true if the swapchain has to be recreated
  bool present(VkQueue queue, uint32_t index, const Semaphore& waitSemaphore);

  // makes isSuboptimal() true until the next recreation, which also releases images that were
  // acquired but never presented
  void requestRecreation() noexcept;
  bool isSuboptimal() const noexcept;
  VkSwapchainKHR getSwapchain() const noexcept;
  VkSurfaceFormatKHR getFormat() const noexcept;
  VkPresentModeKHR getPresentMode() const noexcept;
  VkExtent2D getExtent() const noexcept;
  uint32_t getImageCount() const noexcept;
  VkImage getImage(uint32_t index) const noexcept;
  const ImageView& getImageView(uint32_t index) const noexcept;
  ~Swapchain();
};
}  // namespace Luminary
