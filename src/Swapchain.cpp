module;
#include <volk.h>
#include <algorithm>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>
module Swapchain;
import Error;
import PhysicalDevice;
using namespace Luminary;

namespace {
VkSurfaceCapabilitiesKHR getCapabilities(VkPhysicalDevice device, VkSurfaceKHR surface) {
  VkSurfaceCapabilitiesKHR capabilities;
  auto result = vkGetPhysicalDeviceSurfaceCapabilitiesKHR(device, surface, &capabilities);
  if (result != VK_SUCCESS) throw RendererError("failed to query surface capabilities!", result);
  return capabilities;
}

std::vector<VkSurfaceFormatKHR> getFormats(VkPhysicalDevice device, VkSurfaceKHR surface) {
  uint32_t count = 0;
  auto result = vkGetPhysicalDeviceSurfaceFormatsKHR(device, surface, &count, nullptr);
  if (result != VK_SUCCESS) throw RendererError("failed to query surface formats!", result);
  std::vector<VkSurfaceFormatKHR> formats(count);
  result = vkGetPhysicalDeviceSurfaceFormatsKHR(device, surface, &count, formats.data());
  if (result != VK_SUCCESS && result != VK_INCOMPLETE) throw RendererError("failed to query surface formats!", result);
  formats.resize(count);
  return formats;
}

std::vector<VkPresentModeKHR> getPresentModes(VkPhysicalDevice device, VkSurfaceKHR surface) {
  uint32_t count = 0;
  auto result = vkGetPhysicalDeviceSurfacePresentModesKHR(device, surface, &count, nullptr);
  if (result != VK_SUCCESS) throw RendererError("failed to query present modes!", result);
  std::vector<VkPresentModeKHR> presentModes(count);
  result = vkGetPhysicalDeviceSurfacePresentModesKHR(device, surface, &count, presentModes.data());
  if (result != VK_SUCCESS && result != VK_INCOMPLETE) throw RendererError("failed to query present modes!", result);
  presentModes.resize(count);
  return presentModes;
}
}  // namespace

VkSurfaceFormatKHR Luminary::preferredFormat(const std::vector<VkSurfaceFormatKHR>& formats) {
  if (formats.empty()) throw NoSurfaceFormats("surface doesn't support any format!", VK_ERROR_FORMAT_NOT_SUPPORTED);

  auto preferred = std::ranges::find_if(formats, [](const VkSurfaceFormatKHR& format) {
    return format.format == VK_FORMAT_B8G8R8A8_UNORM && format.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;
  });
  return preferred != formats.end() ? *preferred : formats.front();
}

VkPresentModeKHR Luminary::preferredPresentMode(const std::vector<VkPresentModeKHR>& presentModes) noexcept {
  if (std::ranges::find(presentModes, VK_PRESENT_MODE_MAILBOX_KHR) != presentModes.end())
    return VK_PRESENT_MODE_MAILBOX_KHR;
  return VK_PRESENT_MODE_FIFO_KHR;
}

VkExtent2D Luminary::chooseExtent(const VkSurfaceCapabilitiesKHR& capabilities, VkExtent2D desiredExtent) noexcept {
  return {.width = std::clamp(desiredExtent.width, capabilities.minImageExtent.width, capabilities.maxImageExtent.width),
          .height =
              std::clamp(desiredExtent.height, capabilities.minImageExtent.height, capabilities.maxImageExtent.height)};
}

uint32_t Luminary::chooseImageCount(const VkSurfaceCapabilitiesKHR& capabilities) noexcept {
  auto imageCount = capabilities.minImageCount + 1;
  // zero means there is no maximum
  if (capabilities.maxImageCount > 0) imageCount = std::min(imageCount, capabilities.maxImageCount);
  return imageCount;
}

Swapchain::Swapchain(VkExtent2D desiredExtent, VkSurfaceKHR surface, const Device& device, const Logger& logger)
    : _device(&device),
      _surface(surface),
      _logger(&logger) {
  _create(desiredExtent);
}

void Swapchain::_create(VkExtent2D desiredExtent) {
  auto physicalDevice = _device->getPhysicalDevice();
  auto capabilities = getCapabilities(physicalDevice, _surface);
  // because we use swapchain in compute shader
  VkImageUsageFlags usage = VK_IMAGE_USAGE_STORAGE_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT;
  if ((capabilities.supportedUsageFlags & usage) != usage)
    throw RendererError("surface images can't be used as storage images!", VK_ERROR_FEATURE_NOT_PRESENT);

  auto formats = getFormats(physicalDevice, _surface);
  std::erase_if(formats, [physicalDevice](const VkSurfaceFormatKHR& format) {
    return !supportsStorageImage(physicalDevice, format.format);
  });
  auto format = preferredFormat(formats);
  auto presentMode = preferredPresentMode(getPresentModes(physicalDevice, _surface));
  auto extent = chooseExtent(capabilities, desiredExtent);

  uint32_t queueFamilies[] = {_device->getQueueIndex(QueueType::Graphics), _device->getQueueIndex(QueueType::Present)};
  bool exclusive = queueFamilies[0] == queueFamilies[1];
  VkSwapchainCreateInfoKHR createInfo{.sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR,
                                      .surface = _surface,
                                      .minImageCount = chooseImageCount(capabilities),
                                      .imageFormat = format.format,
                                      .imageColorSpace = format.colorSpace,
                                      .imageExtent = extent,
                                      .imageArrayLayers = 1,
                                      .imageUsage = usage,
                                      .imageSharingMode =
                                          exclusive ? VK_SHARING_MODE_EXCLUSIVE : VK_SHARING_MODE_CONCURRENT,
                                      .queueFamilyIndexCount = exclusive ? 0u : 2u,
                                      .pQueueFamilyIndices = exclusive ? nullptr : queueFamilies,
                                      .preTransform = capabilities.currentTransform,
                                      .compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR,
                                      .presentMode = presentMode,
                                      .clipped = VK_TRUE,
                                      .oldSwapchain = _swapchain};

  auto logicalDevice = _device->getLogicalDevice();
  VkSwapchainKHR swapchain;
  auto result = vkCreateSwapchainKHR(logicalDevice, &createInfo, nullptr, &swapchain);
  if (result != VK_SUCCESS) throw RendererError("failed to create swap chain!", result);

  std::vector<VkImage> images;
  std::vector<std::unique_ptr<ImageView>> imageViews;
  try {
    uint32_t imageCount = 0;
    result = vkGetSwapchainImagesKHR(logicalDevice, swapchain, &imageCount, nullptr);
    if (result != VK_SUCCESS) throw RendererError("failed to get swap chain images!", result);
    images.resize(imageCount);
    result = vkGetSwapchainImagesKHR(logicalDevice, swapchain, &imageCount, images.data());
    if (result != VK_SUCCESS) throw RendererError("failed to get swap chain images!", result);

    // views created so far are destroyed by the vector if a later one fails
    imageViews.reserve(images.size());
    for (auto image : images) {
      imageViews.push_back(std::make_unique<ImageView>(image, format.format, VK_IMAGE_VIEW_TYPE_2D, *_device));
    }
  } catch (...) {
    imageViews.clear();
    vkDestroySwapchainKHR(logicalDevice, swapchain, nullptr);
    throw;
  }

  // views of the previous swapchain go before its handle
  _destroy();
  _swapchain = swapchain;
  _images = std::move(images);
  _imageViews = std::move(imageViews);
  _format = format;
  _presentMode = presentMode;
  _extent = extent;
  _suboptimal = false;

  _logger->info("swapchain", "{}x{}, {} images, format {}, present mode {}", extent.width, extent.height,
                _images.size(), static_cast<int>(format.format), static_cast<int>(presentMode));
}

void Swapchain::_destroy() noexcept {
  _imageViews.clear();
  _images.clear();
  if (_swapchain != VK_NULL_HANDLE) vkDestroySwapchainKHR(_device->getLogicalDevice(), _swapchain, nullptr);
  _swapchain = VK_NULL_HANDLE;
}

void Swapchain::recreate(VkExtent2D desiredExtent) {
  _device->waitIdle();
  _create(desiredExtent);
}

SwapchainImage Swapchain::acquireImage(const Semaphore& semaphore, uint64_t timeout) {
  // semaphore to signal, once image is available
  uint32_t index = 0;
  auto result = vkAcquireNextImageKHR(_device->getLogicalDevice(), _swapchain, timeout, semaphore.getSemaphore(),
                                      VK_NULL_HANDLE, &index);
  switch (result) {
    case VK_SUCCESS:
      break;
    case VK_SUBOPTIMAL_KHR:
      // image is still valid for this frame, recreation happens after present
      if (!_suboptimal) _logger->debug("swapchain", "suboptimal swapchain, recreation scheduled");
      _suboptimal = true;
      break;
    case VK_TIMEOUT:
      throw SwapchainTimeout("timed out acquiring swap chain image!", result);
    case VK_NOT_READY:
      throw SwapchainNotReady("no swap chain image is ready!", result);
    case VK_ERROR_OUT_OF_DATE_KHR:
      _suboptimal = true;
      throw SwapchainOutOfDate("swap chain is out of date!", result);
    default:
      throw RendererError("failed to acquire swap chain image!", result);
  }

  if (index >= _images.size()) throw RendererError("presentation engine returned an unknown image index!", result);
  return {.index = index, .image = _images[index], .view = _imageViews[index]->getImageView()};
}

SwapchainImage Swapchain::tryAcquireImage(const Semaphore& semaphore) { return acquireImage(semaphore, 0); }

bool Swapchain::present(VkQueue queue, uint32_t index, const Semaphore& waitSemaphore) {
  auto semaphore = waitSemaphore.getSemaphore();
  VkPresentInfoKHR presentInfo{.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR,
                               .waitSemaphoreCount = 1,
                               .pWaitSemaphores = &semaphore,
                               .swapchainCount = 1,
                               .pSwapchains = &_swapchain,
                               .pImageIndices = &index};

  auto result = vkQueuePresentKHR(queue, &presentInfo);
  if (result == VK_SUBOPTIMAL_KHR || result == VK_ERROR_OUT_OF_DATE_KHR) {
    _suboptimal = true;
  } else if (result != VK_SUCCESS) {
    throw RendererError("failed to present swap chain image!", result);
  }

  return _suboptimal;
}

void Swapchain::requestRecreation() noexcept { _suboptimal = true; }

bool Swapchain::isSuboptimal() const noexcept { return _suboptimal; }

VkSwapchainKHR Swapchain::getSwapchain() const noexcept { return _swapchain; }

VkSurfaceFormatKHR Swapchain::getFormat() const noexcept { return _format; }

VkPresentModeKHR Swapchain::getPresentMode() const noexcept { return _presentMode; }

VkExtent2D Swapchain::getExtent() const noexcept { return _extent; }

uint32_t Swapchain::getImageCount() const noexcept { return static_cast<uint32_t>(_images.size()); }

VkImage Swapchain::getImage(uint32_t index) const noexcept { return _images[index]; }

const ImageView& Swapchain::getImageView(uint32_t index) const noexcept { return *_imageViews[index]; }

Swapchain::~Swapchain() { _destroy(); }
