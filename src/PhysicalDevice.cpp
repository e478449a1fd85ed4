module;
#include <volk.h>
#include <algorithm>
#include <bit>
#include <cstdint>
#include <cstring>
#include <limits>
#include <optional>
#include <vector>
module PhysicalDevice;
import Error;
using namespace Luminary;

uint32_t QueueFamilyAssignment::get(QueueType type) const noexcept {
  switch (type) {
    case QueueType::Graphics:
      return graphics;
    case QueueType::Present:
      return present;
    case QueueType::Transfer:
      return transfer;
    case QueueType::Compute:
      return compute;
  }
  return graphics;
}

int Luminary::getQueueGenerality(const QueueFamilyCapability& family) noexcept {
  auto bits = family.flags & (VK_QUEUE_GRAPHICS_BIT | VK_QUEUE_COMPUTE_BIT | VK_QUEUE_TRANSFER_BIT);
  return std::popcount(static_cast<uint32_t>(bits)) + (family.presentSupported ? 1 : 0);
}

std::optional<uint32_t> Luminary::pickQueueFamily(const std::vector<QueueFamilyCapability>& families,
                                                  VkQueueFlags requiredFlags) noexcept {
  std::optional<uint32_t> picked;
  int generality = std::numeric_limits<int>::max();
  for (uint32_t i = 0; i < families.size(); i++) {
    const auto& family = families[i];
    bool satisfies = requiredFlags == 0 ? family.presentSupported
                                        : (family.flags & requiredFlags) == requiredFlags;
    if (!satisfies) continue;

    auto current = getQueueGenerality(family);
    if (current <= generality) {
      generality = current;
      picked = i;
    }
  }

  return picked;
}

std::optional<QueueFamilyAssignment> Luminary::assignQueueFamilies(
    const std::vector<QueueFamilyCapability>& families) noexcept {
  auto graphics = pickQueueFamily(families, VK_QUEUE_GRAPHICS_BIT);
  auto present = pickQueueFamily(families, 0);
  auto transfer = pickQueueFamily(families, VK_QUEUE_TRANSFER_BIT);
  auto compute = pickQueueFamily(families, VK_QUEUE_COMPUTE_BIT);
  if (!graphics || !present || !transfer || !compute) return std::nullopt;

  return QueueFamilyAssignment{.graphics = *graphics, .present = *present, .transfer = *transfer, .compute = *compute};
}

int Luminary::scoreDeviceType(VkPhysicalDeviceType type) noexcept {
  switch (type) {
    case VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU:
      return 5;
    case VK_PHYSICAL_DEVICE_TYPE_VIRTUAL_GPU:
      return 4;
    case VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU:
      return 3;
    case VK_PHYSICAL_DEVICE_TYPE_CPU:
      return 2;
    case VK_PHYSICAL_DEVICE_TYPE_OTHER:
      return 1;
    default:
      return 0;
  }
}

const std::vector<const char*>& Luminary::getRequiredDeviceExtensions() noexcept {
  static const std::vector<const char*> extensions{VK_KHR_SWAPCHAIN_EXTENSION_NAME};
  return extensions;
}

bool Luminary::supportsStorageImage(VkPhysicalDevice device, VkFormat format) noexcept {
  VkFormatProperties properties;
  vkGetPhysicalDeviceFormatProperties(device, format, &properties);
  return (properties.optimalTilingFeatures & VK_FORMAT_FEATURE_STORAGE_IMAGE_BIT) != 0;
}

PhysicalDeviceSelector::PhysicalDeviceSelector(VkInstance instance, VkSurfaceKHR surface, const Logger& logger) noexcept
    : _instance(instance),
      _surface(surface),
      _logger(&logger) {}

std::vector<QueueFamilyCapability> PhysicalDeviceSelector::_getQueueFamilies(VkPhysicalDevice device) const {
  uint32_t queueFamilyCount = 0;
  vkGetPhysicalDeviceQueueFamilyProperties(device, &queueFamilyCount, nullptr);
  std::vector<VkQueueFamilyProperties> properties(queueFamilyCount);
  vkGetPhysicalDeviceQueueFamilyProperties(device, &queueFamilyCount, properties.data());

  std::vector<QueueFamilyCapability> families;
  families.reserve(queueFamilyCount);
  for (uint32_t i = 0; i < queueFamilyCount; i++) {
    VkBool32 presentSupported = VK_FALSE;
    auto result = vkGetPhysicalDeviceSurfaceSupportKHR(device, i, _surface, &presentSupported);
    if (result != VK_SUCCESS) throw RendererError("failed to query surface support!", result);
    families.push_back({.flags = properties[i].queueFlags, .presentSupported = presentSupported == VK_TRUE});
  }

  return families;
}

bool PhysicalDeviceSelector::_supportsExtensions(VkPhysicalDevice device) const {
  uint32_t extensionCount = 0;
  auto result = vkEnumerateDeviceExtensionProperties(device, nullptr, &extensionCount, nullptr);
  if (result != VK_SUCCESS) throw RendererError("failed to enumerate device extensions!", result);
  std::vector<VkExtensionProperties> extensions(extensionCount);
  result = vkEnumerateDeviceExtensionProperties(device, nullptr, &extensionCount, extensions.data());
  if (result != VK_SUCCESS && result != VK_INCOMPLETE)
    throw RendererError("failed to enumerate device extensions!", result);

  return std::ranges::all_of(getRequiredDeviceExtensions(), [&extensions](const char* required) {
    return std::ranges::any_of(extensions, [required](const VkExtensionProperties& extension) {
      return std::strcmp(extension.extensionName, required) == 0;
    });
  });
}

bool PhysicalDeviceSelector::_supportsSurface(VkPhysicalDevice device) const {
  uint32_t formatCount = 0;
  auto result = vkGetPhysicalDeviceSurfaceFormatsKHR(device, _surface, &formatCount, nullptr);
  if (result != VK_SUCCESS) throw RendererError("failed to query surface formats!", result);
  uint32_t presentModeCount = 0;
  result = vkGetPhysicalDeviceSurfacePresentModesKHR(device, _surface, &presentModeCount, nullptr);
  if (result != VK_SUCCESS) throw RendererError("failed to query surface present modes!", result);

  return formatCount > 0 && presentModeCount > 0;
}

bool PhysicalDeviceSelector::_supportsStorageSurfaceFormat(VkPhysicalDevice device) const {
  uint32_t formatCount = 0;
  auto result = vkGetPhysicalDeviceSurfaceFormatsKHR(device, _surface, &formatCount, nullptr);
  if (result != VK_SUCCESS) throw RendererError("failed to query surface formats!", result);
  std::vector<VkSurfaceFormatKHR> formats(formatCount);
  result = vkGetPhysicalDeviceSurfaceFormatsKHR(device, _surface, &formatCount, formats.data());
  if (result != VK_SUCCESS && result != VK_INCOMPLETE) throw RendererError("failed to query surface formats!", result);
  formats.resize(formatCount);

  return std::ranges::any_of(formats, [device](const VkSurfaceFormatKHR& format) {
    return supportsStorageImage(device, format.format);
  });
}

std::optional<PhysicalDeviceCandidate> PhysicalDeviceSelector::evaluate(VkPhysicalDevice device) const {
  PhysicalDeviceCandidate candidate{.device = device};
  vkGetPhysicalDeviceProperties(device, &candidate.properties);
  const char* name = candidate.properties.deviceName;

  if (candidate.properties.apiVersion < VK_API_VERSION_1_3) {
    _logger->debug("device", "{} rejected: Vulkan 1.3 is not supported", name);
    return std::nullopt;
  }
  vkGetPhysicalDeviceFeatures(device, &candidate.features);
  // raymarch.comp writes the swapchain image through an image2D without a format qualifier
  if (candidate.features.shaderStorageImageWriteWithoutFormat != VK_TRUE) {
    _logger->debug("device", "{} rejected: shaderStorageImageWriteWithoutFormat is not supported", name);
    return std::nullopt;
  }
  if (!_supportsExtensions(device)) {
    _logger->debug("device", "{} rejected: missing {}", name, VK_KHR_SWAPCHAIN_EXTENSION_NAME);
    return std::nullopt;
  }
  if (!_supportsSurface(device)) {
    _logger->debug("device", "{} rejected: no surface formats or present modes", name);
    return std::nullopt;
  }
  if (!_supportsStorageSurfaceFormat(device)) {
    _logger->debug("device", "{} rejected: no surface format can be a storage image", name);
    return std::nullopt;
  }
  auto queueFamilies = assignQueueFamilies(_getQueueFamilies(device));
  if (!queueFamilies) {
    _logger->debug("device", "{} rejected: no queue family for every role", name);
    return std::nullopt;
  }

  candidate.queueFamilies = *queueFamilies;
  candidate.score = scoreDeviceType(candidate.properties.deviceType);
  vkGetPhysicalDeviceMemoryProperties(device, &candidate.memoryProperties);
  _logger->debug("device", "{} accepted with score {}", name, candidate.score);
  return candidate;
}

PhysicalDeviceCandidate PhysicalDeviceSelector::select() const {
  uint32_t deviceCount = 0;
  auto result = vkEnumeratePhysicalDevices(_instance, &deviceCount, nullptr);
  if (result != VK_SUCCESS) throw RendererError("failed to enumerate physical devices!", result);
  std::vector<VkPhysicalDevice> devices(deviceCount);
  result = vkEnumeratePhysicalDevices(_instance, &deviceCount, devices.data());
  if (result != VK_SUCCESS && result != VK_INCOMPLETE)
    throw RendererError("failed to enumerate physical devices!", result);
  devices.resize(deviceCount);

  std::optional<PhysicalDeviceCandidate> best;
  for (auto device : devices) {
    auto candidate = evaluate(device);
    if (candidate && (!best || candidate->score > best->score)) best = candidate;
  }

  if (!best) throw NoSuitableDevice("failed to find a suitable GPU!", VK_ERROR_FEATURE_NOT_PRESENT);

  const auto& families = best->queueFamilies;
  const char* name = best->properties.deviceName;
  _logger->info("device", "selected {} (graphics {}, present {}, transfer {}, compute {})", name,
                families.graphics, families.present, families.transfer, families.compute);
  return *best;
}

PhysicalDeviceCandidate Luminary::selectDevice(VkInstance instance, VkSurfaceKHR surface, const Logger& logger) {
  return PhysicalDeviceSelector(instance, surface, logger).select();
}
