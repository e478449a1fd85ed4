module;
#include <volk.h>
#include <cstdint>
#include <optional>
#include <vector>
export module PhysicalDevice;
import Logger;

export namespace Luminary {
enum class QueueType { Graphics, Present, Transfer, Compute };

struct QueueFamilyAssignment {
  uint32_t graphics;
  uint32_t present;
  uint32_t transfer;
  uint32_t compute;

  uint32_t get(QueueType type) const noexcept;
};

// what the selector needs to know about one queue family
struct QueueFamilyCapability {
  VkQueueFlags flags;
  bool presentSupported;
};

struct PhysicalDeviceCandidate {
  VkPhysicalDevice device;
  VkPhysicalDeviceProperties properties;
  VkPhysicalDeviceMemoryProperties memoryProperties;
  VkPhysicalDeviceFeatures features;
  int score;
  QueueFamilyAssignment queueFamilies;
};

// number of graphics/compute/transfer bits plus one if the family can present
int getQueueGenerality(const QueueFamilyCapability& family) noexcept;
// requiredFlags == 0 picks by presentation support only. The least general family wins and on equal
// generality the later family replaces the earlier one.
std::optional<uint32_t> pickQueueFamily(const std::vector<QueueFamilyCapability>& families,
                                        VkQueueFlags requiredFlags) noexcept;
std::optional<QueueFamilyAssignment> assignQueueFamilies(const std::vector<QueueFamilyCapability>& families) noexcept;
int scoreDeviceType(VkPhysicalDeviceType type) noexcept;
const std::vector<const char*>& getRequiredDeviceExtensions() noexcept;
// the compute pass writes swapchain images as storage images
bool supportsStorageImage(VkPhysicalDevice device, VkFormat format) noexcept;

class PhysicalDeviceSelector final {
 private:
  VkInstance _instance;
  VkSurfaceKHR _surface;
  const Logger* _logger;

  std::vector<QueueFamilyCapability> _getQueueFamilies(VkPhysicalDevice device) const;
  bool _supportsExtensions(VkPhysicalDevice device) const;
  bool _supportsSurface(VkPhysicalDevice device) const;
  bool _supportsStorageSurfaceFormat(VkPhysicalDevice device) const;

 public:
  PhysicalDeviceSelector(VkInstance instance, VkSurfaceKHR surface, const Logger& logger) noexcept;
  PhysicalDeviceSelector(const PhysicalDeviceSelector&) = delete;
  PhysicalDeviceSelector& operator=(const PhysicalDeviceSelector&) = delete;
  PhysicalDeviceSelector(PhysicalDeviceSelector&&) = delete;
  PhysicalDeviceSelector& operator=(PhysicalDeviceSelector&&) = delete;

  // std::nullopt if the device misses any mandatory capability
  std::optional<PhysicalDeviceCandidate> evaluate(VkPhysicalDevice device) const;
  // highest score wins, ties keep the first enumerated device
  PhysicalDeviceCandidate select() const;
};

PhysicalDeviceCandidate selectDevice(VkInstance instance, VkSurfaceKHR surface, const Logger& logger);
}  // namespace Luminary
