module;
#include <volk.h>
#include <array>
#include <cstdint>
#include <vector>
export module Device;
import Logger;
import PhysicalDevice;

export namespace Luminary {
// one entry per distinct family, sorted by family index, one queue each
std::vector<VkDeviceQueueCreateInfo> getQueueCreateInfos(const QueueFamilyAssignment& queueFamilies,
                                                         const float* priority);

class Device final {
 private:
  PhysicalDeviceCandidate _candidate;
  VkDevice _device = VK_NULL_HANDLE;
  std::array<VkQueue, 4> _queues{};

 public:
  Device(const PhysicalDeviceCandidate& candidate, const Logger& logger);
  Device(const Device&) = delete;
  Device& operator=(const Device&) = delete;
  Device(Device&&) = delete;
  Device& operator=(Device&&) = delete;

  void waitIdle() const;
  VkDevice getLogicalDevice() const noexcept;
  VkPhysicalDevice getPhysicalDevice() const noexcept;
  VkQueue getQueue(QueueType type) const noexcept;
  uint32_t getQueueIndex(QueueType type) const noexcept;
  const PhysicalDeviceCandidate& getCandidate() const noexcept;
  ~Device();
};
}  // namespace Luminary
