module;
#include <volk.h>
#include <cstdint>
export module Sync;
import Device;

export namespace Luminary {
class Semaphore final {
 private:
  const Device* _device;
  VkSemaphore _semaphore;

 public:
  Semaphore(const Device& device);
  Semaphore(const Semaphore&) = delete;
  Semaphore& operator=(const Semaphore&) = delete;
  Semaphore(Semaphore&&) = delete;
  Semaphore& operator=(Semaphore&&) = delete;

  VkSemaphore getSemaphore() const noexcept;
  ~Semaphore();
};

class Fence final {
 private:
  const Device* _device;
  VkFence _fence;

 public:
  Fence(bool signaled, const Device& device);
  Fence(const Fence&) = delete;
  Fence& operator=(const Fence&) = delete;
  Fence(Fence&&) = delete;
  Fence& operator=(Fence&&) = delete;

  // VK_SUCCESS or VK_TIMEOUT, anything else throws
  VkResult wait(uint64_t timeout) const;
  void reset() const;
  VkFence getFence() const noexcept;
  ~Fence();
};
}  // namespace Luminary
