module;
#include <chrono>
#include <cstdint>
#include <optional>
export module FrameCounter;

export namespace Luminary {
class FrameCounter final {
 private:
  std::chrono::steady_clock::duration _interval;
  std::chrono::steady_clock::time_point _lastTime;
  uint64_t _count = 0;

 public:
  FrameCounter(std::chrono::steady_clock::duration interval,
               std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now()) noexcept;

  // counts one frame, returns the average frames per second once per interval
  std::optional<float> next(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()) noexcept;
};
}  // namespace Luminary
