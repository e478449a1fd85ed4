module;
#include <chrono>
#include <cstdint>
#include <optional>
module FrameCounter;
using namespace Luminary;

FrameCounter::FrameCounter(std::chrono::steady_clock::duration interval,
                           std::chrono::steady_clock::time_point start) noexcept
    : _interval(interval),
      _lastTime(start) {}

std::optional<float> FrameCounter::next(std::chrono::steady_clock::time_point now) noexcept {
  _count++;
  auto elapsed = now - _lastTime;
  if (elapsed < _interval) return std::nullopt;

  auto seconds = std::chrono::duration<double>(elapsed).count();
  auto fps = static_cast<float>(static_cast<double>(_count) / seconds);
  _count = 0;
  _lastTime = now;
  return fps;
}
