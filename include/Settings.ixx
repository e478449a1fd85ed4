module;
#include <glm/glm.hpp>
#include <cstdint>
#include <filesystem>
#include <string>
export module Settings;
import Logger;

export namespace Luminary {
// number of frame slots cycled by the scheduler
constexpr int kFramesInFlight = 2;
// local_size_x/local_size_y of the ray marching shader
constexpr uint32_t kWorkgroupSize = 16;

struct Settings {
  std::string applicationName = "luminary";
  glm::ivec2 resolution = {1280, 720};
  bool validation = true;
  LogLevel logLevel = LogLevel::Info;
  // nanoseconds
  uint64_t fenceTimeout = 1'000'000'000;
  uint64_t acquireTimeout = 1'000'000'000;
  std::filesystem::path shaderPath = "shaders/raymarch.comp.spv";
  // seconds between FPS reports
  float fpsInterval = 3.f;
  float cameraSpeed = 8.f;
  float cameraSensitivity = 0.001f;

  // LUMINARY_LOG_LEVEL, LUMINARY_VALIDATION, LUMINARY_WIDTH, LUMINARY_HEIGHT, LUMINARY_SHADER
  static Settings fromEnvironment(Settings defaults = {});
};
}  // namespace Luminary
