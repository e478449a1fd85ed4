module;
#include <glm/glm.hpp>
#include <charconv>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>
module Settings;
using namespace Luminary;

namespace {
int parseDimension(std::string_view name, std::string_view value) {
  int result = 0;
  auto [end, error] = std::from_chars(value.data(), value.data() + value.size(), result);
  if (error != std::errc() || end != value.data() + value.size() || result <= 0)
    throw std::invalid_argument(std::string(name) + " must be a positive integer, got '" + std::string(value) + "'");
  return result;
}
}  // namespace

Settings Settings::fromEnvironment(Settings defaults) {
  Settings settings = defaults;
  if (auto value = std::getenv("LUMINARY_LOG_LEVEL")) {
    auto level = parseLogLevel(value);
    if (!level) throw std::invalid_argument("LUMINARY_LOG_LEVEL has unknown level '" + std::string(value) + "'");
    settings.logLevel = *level;
  }
  if (auto value = std::getenv("LUMINARY_VALIDATION")) {
    std::string_view flag = value;
    settings.validation = !(flag == "0" || flag == "false" || flag == "off");
  }
  if (auto value = std::getenv("LUMINARY_WIDTH")) settings.resolution.x = parseDimension("LUMINARY_WIDTH", value);
  if (auto value = std::getenv("LUMINARY_HEIGHT")) settings.resolution.y = parseDimension("LUMINARY_HEIGHT", value);
  if (auto value = std::getenv("LUMINARY_SHADER")) settings.shaderPath = value;

  return settings;
}
