module;
#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>
#include <limits>
module Flycam;
using namespace Luminary;

namespace {
// Vulkan clip space has Y pointing down
constexpr glm::vec3 kUp{0.f, -1.f, 0.f};
}  // namespace

Flycam::Flycam(float sensitivity) noexcept : _sensitivity(sensitivity) {}

void Flycam::move(glm::vec3 delta) noexcept {
  auto rotation = glm::mat3(glm::rotate(glm::mat4(1.f), _yaw, glm::vec3(0.f, 1.f, 0.f)));
  _position += rotation * delta;
}

void Flycam::rotate(glm::vec2 delta) noexcept {
  _yaw -= delta.x * _sensitivity;
  _pitch += delta.y * _sensitivity;
  auto limit = glm::half_pi<float>() - std::numeric_limits<float>::epsilon();
  _pitch = std::clamp(_pitch, -limit, limit);
}

glm::vec3 Flycam::getPosition() const noexcept { return _position; }

float Flycam::getYaw() const noexcept { return _yaw; }

float Flycam::getPitch() const noexcept { return _pitch; }

glm::vec3 Flycam::getDirection() const noexcept {
  return {glm::sin(_yaw) * glm::cos(_pitch), glm::sin(_pitch), glm::cos(_yaw) * glm::cos(_pitch)};
}

CameraConstants Flycam::getConstants() const noexcept {
  auto forward = getDirection();
  auto right = glm::normalize(glm::cross(forward, kUp));
  auto up = glm::cross(right, forward);
  return {.position = glm::vec4(_position, 1.f),
          .forward = glm::vec4(forward, 0.f),
          .right = glm::vec4(right, 0.f),
          .up = glm::vec4(up, 0.f)};
}
