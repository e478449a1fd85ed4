module;
#include <glm/glm.hpp>
export module Flycam;

export namespace Luminary {
// push constant block of the ray marching shader, std430 layout
struct CameraConstants {
  glm::vec4 position;
  glm::vec4 forward;
  glm::vec4 right;
  glm::vec4 up;
};

class Flycam final {
 private:
  glm::vec3 _position = glm::vec3(-5.f);
  float _yaw = 0.f;
  float _pitch = 0.f;
  float _sensitivity;

 public:
  Flycam(float sensitivity) noexcept;

  // delta is in camera space: x right, y up (Vulkan -Y), z forward; rotated by yaw only
  void move(glm::vec3 delta) noexcept;
  // cursor delta in pixels
  void rotate(glm::vec2 delta) noexcept;
  glm::vec3 getPosition() const noexcept;
  float getYaw() const noexcept;
  float getPitch() const noexcept;
  glm::vec3 getDirection() const noexcept;
  CameraConstants getConstants() const noexcept;
};
}  // namespace Luminary
