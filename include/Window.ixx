module;
#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
#include <glm/glm.hpp>
#include <string>
#include <vector>
export module Window;

export namespace Luminary {
class Window final {
 private:
  GLFWwindow* _window = nullptr;
  glm::ivec2 _resolution;
  std::string _title;
  bool _resized = false;

 public:
  Window(glm::ivec2 resolution, std::string title) noexcept;
  Window(const Window&) = delete;
  Window& operator=(const Window&) = delete;
  Window(Window&&) = delete;
  Window& operator=(Window&&) = delete;

  void initialize();
  // framebuffer size in pixels, {0, 0} while minimized
  glm::ivec2 getResolution() const noexcept;
  std::vector<const char*> getRequiredExtensions() const;
  bool shouldClose() const noexcept;
  void close() noexcept;
  void pollEvents() const noexcept;
  void waitEvents() const noexcept;
  bool isKeyPressed(int key) const noexcept;
  glm::dvec2 getCursorPosition() const noexcept;
  void setCursorCaptured(bool captured) noexcept;
  // returns and clears the framebuffer resize flag
  bool consumeResized() noexcept;
  // glfw API expects non-const window pointer
  GLFWwindow* getWindow() const noexcept;
  ~Window();
};
}  // namespace Luminary
