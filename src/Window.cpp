module;
#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
#include <glm/glm.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
module Window;
using namespace Luminary;

Window::Window(glm::ivec2 resolution, std::string title) noexcept
    : _resolution(resolution),
      _title(std::move(title)) {}

void Window::initialize() {
  if (glfwInit() != GLFW_TRUE) throw std::runtime_error("failed to initialize GLFW!");
  if (glfwVulkanSupported() != GLFW_TRUE) throw std::runtime_error("GLFW can't find a Vulkan loader!");
  glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
  _window = glfwCreateWindow(_resolution.x, _resolution.y, _title.c_str(), nullptr, nullptr);
  if (_window == nullptr) throw std::runtime_error("failed to create window!");

  glfwSetWindowUserPointer(_window, this);
  glfwSetFramebufferSizeCallback(_window, [](GLFWwindow* window, int width, int height) {
    auto self = static_cast<Window*>(glfwGetWindowUserPointer(window));
    self->_resized = true;
  });
}

glm::ivec2 Window::getResolution() const noexcept {
  glm::ivec2 resolution = {0, 0};
  if (_window) {
    glfwGetFramebufferSize(_window, &resolution.x, &resolution.y);
  }
  return resolution;
}

std::vector<const char*> Window::getRequiredExtensions() const {
  uint32_t count = 0;
  auto extensions = glfwGetRequiredInstanceExtensions(&count);
  if (extensions == nullptr) throw std::runtime_error("GLFW can't report required instance extensions!");
  return std::vector<const char*>(extensions, extensions + count);
}

bool Window::shouldClose() const noexcept { return glfwWindowShouldClose(_window); }

void Window::close() noexcept { glfwSetWindowShouldClose(_window, GLFW_TRUE); }

void Window::pollEvents() const noexcept { glfwPollEvents(); }

void Window::waitEvents() const noexcept { glfwWaitEvents(); }

bool Window::isKeyPressed(int key) const noexcept { return glfwGetKey(_window, key) == GLFW_PRESS; }

glm::dvec2 Window::getCursorPosition() const noexcept {
  glm::dvec2 position{0.0, 0.0};
  glfwGetCursorPos(_window, &position.x, &position.y);
  return position;
}

void Window::setCursorCaptured(bool captured) noexcept {
  glfwSetInputMode(_window, GLFW_CURSOR, captured ? GLFW_CURSOR_DISABLED : GLFW_CURSOR_NORMAL);
}

bool Window::consumeResized() noexcept { return std::exchange(_resized, false); }

GLFWwindow* Window::getWindow() const noexcept { return _window; }

Window::~Window() {
  if (_window) glfwDestroyWindow(_window);
  glfwTerminate();
}
