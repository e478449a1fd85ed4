module;
#include <volk.h>
#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
module Surface;
import Error;
using namespace Luminary;

Surface::Surface(const Window& window, const Instance& instance) : _instance(&instance) {
  auto result = glfwCreateWindowSurface(instance.getInstance(), window.getWindow(), nullptr, &_surface);
  if (result != VK_SUCCESS) {
    throw SurfaceCreationFailed("failed to create window surface!", result);
  }
}

VkSurfaceKHR Surface::getSurface() const noexcept { return _surface; }

Surface::~Surface() { vkDestroySurfaceKHR(_instance->getInstance(), _surface, nullptr); }
