#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
#include <glm/glm.hpp>
#include <chrono>
#include <cstdio>
#include <exception>
import Error;
import Flycam;
import FrameCounter;
import Logger;
import Renderer;
import Settings;
import Window;

namespace {
// camera space movement, y points up on screen which is -Y in Vulkan
glm::vec3 getMovement(const Luminary::Window& window) {
  glm::vec3 movement(0.f);
  if (window.isKeyPressed(GLFW_KEY_W)) movement.z += 1.f;
  if (window.isKeyPressed(GLFW_KEY_S)) movement.z -= 1.f;
  if (window.isKeyPressed(GLFW_KEY_D)) movement.x += 1.f;
  if (window.isKeyPressed(GLFW_KEY_A)) movement.x -= 1.f;
  if (window.isKeyPressed(GLFW_KEY_SPACE)) movement.y -= 1.f;
  if (window.isKeyPressed(GLFW_KEY_LEFT_SHIFT)) movement.y += 1.f;
  return movement;
}
}  // namespace

int main() {
  Luminary::Settings settings;
  try {
    settings = Luminary::Settings::fromEnvironment();
  } catch (const std::exception& error) {
    std::fprintf(stderr, "invalid configuration: %s\n", error.what());
    return 1;
  }

  Luminary::ConsoleLogger logger(settings.logLevel);
  Luminary::Window window(settings.resolution, settings.applicationName);
  try {
    window.initialize();
    Luminary::Renderer renderer(window, settings, logger);
    Luminary::Flycam flycam(settings.cameraSensitivity);
    Luminary::FrameCounter frameCounter(
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<float>(settings.fpsInterval)));

    window.setCursorCaptured(true);
    auto cursor = window.getCursorPosition();
    auto lastTime = std::chrono::steady_clock::now();
    while (!window.shouldClose()) {
      window.pollEvents();
      if (window.isKeyPressed(GLFW_KEY_ESCAPE)) window.close();

      auto now = std::chrono::steady_clock::now();
      float deltaTime = std::chrono::duration<float>(now - lastTime).count();
      lastTime = now;

      auto position = window.getCursorPosition();
      flycam.rotate(glm::vec2(position - cursor));
      cursor = position;
      flycam.move(getMovement(window) * settings.cameraSpeed * deltaTime);

      renderer.setCamera(flycam.getConstants());
      renderer.drawFrame();
      if (auto fps = frameCounter.next(now)) logger.info("fps", "{:.1f} FPS", *fps);
    }
  } catch (const Luminary::RendererError& error) {
    logger.error("main", "renderer failed: {}", error.what());
    return 1;
  } catch (const std::exception& error) {
    logger.error("main", "{}", error.what());
    return 1;
  }

  return 0;
}
