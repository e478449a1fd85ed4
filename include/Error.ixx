module;
#include <volk.h>
#include <stdexcept>
#include <string>
#include <string_view>
export module Error;

export namespace Luminary {
std::string_view toString(VkResult result) noexcept;

class RendererError : public std::runtime_error {
 private:
  VkResult _result;

 public:
  RendererError(const std::string& message, VkResult result = VK_ERROR_UNKNOWN);
  VkResult getResult() const noexcept;
};

// fatal at startup
class NoSuitableDevice final : public RendererError {
 public:
  using RendererError::RendererError;
};

class DeviceCreationFailed final : public RendererError {
 public:
  using RendererError::RendererError;
};

class SurfaceCreationFailed final : public RendererError {
 public:
  using RendererError::RendererError;
};

class NoSurfaceFormats final : public RendererError {
 public:
  using RendererError::RendererError;
};

// fatal to the current frame
class DrawTimeout final : public RendererError {
 public:
  using RendererError::RendererError;
};

class SwapchainTimeout final : public RendererError {
 public:
  using RendererError::RendererError;
};

class SwapchainNotReady final : public RendererError {
 public:
  using RendererError::RendererError;
};

// recoverable by swapchain recreation
class SwapchainOutOfDate final : public RendererError {
 public:
  using RendererError::RendererError;
};
}  // namespace Luminary
