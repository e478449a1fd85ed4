module;
#include <volk.h>
#include <VkBootstrap.h>
#include <string>
#include <string_view>
#include <vector>
module Instance;
import Error;
using namespace Luminary;

namespace {
VKAPI_ATTR VkBool32 VKAPI_CALL debugCallbackUtils(VkDebugUtilsMessageSeverityFlagBitsEXT messageSeverity,
                                                  VkDebugUtilsMessageTypeFlagsEXT messageType,
                                                  const VkDebugUtilsMessengerCallbackDataEXT* pCallbackData,
                                                  void* pUserData) {
  auto logger = static_cast<const Logger*>(pUserData);
  auto level = LogLevel::Debug;
  if (messageSeverity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT)
    level = LogLevel::Error;
  else if (messageSeverity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT)
    level = LogLevel::Warning;
  else if (messageSeverity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_INFO_BIT_EXT)
    level = LogLevel::Info;

  std::string_view category = "validation";
  if (messageType & VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT)
    category = "performance";
  else if (messageType & VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT)
    category = "general";
  logger->log(level, category, pCallbackData->pMessage);
  return VK_FALSE;
}
}  // namespace

Instance::Instance(std::string_view name,
                   bool validation,
                   const std::vector<const char*>& extensions,
                   const Logger& logger)
    : _logger(&logger) {
  auto sts = volkInitialize();
  if (sts != VK_SUCCESS) throw RendererError("Can't initialize Vulkan Loader", sts);
  // surface extensions come from the windowing layer, so stop vkb from guessing them
  vkb::InstanceBuilder builder(vkGetInstanceProcAddr);
  builder.set_headless(true);
  builder.enable_extensions(extensions.size(), extensions.data());
  auto systemInfoResult = vkb::SystemInfo::get_system_info(vkGetInstanceProcAddr);
  if (!systemInfoResult) throw RendererError(systemInfoResult.error().message());
  auto systemInfo = systemInfoResult.value();
  if (validation && !systemInfo.validation_layers_available)
    logger.warning("instance", "validation requested but VK_LAYER_KHRONOS_validation is not available");
  // debug utils is a newer API, can be not supported. Includes validation layers + API for code instrumentation.
  if (validation && systemInfo.validation_layers_available) {
    builder.enable_validation_layers();
    builder.add_validation_feature_enable(VK_VALIDATION_FEATURE_ENABLE_SYNCHRONIZATION_VALIDATION_EXT);
    if (systemInfo.debug_utils_available) {
      builder.set_debug_messenger_type(VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                                       VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
                                       VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT);
      builder.set_debug_messenger_severity(VK_DEBUG_UTILS_MESSAGE_SEVERITY_VERBOSE_BIT_EXT |
                                           VK_DEBUG_UTILS_MESSAGE_SEVERITY_INFO_BIT_EXT |
                                           VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                                           VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT);
      builder.set_debug_callback(debugCallbackUtils);
      builder.set_debug_callback_user_data_pointer(const_cast<Logger*>(_logger));
      _debugUtils = true;
    }
  }
  std::string applicationName(name);
  auto instanceResult = builder.set_app_name(applicationName.c_str())
                            .set_engine_name("luminary")
                            .require_api_version(1, 3, 0)
                            .build();
  if (!instanceResult)
    throw RendererError("Failed to create Vulkan instance. Error: " + instanceResult.error().message(),
                        instanceResult.vk_result());

  _instance = instanceResult.value();
  volkLoadInstance(_instance.instance);
  logger.info("instance", "Vulkan instance created, validation {}", _debugUtils ? "on" : "off");
}

bool Instance::isDebug() const noexcept { return _debugUtils; }

VkInstance Instance::getInstance() const noexcept { return _instance.instance; }

const vkb::Instance& Instance::getBootstrapInstance() const noexcept { return _instance; }

Instance::~Instance() { vkb::destroy_instance(_instance); }
