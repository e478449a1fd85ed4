module;
#include <volk.h>
#include <VkBootstrap.h>
#include <string_view>
#include <vector>
export module Instance;
import Logger;

export namespace Luminary {
class Instance final {
 private:
  vkb::Instance _instance;
  const Logger* _logger;
  bool _debugUtils = false;

 public:
  // extensions are the ones the windowing layer needs for surface creation
  Instance(std::string_view name,
           bool validation,
           const std::vector<const char*>& extensions,
           const Logger& logger);
  Instance(const Instance&) = delete;
  Instance& operator=(const Instance&) = delete;
  Instance(Instance&&) = delete;
  Instance& operator=(Instance&&) = delete;

  bool isDebug() const noexcept;
  VkInstance getInstance() const noexcept;
  const vkb::Instance& getBootstrapInstance() const noexcept;
  ~Instance();
};
}  // namespace Luminary
