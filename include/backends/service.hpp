#pragma once

#include <functional>
#include <mutex>
#include <vector>
#include "config/config.hpp"

namespace mailchunk {
namespace backends {

using InitializerFn = std::function<void(const config::BackendConfig&)>;
using ShutdownerFn = std::function<void()>;

// Lifecycle hooks of the backend components, run once at startup and once at
// teardown. Constructed by the process and handed to whoever registers hooks.
class Service {
public:

  // ---- HOOK REGISTRATION ----
  void add_initializer(InitializerFn initializer);
  void add_shutdowner(ShutdownerFn shutdowner);


  // ---- LIFECYCLE ----
  // Runs initializers in registration order, the first failure propagates
  void initialize(const config::BackendConfig& backend_config);
  // Runs every shutdowner, then rethrows the first failure if any
  void shutdown();

private:
  // ---- PARAMETERS ----
  std::mutex mutex_;
  std::vector<InitializerFn> initializers_;
  std::vector<ShutdownerFn> shutdowners_;
};

} // namespace backends
} // namespace mailchunk
