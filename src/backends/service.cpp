#include "backends/service.hpp"
#include <boost/log/trivial.hpp>
#include <exception>

namespace mailchunk {
namespace backends {

void Service::add_initializer(InitializerFn initializer) {
  std::lock_guard<std::mutex> lock(mutex_);
  initializers_.push_back(std::move(initializer));
}

void Service::add_shutdowner(ShutdownerFn shutdowner) {
  std::lock_guard<std::mutex> lock(mutex_);
  shutdowners_.push_back(std::move(shutdowner));
}

void Service::initialize(const config::BackendConfig& backend_config) {
  std::vector<InitializerFn> initializers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    initializers = initializers_;
  }

  BOOST_LOG_TRIVIAL(info) << "Service: Running " << initializers.size() << " initializers";
  for (const auto& initializer : initializers) {
    initializer(backend_config);
  }
}

void Service::shutdown() {
  std::vector<ShutdownerFn> shutdowners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdowners = shutdowners_;
  }

  BOOST_LOG_TRIVIAL(info) << "Service: Running " << shutdowners.size() << " shutdowners";

  std::exception_ptr first_error;
  for (const auto& shutdowner : shutdowners) {
    try {
      shutdowner();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Service: Shutdown hook failed: " << e.what();
      if (!first_error) {
        first_error = std::current_exception();
      }
    }
  }

  if (first_error) {
    std::rethrow_exception(first_error);
  }
}

} // namespace backends
} // namespace mailchunk
