#include "backends/stream_registry.hpp"
#include <boost/log/trivial.hpp>
#include <exception>
#include <stdexcept>

namespace mailchunk {
namespace backends {

//==============================================
// REGISTRY
//==============================================

void StreamRegistry::add(const std::string& name, StreamFactory factory) {
  BOOST_LOG_TRIVIAL(debug) << "Stream registry: Registered stream processor: " << name;
  factories_[name] = std::move(factory);
}

bool StreamRegistry::has(const std::string& name) const {
  return factories_.count(name) > 0;
}

std::unique_ptr<StreamDecorator> StreamRegistry::create(const std::string& name) const {
  auto it = factories_.find(name);
  if (it == factories_.end()) {
    BOOST_LOG_TRIVIAL(error) << "Stream registry: Unknown stream processor: " << name;
    throw std::out_of_range("Stream registry: Unknown stream processor: " + name);
  }
  return it->second();
}


//==============================================
// CHAIN
//==============================================

StreamChain::StreamChain(const StreamRegistry& registry, const std::vector<std::string>& names,
                         StreamProcessor& sink)
  : sink_(sink) {
  for (const auto& name : names) {
    stages_.push_back(registry.create(name));
  }

  // Each stage forwards to the one after it, the last one to the sink
  for (std::size_t i = 0; i < stages_.size(); ++i) {
    if (i + 1 < stages_.size()) {
      stages_[i]->decorate(*stages_[i + 1]);
    } else {
      stages_[i]->decorate(sink_);
    }
  }
}

void StreamChain::open(mail::Envelope& envelope) {
  for (auto& stage : stages_) {
    stage->open(envelope);
  }
}

std::size_t StreamChain::write(std::string_view data) {
  if (stages_.empty()) {
    return sink_.write(data);
  }
  return stages_.front()->write(data);
}

void StreamChain::close() {
  std::exception_ptr first_error;
  for (auto& stage : stages_) {
    try {
      stage->close();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Stream chain: Close failed: " << e.what();
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
