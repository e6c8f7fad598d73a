#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "backends/stream_processor.hpp"

namespace mailchunk {
namespace backends {

// Builds a fresh decorator for one transaction
using StreamFactory = std::function<std::unique_ptr<StreamDecorator>()>;

// Name -> factory table, filled once during process initialization
class StreamRegistry {
public:
  void add(const std::string& name, StreamFactory factory);
  bool has(const std::string& name) const;
  // Throws std::out_of_range for unknown names
  std::unique_ptr<StreamDecorator> create(const std::string& name) const;

private:
  std::map<std::string, StreamFactory> factories_;
};

// An ordered chain of decorators ending in a sink. The first named stage sees
// the bytes first.
class StreamChain {
public:
  StreamChain(const StreamRegistry& registry, const std::vector<std::string>& names,
              StreamProcessor& sink);

  void open(mail::Envelope& envelope);
  std::size_t write(std::string_view data);
  // Closes every stage, then rethrows the first failure if any
  void close();

  std::size_t size() const { return stages_.size(); }

private:
  std::vector<std::unique_ptr<StreamDecorator>> stages_;
  StreamProcessor& sink_;
};

} // namespace backends
} // namespace mailchunk
