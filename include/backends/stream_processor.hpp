#pragma once

#include <cstddef>
#include <string_view>
#include "mail/envelope.hpp"

namespace mailchunk {
namespace backends {

// A stage that consumes a message byte stream
class StreamProcessor {
public:
  virtual ~StreamProcessor() = default;
  // Returns the number of bytes accepted, throws on failure
  virtual std::size_t write(std::string_view data) = 0;
};

// A processor wrapped around the next stage of the pipeline.
// open() starts a transaction, close() ends it.
class StreamDecorator : public StreamProcessor {
public:
  void decorate(StreamProcessor& next) { next_ = &next; }

  virtual void open(mail::Envelope& envelope) = 0;
  virtual void close() = 0;

protected:
  // Forwards to the next stage, or swallows the bytes at the end of a chain
  std::size_t write_next(std::string_view data) {
    return next_ ? next_->write(data) : data.size();
  }

private:
  StreamProcessor* next_ = nullptr;
};

} // namespace backends
} // namespace mailchunk
