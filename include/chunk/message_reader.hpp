#pragma once

#include <cstddef>
#include <ostream>
#include "store/storage.hpp"

namespace mailchunk {
namespace chunk {

// Reassembles a saved message from its manifest
class MessageReader {
public:
  explicit MessageReader(store::StoragePtr storage);

  // Streams the message bytes into output and returns how many were written.
  // Throws StorageError when the message is still open, a chunk is missing or
  // sizes disagree with the manifest.
  std::size_t read(store::MessageId id, std::ostream& output) const;

private:
  store::StoragePtr storage_;
};

} // namespace chunk
} // namespace mailchunk
