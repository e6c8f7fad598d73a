#include "chunk/message_reader.hpp"
#include <boost/log/trivial.hpp>

namespace mailchunk {
namespace chunk {

MessageReader::MessageReader(store::StoragePtr storage) : storage_(std::move(storage)) {
  if (!storage_) {
    throw store::StorageError("Message reader: No storage engine set");
  }
}

std::size_t MessageReader::read(store::MessageId id, std::ostream& output) const {
  BOOST_LOG_TRIVIAL(info) << "Message reader: Reading message " << id;

  store::Email email = storage_->get_message(id);
  if (!email.closed) {
    BOOST_LOG_TRIVIAL(error) << "Message reader: Message " << id << " was never finalized";
    throw store::StorageError("Message reader: Message " + std::to_string(id) + " is not closed");
  }

  std::size_t total = 0;
  for (const auto& descriptor : email.manifest.chunks) {
    store::StoredChunk chunk = storage_->get_chunk(descriptor.hash);
    if (chunk.data.size() != descriptor.size) {
      BOOST_LOG_TRIVIAL(error) << "Message reader: Chunk " << store::to_hex(descriptor.hash)
                               << " has " << chunk.data.size() << " bytes, manifest says "
                               << descriptor.size;
      throw store::StorageError("Message reader: Chunk size mismatch in message " + std::to_string(id));
    }
    output.write(chunk.data.data(), static_cast<std::streamsize>(chunk.data.size()));
    total += chunk.data.size();
  }

  if (!output.good()) {
    throw store::StorageError("Message reader: Failed to write to output stream");
  }
  if (total != email.size) {
    BOOST_LOG_TRIVIAL(error) << "Message reader: Message " << id << " reassembled to " << total
                             << " bytes, record says " << email.size;
    throw store::StorageError("Message reader: Size mismatch in message " + std::to_string(id));
  }

  BOOST_LOG_TRIVIAL(info) << "Message reader: Successfully streamed " << total << " bytes for message " << id;
  return total;
}

} // namespace chunk
} // namespace mailchunk
