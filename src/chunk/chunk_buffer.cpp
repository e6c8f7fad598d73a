#include "chunk/chunk_buffer.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include "config/config.hpp"

namespace mailchunk {
namespace chunk {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ChunkBuffer::ChunkBuffer() : capacity_(config::ChunkSaverConfig::DEFAULT_CHUNK_MAX_BYTES) {}


//==============================================
// CONFIGURATION
//==============================================

void ChunkBuffer::cap_to(std::size_t max_bytes) {
  capacity_ = max_bytes > 0 ? max_bytes : config::ChunkSaverConfig::DEFAULT_CHUNK_MAX_BYTES;
  BOOST_LOG_TRIVIAL(debug) << "Chunk buffer: Capped to " << capacity_ << " bytes";
}

void ChunkBuffer::set_database(store::StoragePtr database) {
  database_ = std::move(database);
}

void ChunkBuffer::current_part(const mail::Part& part) {
  part_id_ = part.node;
  content_type_ = part.content_type();
}


//==============================================
// BUFFER OPERATIONS
//==============================================

std::size_t ChunkBuffer::write(std::string_view data) {
  std::size_t written = 0;
  while (written < data.size()) {
    std::size_t room = capacity_ - buf_.size();
    std::size_t take = std::min(room, data.size() - written);
    buf_.append(data.data() + written, take);
    written += take;

    if (buf_.size() >= capacity_) {
      flush();
    }
  }
  return written;
}

void ChunkBuffer::flush() {
  if (buf_.empty()) {
    return;
  }
  if (!database_) {
    BOOST_LOG_TRIVIAL(error) << "Chunk buffer: Flush without a storage engine";
    throw store::StorageError("Chunk buffer: No storage engine set");
  }

  store::ChunkDescriptor descriptor;
  descriptor.hash = store::hash_chunk(buf_);
  descriptor.size = buf_.size();
  descriptor.part_id = part_id_;
  descriptor.content_type = content_type_;

  bool existed = false;
  try {
    existed = database_->add_chunk(descriptor.hash, buf_);
  } catch (const store::StorageError& e) {
    // The chunk is lost, the next flush starts from an empty buffer
    BOOST_LOG_TRIVIAL(error) << "Chunk buffer: Dropping " << buf_.size() << " bytes: " << e.what();
    buf_.clear();
    throw;
  }
  BOOST_LOG_TRIVIAL(debug) << "Chunk buffer: Flushed " << descriptor.size << " bytes of part '"
                           << part_id_ << "' as " << store::to_hex(descriptor.hash)
                           << (existed ? " (duplicate)" : " (new)");

  info_.chunks.push_back(std::move(descriptor));
  buf_.clear();
}

void ChunkBuffer::reset() {
  info_.chunks.clear();
  buf_.clear();
  part_id_.clear();
  content_type_.clear();
}

} // namespace chunk
} // namespace mailchunk
