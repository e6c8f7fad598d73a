#ifndef MAILCHUNK_CHUNK_BUFFER_HPP
#define MAILCHUNK_CHUNK_BUFFER_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include "mail/mime_part.hpp"
#include "store/storage.hpp"

namespace mailchunk {
namespace chunk {

// Accumulates the chunk currently being built. On flush the chunk is hashed,
// handed to the storage dedup operation and recorded in the message manifest.
// One instance serves one message at a time.
class ChunkBuffer {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ChunkBuffer();


  // ---- CONFIGURATION ----
  // Sets the maximum chunk size, 0 restores the default
  void cap_to(std::size_t max_bytes);
  void set_database(store::StoragePtr database);
  // Subsequent writes, up to the next flush, belong to part
  void current_part(const mail::Part& part);


  // ---- BUFFER OPERATIONS ----
  // Appends data. Whenever the buffer reaches its cap the chunk is flushed and
  // the remaining bytes start a new chunk. Returns the number of bytes taken.
  std::size_t write(std::string_view data);
  // Closes the current chunk. No-op when nothing is buffered. When storage
  // fails the buffered bytes are discarded and the error is rethrown.
  void flush();
  // Drops the manifest and any buffered bytes, ready for the next message
  void reset();


  // ---- GETTERS ----
  const store::Manifest& info() const { return info_; }
  std::size_t capacity() const { return capacity_; }
  std::size_t buffered() const { return buf_.size(); }

private:
  // ---- PARAMETERS ----
  std::string buf_;
  std::size_t capacity_;
  store::StoragePtr database_;
  store::Manifest info_;
  std::string part_id_;
  std::string content_type_;
};

} // namespace chunk
} // namespace mailchunk

#endif // MAILCHUNK_CHUNK_BUFFER_HPP
