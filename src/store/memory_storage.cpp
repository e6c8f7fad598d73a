#include "store/memory_storage.hpp"
#include <boost/log/trivial.hpp>
#include <zlib.h>

namespace mailchunk {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

MemoryStorage::MemoryStorage(int compress_level) : compress_level_(compress_level) {}


//==============================================
// LIFECYCLE
//==============================================

void MemoryStorage::initialize(const config::BackendConfig&) {
  if (compress_level_ < Z_DEFAULT_COMPRESSION || compress_level_ > Z_BEST_COMPRESSION) {
    BOOST_LOG_TRIVIAL(error) << "Memory storage: Invalid compress level: " << compress_level_;
    throw config::ConfigurationError("Memory storage: compress level must be between -1 and 9, got " +
                                     std::to_string(compress_level_));
  }
  BOOST_LOG_TRIVIAL(info) << "Memory storage: Initialized with compress level " << compress_level_;
}

void MemoryStorage::shutdown() {
  std::lock_guard<std::mutex> lock(mutex_);
  BOOST_LOG_TRIVIAL(info) << "Memory storage: Shutting down with " << chunks_.size()
                          << " chunks and " << messages_.size() << " messages";
}


//==============================================
// STORAGE OPERATIONS
//==============================================

MessageId MemoryStorage::open_message(const std::string& from, const std::string& helo,
                                      const std::string& recipient,
                                      const boost::asio::ip::address& remote_ip,
                                      const std::string& return_path, bool tls) {
  Email email;
  email.id = next_id_.fetch_add(1);
  email.from = from;
  email.helo = helo;
  email.recipient = recipient;
  email.remote_ip = remote_ip.to_string();
  email.return_path = return_path;
  email.tls = tls;

  std::lock_guard<std::mutex> lock(mutex_);
  messages_.emplace(email.id, email);
  BOOST_LOG_TRIVIAL(debug) << "Memory storage: Opened message " << email.id;
  return email.id;
}

void MemoryStorage::close_message(MessageId id, std::size_t size, const Manifest& manifest,
                                  const std::string& subject, const std::string& queued_id,
                                  const std::string& to, const std::string& from) {
  if (size != manifest.total_size()) {
    BOOST_LOG_TRIVIAL(error) << "Memory storage: Size " << size << " of message " << id
                             << " does not match manifest total " << manifest.total_size();
    throw StorageError("Memory storage: Message size does not match manifest");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = messages_.find(id);
  if (it == messages_.end()) {
    throw StorageError("Memory storage: Unknown message " + std::to_string(id));
  }
  Email& email = it->second;
  if (email.closed) {
    throw StorageError("Memory storage: Message already closed " + std::to_string(id));
  }

  email.closed = true;
  email.size = size;
  email.manifest = manifest;
  email.subject = subject;
  email.queued_id = queued_id;
  email.header_to = to;
  email.header_from = from;
  BOOST_LOG_TRIVIAL(debug) << "Memory storage: Closed message " << id << " with "
                           << manifest.chunks.size() << " chunks";
}

bool MemoryStorage::add_chunk(const HashKey& hash, std::string_view data) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chunks_.find(hash);
    if (it != chunks_.end()) {
      ++it->second.references;
      return true;
    }
  }

  // Compress outside the lock, then re-check: another writer may have
  // inserted the same hash in the meantime
  std::string compressed = compress(data);

  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = chunks_.try_emplace(hash);
  if (!inserted) {
    ++it->second.references;
    return true;
  }
  it->second.compressed = std::move(compressed);
  it->second.size = data.size();
  it->second.references = 1;
  return false;
}

StoredChunk MemoryStorage::get_chunk(const HashKey& hash) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = chunks_.find(hash);
  if (it == chunks_.end()) {
    throw StorageError("Memory storage: Chunk not found: " + to_hex(hash));
  }

  StoredChunk chunk;
  chunk.hash = hash;
  chunk.size = it->second.size;
  chunk.references = it->second.references;
  chunk.data = decompress(it->second.compressed, it->second.size);
  return chunk;
}

Email MemoryStorage::get_message(MessageId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = messages_.find(id);
  if (it == messages_.end()) {
    throw StorageError("Memory storage: Unknown message " + std::to_string(id));
  }
  return it->second;
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::size_t MemoryStorage::chunk_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.size();
}

std::size_t MemoryStorage::message_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return messages_.size();
}


//==============================================
// COMPRESSION SUPPORT
//==============================================

std::string MemoryStorage::compress(std::string_view data) const {
  uLongf out_len = compressBound(static_cast<uLong>(data.size()));
  std::string out(out_len, '\0');
  int status = compress2(reinterpret_cast<Bytef*>(out.data()), &out_len,
                         reinterpret_cast<const Bytef*>(data.data()),
                         static_cast<uLong>(data.size()), compress_level_);
  if (status != Z_OK) {
    BOOST_LOG_TRIVIAL(error) << "Memory storage: compress2 failed with status " << status;
    throw StorageError("Memory storage: Failed to compress chunk");
  }
  out.resize(out_len);
  return out;
}

std::string MemoryStorage::decompress(const std::string& compressed, std::size_t size) const {
  std::string out(size, '\0');
  uLongf out_len = static_cast<uLongf>(size);
  int status = uncompress(reinterpret_cast<Bytef*>(out.data()), &out_len,
                          reinterpret_cast<const Bytef*>(compressed.data()),
                          static_cast<uLong>(compressed.size()));
  if (status != Z_OK || out_len != size) {
    BOOST_LOG_TRIVIAL(error) << "Memory storage: uncompress failed with status " << status;
    throw StorageError("Memory storage: Failed to decompress chunk");
  }
  return out;
}

} // namespace store
} // namespace mailchunk
