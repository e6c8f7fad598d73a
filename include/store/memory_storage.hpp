#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include "store/storage.hpp"

namespace mailchunk {
namespace store {

// Map-backed engine for tests and low-durability deployments.
// Chunk payloads are zlib-compressed at compress_level before storing.
class MemoryStorage : public Storage {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit MemoryStorage(int compress_level = 0);
  ~MemoryStorage() override = default;


  // ---- LIFECYCLE ----
  // Validates the compression level, throws ConfigurationError when outside -1..9
  void initialize(const config::BackendConfig& backend_config) override;
  void shutdown() override;


  // ---- STORAGE OPERATIONS ----
  MessageId open_message(const std::string& from, const std::string& helo,
                         const std::string& recipient,
                         const boost::asio::ip::address& remote_ip,
                         const std::string& return_path, bool tls) override;
  void close_message(MessageId id, std::size_t size, const Manifest& manifest,
                     const std::string& subject, const std::string& queued_id,
                     const std::string& to, const std::string& from) override;
  bool add_chunk(const HashKey& hash, std::string_view data) override;
  StoredChunk get_chunk(const HashKey& hash) override;
  Email get_message(MessageId id) override;


  // ---- QUERY OPERATIONS ----
  std::size_t chunk_count() const;
  std::size_t message_count() const;
  int compress_level() const { return compress_level_; }

private:
  struct Entry {
    std::string compressed;
    std::size_t size{0};
    std::uint64_t references{0};
  };

  // ---- PARAMETERS ----
  int compress_level_;
  std::atomic<MessageId> next_id_{1};
  mutable std::mutex mutex_;
  std::map<HashKey, Entry> chunks_;
  std::unordered_map<MessageId, Email> messages_;


  // ---- COMPRESSION SUPPORT ----
  std::string compress(std::string_view data) const;
  std::string decompress(const std::string& compressed, std::size_t size) const;
};

} // namespace store
} // namespace mailchunk
