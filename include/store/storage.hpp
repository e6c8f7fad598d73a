#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <boost/asio/ip/address.hpp>
#include "config/config.hpp"
#include "store/chunk_types.hpp"

namespace mailchunk {
namespace store {

class StorageError : public std::runtime_error {
public:
  explicit StorageError(const std::string& message) : std::runtime_error(message) {}
};

// Content-addressed, reference-counted chunk store plus message bookkeeping.
// Implementations are shared between transactions and must be thread safe.
class Storage {
public:
  virtual ~Storage() = default;

  // ---- LIFECYCLE ----
  virtual void initialize(const config::BackendConfig& backend_config) = 0;
  virtual void shutdown() = 0;


  // ---- MESSAGE RECORDS ----
  // Creates a message record and returns its id. Ids are never reused.
  virtual MessageId open_message(const std::string& from, const std::string& helo,
                                 const std::string& recipient,
                                 const boost::asio::ip::address& remote_ip,
                                 const std::string& return_path, bool tls) = 0;
  // Finalizes a record. size must equal manifest.total_size().
  virtual void close_message(MessageId id, std::size_t size, const Manifest& manifest,
                             const std::string& subject, const std::string& queued_id,
                             const std::string& to, const std::string& from) = 0;


  // ---- CHUNKS ----
  // Atomic check-and-increment-or-insert. Returns true if the chunk already
  // existed and its reference count was incremented, false if it was stored
  // with a reference count of one.
  virtual bool add_chunk(const HashKey& hash, std::string_view data) = 0;


  // ---- READ SIDE ----
  virtual StoredChunk get_chunk(const HashKey& hash) = 0;
  virtual Email get_message(MessageId id) = 0;
};

using StoragePtr = std::shared_ptr<Storage>;

// Picks the engine named by config.storage_engine. The returned engine still
// needs initialize().
StoragePtr make_storage(const config::ChunkSaverConfig& config);

} // namespace store
} // namespace mailchunk
