#ifndef MAILCHUNK_CHUNK_SAVER_HPP
#define MAILCHUNK_CHUNK_SAVER_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include "backends/service.hpp"
#include "backends/stream_processor.hpp"
#include "backends/stream_registry.hpp"
#include "chunk/chunk_buffer.hpp"
#include "config/config.hpp"
#include "mail/envelope.hpp"
#include "store/storage.hpp"

namespace mailchunk {
namespace chunk {

inline constexpr const char* CHUNK_SAVER_NAME = "chunksaver";

// Write reached the stage without any envelope metadata, meaning the stages
// that should run before it never did
class MissingContextError : public std::runtime_error {
public:
  explicit MissingContextError(const std::string& message) : std::runtime_error(message) {}
};

// Stream decorator that saves a message as deduplicated chunks. Chunks are cut
// at every MIME part start, at every end of a header block, and at the buffer
// cap. Requires the MIME analyzer to run before it. Bytes are passed through
// to the next stage unchanged.
//
// One instance handles one transaction at a time; the storage may be shared.
class ChunkSaver : public backends::StreamDecorator {
public:
  // Optional collaborators. A missing buffer is created with the default cap.
  struct Dependencies {
    store::StoragePtr storage;
    std::unique_ptr<ChunkBuffer> buffer;
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ChunkSaver(Dependencies dependencies);
  ChunkSaver(store::StoragePtr storage, std::size_t chunk_max_bytes);


  // ---- PER-TRANSACTION HOOKS ----
  // Opens a message record and publishes its id under mail::MESSAGE_ID_KEY
  void open(mail::Envelope& envelope) override;
  // Cuts chunks along the published MIME parts, then forwards data
  std::size_t write(std::string_view data) override;
  // Flushes the last chunk and finalizes the message record. After a failed
  // write the record is left open and nothing more is stored.
  void close() override;


  // ---- GETTERS ----
  const ChunkBuffer& buffer() const { return *buffer_; }
  std::optional<store::MessageId> message_id() const { return session_.message_id; }
  std::uint64_t written() const { return session_.written; }

private:
  // Per-message state, reset on open
  struct Session {
    std::optional<store::MessageId> message_id;
    // Stream offset of the next byte to be written
    std::size_t msg_pos{0};
    // Parts before this index are final and not scanned again
    std::size_t progress{0};
    std::string subject;
    std::string to;
    std::string from;
    std::uint64_t written{0};
    // Set when a write failed; the message is abandoned and close stores nothing
    bool failed{false};
  };

  // ---- PARAMETERS ----
  store::StoragePtr storage_;
  std::unique_ptr<ChunkBuffer> buffer_;
  mail::Envelope* envelope_ = nullptr;
  Session session_;


  // ---- CHUNKING SUPPORT ----
  // Captures subject, to and from of the first part, first non-empty value wins
  void fill_vars(const mail::PartList& parts);
  // Writes data into the buffer, flushing at every boundary it crosses
  void split(const mail::PartList& parts, std::string_view data);
  // Writes data into the buffer and advances the session counters
  std::size_t consume(std::string_view data);
  static std::string normalize_address(const std::string& header);
};

// Process-level side of the chunk saver: reads the configuration, owns the
// storage engine shared by every transaction and creates ChunkSaver instances.
class ChunkSaverBackend {
public:
  struct Overrides {
    // Used instead of the configured engine when set
    store::StoragePtr storage;
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ChunkSaverBackend() = default;
  explicit ChunkSaverBackend(Overrides overrides);


  // ---- LIFECYCLE HOOKS ----
  // Throws ConfigurationError for invalid settings, StorageError when the
  // engine cannot start
  void initialize(const config::BackendConfig& backend_config);
  void shutdown();


  // ---- STREAM CREATION ----
  // Throws StorageError before initialize()
  std::unique_ptr<ChunkSaver> create_stream() const;


  // ---- GETTERS ----
  config::ChunkSaverConfig config() const;
  store::StoragePtr storage() const;

private:
  mutable std::mutex mutex_;
  config::ChunkSaverConfig config_;
  store::StoragePtr storage_;
  bool initialized_{false};
};

// Hooks the backend into the service and registers the "chunksaver" factory
void register_chunk_saver(backends::StreamRegistry& registry, backends::Service& service,
                          std::shared_ptr<ChunkSaverBackend> backend);

} // namespace chunk
} // namespace mailchunk

#endif // MAILCHUNK_CHUNK_SAVER_HPP
