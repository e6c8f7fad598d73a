#pragma once

#include <array>
#include <atomic>
#include <filesystem>
#include <mutex>
#include <string>
#include "store/storage.hpp"

namespace mailchunk {
namespace store {

// Persistent engine on a content-addressed directory tree:
//   {base}/chunks/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}      payload
//   {base}/chunks/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}.ref  reference count
//   {base}/messages/{id}.json                                                message record
class FileStorage : public Storage {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Takes the base path from chunksaver_storage_path at initialize()
  FileStorage() = default;
  // Uses base_path regardless of the configuration
  explicit FileStorage(const std::string& base_path);
  ~FileStorage() override = default;


  // ---- LIFECYCLE ----
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


  // ---- GETTERS ----
  const std::filesystem::path& base_path() const { return base_path_; }

private:
  static constexpr std::size_t LOCK_STRIPES = 64;

  // ---- PARAMETERS ----
  std::filesystem::path base_path_;
  std::filesystem::path chunk_dir_;
  std::filesystem::path message_dir_;
  std::atomic<bool> initialized_{false};
  std::atomic<MessageId> next_id_{1};
  std::atomic<std::uint64_t> temp_counter_{0};
  // Dedup is serialized per stripe of the hash space
  std::array<std::mutex, LOCK_STRIPES> chunk_locks_;
  std::mutex message_mutex_;


  // ---- CAS STORAGE SUPPORT ----
  std::filesystem::path get_path_for_hash(const HashKey& hash) const;
  std::filesystem::path ref_path(const std::filesystem::path& chunk_path) const;
  std::uint64_t read_references(const std::filesystem::path& path) const;


  // ---- MESSAGE RECORD SUPPORT ----
  std::filesystem::path message_path(MessageId id) const;
  void write_record(const Email& email);
  Email read_record(MessageId id) const;
  // Highest id present in the message directory, 0 when empty
  MessageId scan_highest_id() const;


  // ---- UTILITY METHODS ----
  void ensure_initialized() const;
  void check_directory_exists(const std::filesystem::path& path) const;
  // Writes to a temporary sibling and renames it over path
  void write_file_atomic(const std::filesystem::path& path, std::string_view data);
  std::string read_file(const std::filesystem::path& path) const;
};

} // namespace store
} // namespace mailchunk
