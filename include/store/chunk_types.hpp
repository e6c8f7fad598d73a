#ifndef MAILCHUNK_STORE_CHUNK_TYPES_HPP
#define MAILCHUNK_STORE_CHUNK_TYPES_HPP

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mailchunk {
namespace store {

using MessageId = std::uint64_t;

// SHA-256 digest of a chunk's raw bytes
using HashKey = std::array<std::uint8_t, 32>;

// Lowercase hex rendering of a digest
std::string to_hex(const HashKey& hash);
// Parses 64 hex digits, throws StorageError otherwise
HashKey hash_from_hex(std::string_view hex);
// Computes the SHA-256 digest of data using OpenSSL EVP
HashKey hash_chunk(std::string_view data);

// One manifest entry: a chunk of one message and the part it belongs to
struct ChunkDescriptor {
  HashKey hash{};
  std::size_t size{0};
  std::string part_id;
  std::string content_type;
};

// Ordered reconstruction list of a message
struct Manifest {
  std::vector<ChunkDescriptor> chunks;

  std::size_t total_size() const {
    std::size_t total = 0;
    for (const auto& chunk : chunks) {
      total += chunk.size;
    }
    return total;
  }

  bool empty() const { return chunks.empty(); }
};

struct StoredChunk {
  HashKey hash{};
  std::size_t size{0};
  std::string data;
  std::uint64_t references{0};
};

// The storage-side message record
struct Email {
  MessageId id{0};
  std::string from;
  std::string helo;
  std::string recipient;
  std::string remote_ip;
  std::string return_path;
  bool tls{false};

  // Filled in when the message is closed
  bool closed{false};
  std::size_t size{0};
  Manifest manifest;
  std::string subject;
  std::string queued_id;
  std::string header_to;
  std::string header_from;
};

} // namespace store
} // namespace mailchunk

#endif // MAILCHUNK_STORE_CHUNK_TYPES_HPP
