#include "store/chunk_types.hpp"
#include "store/storage.hpp"
#include <iomanip>
#include <memory>
#include <sstream>
#include <openssl/evp.h>

namespace mailchunk {
namespace store {

std::string to_hex(const HashKey& hash) {
  std::stringstream ss;
  for (auto byte : hash) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

HashKey hash_from_hex(std::string_view hex) {
  HashKey hash{};
  if (hex.size() != hash.size() * 2) {
    throw StorageError("Store: Invalid hash length: " + std::to_string(hex.size()));
  }

  auto nibble = [hex](char c) -> std::uint8_t {
    if (c >= '0' && c <= '9') return static_cast<std::uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<std::uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<std::uint8_t>(c - 'A' + 10);
    throw StorageError("Store: Invalid hash: " + std::string(hex));
  };

  for (std::size_t i = 0; i < hash.size(); ++i) {
    hash[i] = static_cast<std::uint8_t>((nibble(hex[2 * i]) << 4) | nibble(hex[2 * i + 1]));
  }
  return hash;
}

HashKey hash_chunk(std::string_view data) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw StorageError("Store: Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) {
    throw StorageError("Store: Failed to initialize hash context");
  }

  if (!EVP_DigestUpdate(ctx.get(), data.data(), data.size())) {
    throw StorageError("Store: Failed to update hash");
  }

  HashKey hash{};
  unsigned int hash_len = 0;
  if (!EVP_DigestFinal_ex(ctx.get(), hash.data(), &hash_len) || hash_len != hash.size()) {
    throw StorageError("Store: Failed to finalize hash");
  }
  return hash;
}

} // namespace store
} // namespace mailchunk
