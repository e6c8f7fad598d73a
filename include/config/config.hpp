#ifndef MAILCHUNK_CONFIG_HPP
#define MAILCHUNK_CONFIG_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <boost/property_tree/ptree.hpp>

namespace mailchunk {
namespace config {

// Flat key/value document shared by every backend component
using BackendConfig = boost::property_tree::ptree;

class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

// Recognized keys
inline constexpr const char* CHUNK_SIZE_KEY = "chunksaver_chunk_size";
inline constexpr const char* STORAGE_ENGINE_KEY = "chunksaver_storage_engine";
inline constexpr const char* COMPRESS_LEVEL_KEY = "chunksaver_compress_level";
inline constexpr const char* STORAGE_PATH_KEY = "chunksaver_storage_path";
inline constexpr const char* LOG_FILE_KEY = "log_file";
inline constexpr const char* LOG_LEVEL_KEY = "log_level";

struct ChunkSaverConfig {
  static constexpr std::size_t DEFAULT_CHUNK_MAX_BYTES = 1024 * 16;
  static constexpr std::size_t MAX_CHUNK_MAX_BYTES = 1024 * 1024 * 64;
  static constexpr const char* DEFAULT_STORAGE_PATH = "mailchunk_store";

  std::size_t chunk_max_bytes{DEFAULT_CHUNK_MAX_BYTES};
  // "memory" selects the in-memory engine, anything else the persistent one
  std::string storage_engine;
  int compress_level{0};
  std::string storage_path{DEFAULT_STORAGE_PATH};

  bool use_memory_engine() const { return storage_engine == "memory"; }

  // Reads the chunksaver_* keys. Absent or non-positive chunk sizes fall back
  // to the default; sizes above MAX_CHUNK_MAX_BYTES and values of the wrong
  // type throw ConfigurationError.
  static ChunkSaverConfig extract(const BackendConfig& backend_config);
};

// Loads a JSON document from disk, throws ConfigurationError on failure
BackendConfig load_backend_config(const std::string& path);

} // namespace config
} // namespace mailchunk

#endif // MAILCHUNK_CONFIG_HPP
