#include "config/config.hpp"
#include <boost/log/trivial.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <filesystem>

namespace mailchunk {
namespace config {

namespace {

// Present keys must convert, absent keys take the fallback
template <typename T>
T read_value(const BackendConfig& backend_config, const char* key, const T& fallback) {
  auto child = backend_config.get_child_optional(key);
  if (!child) {
    return fallback;
  }
  return child->get_value<T>();
}

} // namespace

ChunkSaverConfig ChunkSaverConfig::extract(const BackendConfig& backend_config) {
  ChunkSaverConfig config;
  try {
    long long chunk_size = read_value<long long>(backend_config, CHUNK_SIZE_KEY, 0);
    if (chunk_size > static_cast<long long>(MAX_CHUNK_MAX_BYTES)) {
      BOOST_LOG_TRIVIAL(error) << "Config: Chunk size " << chunk_size << " exceeds " << MAX_CHUNK_MAX_BYTES;
      throw ConfigurationError("Config: " + std::string(CHUNK_SIZE_KEY) + " exceeds " +
                               std::to_string(MAX_CHUNK_MAX_BYTES) + " bytes");
    } else if (chunk_size > 0) {
      config.chunk_max_bytes = static_cast<std::size_t>(chunk_size);
    } else {
      config.chunk_max_bytes = DEFAULT_CHUNK_MAX_BYTES;
    }

    config.storage_engine = read_value<std::string>(backend_config, STORAGE_ENGINE_KEY, "");
    config.compress_level = read_value<int>(backend_config, COMPRESS_LEVEL_KEY, 0);
    config.storage_path = read_value<std::string>(backend_config, STORAGE_PATH_KEY, DEFAULT_STORAGE_PATH);
  } catch (const boost::property_tree::ptree_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Config: Invalid chunksaver setting: " << e.what();
    throw ConfigurationError("Config: Invalid chunksaver setting: " + std::string(e.what()));
  }

  if (config.storage_path.empty()) {
    throw ConfigurationError("Config: " + std::string(STORAGE_PATH_KEY) + " must not be empty");
  }

  BOOST_LOG_TRIVIAL(debug) << "Config: chunk size " << config.chunk_max_bytes
                           << ", engine '" << config.storage_engine
                           << "', compress level " << config.compress_level;
  return config;
}

BackendConfig load_backend_config(const std::string& path) {
  BOOST_LOG_TRIVIAL(info) << "Config: Loading configuration from: " << path;

  if (!std::filesystem::exists(path)) {
    BOOST_LOG_TRIVIAL(error) << "Config: File not found: " << path;
    throw ConfigurationError("Config: File not found: " + path);
  }

  BackendConfig backend_config;
  try {
    boost::property_tree::read_json(path, backend_config);
  } catch (const boost::property_tree::json_parser_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Config: Failed to parse " << path << ": " << e.what();
    throw ConfigurationError("Config: Failed to parse " + path + ": " + e.what());
  }
  return backend_config;
}

} // namespace config
} // namespace mailchunk
