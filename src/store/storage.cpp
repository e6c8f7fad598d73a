#include "store/storage.hpp"
#include "store/file_storage.hpp"
#include "store/memory_storage.hpp"
#include <boost/log/trivial.hpp>

namespace mailchunk {
namespace store {

StoragePtr make_storage(const config::ChunkSaverConfig& config) {
  if (config.use_memory_engine()) {
    BOOST_LOG_TRIVIAL(info) << "Storage: Using memory engine";
    return std::make_shared<MemoryStorage>(config.compress_level);
  }
  BOOST_LOG_TRIVIAL(info) << "Storage: Using file engine at " << config.storage_path;
  return std::make_shared<FileStorage>(config.storage_path);
}

} // namespace store
} // namespace mailchunk
