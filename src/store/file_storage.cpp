#include "store/file_storage.hpp"
#include <boost/log/trivial.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace mailchunk {
namespace store {

namespace pt = boost::property_tree;
namespace fs = std::filesystem;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileStorage::FileStorage(const std::string& base_path) : base_path_(base_path) {}


//==============================================
// LIFECYCLE
//==============================================

void FileStorage::initialize(const config::BackendConfig& backend_config) {
  if (base_path_.empty()) {
    base_path_ = config::ChunkSaverConfig::extract(backend_config).storage_path;
  }
  BOOST_LOG_TRIVIAL(info) << "File storage: Initializing with base path: " << base_path_.string();

  chunk_dir_ = base_path_ / "chunks";
  message_dir_ = base_path_ / "messages";
  try {
    check_directory_exists(chunk_dir_);
    check_directory_exists(message_dir_);
    next_id_ = scan_highest_id() + 1;
  } catch (const fs::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "File storage: Failed to prepare " << base_path_.string() << ": " << e.what();
    throw StorageError("File storage: Failed to prepare storage directory: " + std::string(e.what()));
  }

  initialized_ = true;
  BOOST_LOG_TRIVIAL(info) << "File storage: Next message id is " << next_id_.load();
}

void FileStorage::shutdown() {
  BOOST_LOG_TRIVIAL(info) << "File storage: Shutting down store at: " << base_path_.string();
  initialized_ = false;
}


//==============================================
// STORAGE OPERATIONS
//==============================================

MessageId FileStorage::open_message(const std::string& from, const std::string& helo,
                                    const std::string& recipient,
                                    const boost::asio::ip::address& remote_ip,
                                    const std::string& return_path, bool tls) {
  ensure_initialized();

  Email email;
  email.id = next_id_.fetch_add(1);
  email.from = from;
  email.helo = helo;
  email.recipient = recipient;
  email.remote_ip = remote_ip.to_string();
  email.return_path = return_path;
  email.tls = tls;

  std::lock_guard<std::mutex> lock(message_mutex_);
  bool taken = false;
  try {
    taken = fs::exists(message_path(email.id));
  } catch (const fs::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "File storage: Failed to check message " << email.id << ": " << e.what();
    throw StorageError("File storage: Failed to check message record: " + std::string(e.what()));
  }
  if (taken) {
    BOOST_LOG_TRIVIAL(error) << "File storage: Message record already exists: " << email.id;
    throw StorageError("File storage: Message id already in use: " + std::to_string(email.id));
  }
  write_record(email);
  BOOST_LOG_TRIVIAL(debug) << "File storage: Opened message " << email.id;
  return email.id;
}

void FileStorage::close_message(MessageId id, std::size_t size, const Manifest& manifest,
                                const std::string& subject, const std::string& queued_id,
                                const std::string& to, const std::string& from) {
  ensure_initialized();

  if (size != manifest.total_size()) {
    BOOST_LOG_TRIVIAL(error) << "File storage: Size " << size << " of message " << id
                             << " does not match manifest total " << manifest.total_size();
    throw StorageError("File storage: Message size does not match manifest");
  }

  std::lock_guard<std::mutex> lock(message_mutex_);
  Email email = read_record(id);
  if (email.closed) {
    throw StorageError("File storage: Message already closed " + std::to_string(id));
  }

  email.closed = true;
  email.size = size;
  email.manifest = manifest;
  email.subject = subject;
  email.queued_id = queued_id;
  email.header_to = to;
  email.header_from = from;
  write_record(email);
  BOOST_LOG_TRIVIAL(debug) << "File storage: Closed message " << id << " with "
                           << manifest.chunks.size() << " chunks";
}

bool FileStorage::add_chunk(const HashKey& hash, std::string_view data) {
  ensure_initialized();

  fs::path chunk_path = get_path_for_hash(hash);
  fs::path refs = ref_path(chunk_path);

  std::lock_guard<std::mutex> lock(chunk_locks_[hash[0] % LOCK_STRIPES]);
  try {
    // A payload without its .ref sidecar is an interrupted insert and gets rewritten
    if (fs::exists(chunk_path) && fs::exists(refs)) {
      std::uint64_t references = read_references(refs) + 1;
      write_file_atomic(refs, std::to_string(references));
      BOOST_LOG_TRIVIAL(trace) << "File storage: Chunk " << to_hex(hash) << " now has "
                               << references << " references";
      return true;
    }

    check_directory_exists(chunk_path.parent_path());
    write_file_atomic(chunk_path, data);
    write_file_atomic(refs, "1");
  } catch (const fs::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "File storage: Failed to store chunk " << to_hex(hash) << ": " << e.what();
    throw StorageError("File storage: Failed to store chunk: " + std::string(e.what()));
  }

  BOOST_LOG_TRIVIAL(trace) << "File storage: Stored new chunk " << to_hex(hash)
                           << " (" << data.size() << " bytes)";
  return false;
}

StoredChunk FileStorage::get_chunk(const HashKey& hash) {
  ensure_initialized();

  fs::path chunk_path = get_path_for_hash(hash);
  std::lock_guard<std::mutex> lock(chunk_locks_[hash[0] % LOCK_STRIPES]);
  if (!fs::exists(chunk_path)) {
    BOOST_LOG_TRIVIAL(error) << "File storage: Chunk not found: " << to_hex(hash);
    throw StorageError("File storage: Chunk not found: " + to_hex(hash));
  }

  StoredChunk chunk;
  chunk.hash = hash;
  chunk.data = read_file(chunk_path);
  chunk.size = chunk.data.size();
  chunk.references = read_references(ref_path(chunk_path));

  if (hash_chunk(chunk.data) != hash) {
    BOOST_LOG_TRIVIAL(error) << "File storage: Chunk content does not match its hash: " << to_hex(hash);
    throw StorageError("File storage: Corrupt chunk: " + to_hex(hash));
  }
  return chunk;
}

Email FileStorage::get_message(MessageId id) {
  ensure_initialized();
  std::lock_guard<std::mutex> lock(message_mutex_);
  return read_record(id);
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

fs::path FileStorage::get_path_for_hash(const HashKey& hash) const {
  std::string hex = to_hex(hash);
  fs::path path = chunk_dir_;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hex.substr(i, 2);
  }

  path /= hex.substr(6);
  return path;
}

fs::path FileStorage::ref_path(const fs::path& chunk_path) const {
  fs::path refs = chunk_path;
  refs += ".ref";
  return refs;
}

std::uint64_t FileStorage::read_references(const fs::path& path) const {
  if (!fs::exists(path)) {
    return 0;
  }
  std::string text = read_file(path);
  try {
    return std::stoull(text);
  } catch (const std::exception&) {
    BOOST_LOG_TRIVIAL(error) << "File storage: Malformed reference count in " << path.string();
    throw StorageError("File storage: Malformed reference count in " + path.string());
  }
}


//==============================================
// MESSAGE RECORD SUPPORT
//==============================================

fs::path FileStorage::message_path(MessageId id) const {
  return message_dir_ / (std::to_string(id) + ".json");
}

void FileStorage::write_record(const Email& email) {
  pt::ptree root;
  root.put("id", email.id);
  root.put("from", email.from);
  root.put("helo", email.helo);
  root.put("recipient", email.recipient);
  root.put("remote_ip", email.remote_ip);
  root.put("return_path", email.return_path);
  root.put("tls", email.tls);
  root.put("closed", email.closed);
  root.put("size", email.size);
  root.put("subject", email.subject);
  root.put("queued_id", email.queued_id);
  root.put("header_to", email.header_to);
  root.put("header_from", email.header_from);

  pt::ptree chunks;
  for (const auto& descriptor : email.manifest.chunks) {
    pt::ptree entry;
    entry.put("hash", to_hex(descriptor.hash));
    entry.put("size", descriptor.size);
    entry.put("part", descriptor.part_id);
    entry.put("content_type", descriptor.content_type);
    chunks.push_back(std::make_pair("", entry));
  }
  root.add_child("manifest", chunks);

  std::ostringstream out;
  pt::write_json(out, root);
  try {
    write_file_atomic(message_path(email.id), out.str());
  } catch (const fs::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "File storage: Failed to write message " << email.id << ": " << e.what();
    throw StorageError("File storage: Failed to write message record: " + std::string(e.what()));
  }
}

Email FileStorage::read_record(MessageId id) const {
  fs::path path = message_path(id);
  if (!fs::exists(path)) {
    BOOST_LOG_TRIVIAL(error) << "File storage: Unknown message " << id;
    throw StorageError("File storage: Unknown message " + std::to_string(id));
  }

  Email email;
  try {
    std::istringstream in(read_file(path));
    pt::ptree root;
    pt::read_json(in, root);

    email.id = root.get<MessageId>("id");
    email.from = root.get<std::string>("from", "");
    email.helo = root.get<std::string>("helo", "");
    email.recipient = root.get<std::string>("recipient", "");
    email.remote_ip = root.get<std::string>("remote_ip", "");
    email.return_path = root.get<std::string>("return_path", "");
    email.tls = root.get<bool>("tls", false);
    email.closed = root.get<bool>("closed", false);
    email.size = root.get<std::size_t>("size", 0);
    email.subject = root.get<std::string>("subject", "");
    email.queued_id = root.get<std::string>("queued_id", "");
    email.header_to = root.get<std::string>("header_to", "");
    email.header_from = root.get<std::string>("header_from", "");

    if (auto chunks = root.get_child_optional("manifest")) {
      for (const auto& [key, entry] : *chunks) {
        ChunkDescriptor descriptor;
        descriptor.hash = hash_from_hex(entry.get<std::string>("hash"));
        descriptor.size = entry.get<std::size_t>("size");
        descriptor.part_id = entry.get<std::string>("part", "");
        descriptor.content_type = entry.get<std::string>("content_type", "");
        email.manifest.chunks.push_back(std::move(descriptor));
      }
    }
  } catch (const pt::ptree_error& e) {
    BOOST_LOG_TRIVIAL(error) << "File storage: Malformed message record " << path.string() << ": " << e.what();
    throw StorageError("File storage: Malformed message record " + path.string());
  }
  return email;
}

MessageId FileStorage::scan_highest_id() const {
  MessageId highest = 0;
  for (const auto& entry : fs::directory_iterator(message_dir_)) {
    if (entry.path().extension() != ".json") {
      continue;
    }
    try {
      MessageId id = std::stoull(entry.path().stem().string());
      highest = std::max(highest, id);
    } catch (const std::exception&) {
      BOOST_LOG_TRIVIAL(warning) << "File storage: Ignoring unexpected file " << entry.path().string();
    }
  }
  return highest;
}


//==============================================
// UTILITY METHODS
//==============================================

void FileStorage::ensure_initialized() const {
  if (!initialized_) {
    throw StorageError("File storage: Storage is not initialized");
  }
}

void FileStorage::check_directory_exists(const fs::path& path) const {
  if (!fs::exists(path)) {
    fs::create_directories(path);
  }
}

void FileStorage::write_file_atomic(const fs::path& path, std::string_view data) {
  fs::path temp = path;
  temp += ".tmp" + std::to_string(temp_counter_.fetch_add(1));

  {
    // Binary mode keeps chunk bytes identical across platforms
    std::ofstream file(temp, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw StorageError("File storage: Failed to create file: " + temp.string());
    }
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!file) {
      throw StorageError("File storage: Failed to write file: " + temp.string());
    }
  }

  fs::rename(temp, path);
}

std::string FileStorage::read_file(const fs::path& path) const {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw StorageError("File storage: Failed to open file: " + path.string());
  }
  std::ostringstream out;
  out << file.rdbuf();
  return out.str();
}

} // namespace store
} // namespace mailchunk
