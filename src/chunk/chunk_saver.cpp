#include "chunk/chunk_saver.hpp"
#include <any>
#include <boost/asio/ip/address.hpp>
#include <boost/log/trivial.hpp>
#include <utility>

namespace mailchunk {
namespace chunk {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ChunkSaver::ChunkSaver(Dependencies dependencies)
  : storage_(std::move(dependencies.storage))
  , buffer_(std::move(dependencies.buffer)) {
  if (!buffer_) {
    buffer_ = std::make_unique<ChunkBuffer>();
  }
  if (storage_) {
    buffer_->set_database(storage_);
  }
}

ChunkSaver::ChunkSaver(store::StoragePtr storage, std::size_t chunk_max_bytes)
  : ChunkSaver(Dependencies{std::move(storage), nullptr}) {
  buffer_->cap_to(chunk_max_bytes);
}


//==============================================
// PER-TRANSACTION HOOKS
//==============================================

void ChunkSaver::open(mail::Envelope& envelope) {
  envelope_ = nullptr;
  session_ = Session{};
  buffer_->reset();

  if (!storage_) {
    throw store::StorageError("Chunk saver: No storage engine set");
  }

  // A malformed address is tolerated, the record gets the unspecified address
  boost::system::error_code ec;
  boost::asio::ip::address ip = boost::asio::ip::make_address(envelope.remote_ip, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "Chunk saver: Could not parse remote IP '" << envelope.remote_ip
                             << "': " << ec.message();
    ip = boost::asio::ip::address();
  }

  std::string mail_from = envelope.mail_from.to_string();
  std::string recipient = envelope.rcpt_to.empty() ? "" : envelope.rcpt_to.front().to_string();

  store::MessageId id = storage_->open_message(mail_from, envelope.helo, recipient, ip,
                                               mail_from, envelope.tls);

  envelope.values[mail::MESSAGE_ID_KEY] = id;
  session_.message_id = id;
  envelope_ = &envelope;
  BOOST_LOG_TRIVIAL(debug) << "Chunk saver: Opened message " << id << " for queue id "
                           << envelope.queued_id;
}

std::size_t ChunkSaver::write(std::string_view data) {
  if (!envelope_ || envelope_->values.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Chunk saver: Write without envelope metadata";
    throw MissingContextError("Chunk saver: No message headers found");
  }

  if (session_.failed) {
    throw store::StorageError("Chunk saver: Message was abandoned after a storage failure");
  }

  mail::PartListPtr parts = envelope_->mime_parts();
  if (parts && !parts->empty()) {
    fill_vars(*parts);
    try {
      split(*parts, data);
    } catch (const store::StorageError& e) {
      BOOST_LOG_TRIVIAL(error) << "Chunk saver: Write failed, abandoning message: " << e.what();
      session_.failed = true;
      buffer_->reset();
      throw;
    }
  }
  return write_next(data);
}

void ChunkSaver::close() {
  mail::Envelope* envelope = std::exchange(envelope_, nullptr);

  if (session_.failed) {
    BOOST_LOG_TRIVIAL(warning) << "Chunk saver: Not saving message after failed write";
    buffer_->reset();
    return;
  }

  try {
    buffer_->flush();
  } catch (const std::exception& e) {
    // The record stays open and the flushed chunks keep their references
    BOOST_LOG_TRIVIAL(error) << "Chunk saver: Final flush failed: " << e.what();
    buffer_->reset();
    throw;
  }

  store::Manifest manifest = buffer_->info();
  buffer_->reset();

  if (!envelope) {
    return;
  }
  auto it = envelope->values.find(mail::MESSAGE_ID_KEY);
  if (it == envelope->values.end()) {
    return;
  }
  const auto* id = std::any_cast<store::MessageId>(&it->second);
  if (!id) {
    return;
  }

  storage_->close_message(*id, session_.written, manifest, session_.subject,
                          envelope->queued_id, session_.to, session_.from);
  BOOST_LOG_TRIVIAL(info) << "Chunk saver: Saved message " << *id << " (" << session_.written
                          << " bytes in " << manifest.chunks.size() << " chunks)";
}


//==============================================
// CHUNKING SUPPORT
//==============================================

void ChunkSaver::fill_vars(const mail::PartList& parts) {
  const mail::Part& first = *parts.front();
  if (session_.subject.empty()) {
    session_.subject = first.header("Subject");
  }
  if (session_.to.empty()) {
    session_.to = normalize_address(first.header("To"));
  }
  if (session_.from.empty()) {
    session_.from = normalize_address(first.header("From"));
  }
}

void ChunkSaver::split(const mail::PartList& parts, std::string_view data) {
  const std::size_t end = session_.msg_pos + data.size();
  std::size_t pos = 0;

  if (session_.msg_pos == 0) {
    buffer_->current_part(*parts.front());
  }

  for (std::size_t i = session_.progress; i < parts.size(); ++i) {
    const mail::Part& part = *parts[i];

    // Break chunk on new part
    if (part.starting_pos > session_.msg_pos) {
      if (part.starting_pos > end) {
        break;
      }
      pos += consume(data.substr(pos, part.starting_pos - session_.msg_pos));
      buffer_->flush();
      buffer_->current_part(part);
      BOOST_LOG_TRIVIAL(trace) << "Chunk saver: Part " << part.node << " starts at " << part.starting_pos;
    }

    // Break chunk on end of header
    if (part.starting_pos_body > 0 && part.starting_pos_body >= session_.msg_pos) {
      if (part.starting_pos_body > end) {
        break;
      }
      pos += consume(data.substr(pos, part.starting_pos_body - session_.msg_pos));
      buffer_->flush();
      buffer_->current_part(part);
      BOOST_LOG_TRIVIAL(trace) << "Chunk saver: Body of part " << part.node << " starts at "
                               << part.starting_pos_body;
    }
  }

  // Whatever is left belongs before the next boundary, keep it buffered
  if (pos < data.size()) {
    consume(data.substr(pos));
  }

  // The last two parts may still grow, everything before them is final
  if (parts.size() > 2) {
    session_.progress = parts.size() - 2;
  }
}

std::size_t ChunkSaver::consume(std::string_view data) {
  std::size_t count = buffer_->write(data);
  session_.written += count;
  session_.msg_pos += count;
  return count;
}

std::string ChunkSaver::normalize_address(const std::string& header) {
  if (header.empty()) {
    return "";
  }
  try {
    return mail::Address::parse(header).to_string();
  } catch (const mail::AddressParseError& e) {
    BOOST_LOG_TRIVIAL(debug) << "Chunk saver: Ignoring unparsable address '" << header << "': " << e.what();
    return "";
  }
}


//==============================================
// BACKEND
//==============================================

ChunkSaverBackend::ChunkSaverBackend(Overrides overrides) : storage_(std::move(overrides.storage)) {}

void ChunkSaverBackend::initialize(const config::BackendConfig& backend_config) {
  std::lock_guard<std::mutex> lock(mutex_);
  config_ = config::ChunkSaverConfig::extract(backend_config);

  // Configure storage if none was injected
  if (!storage_) {
    storage_ = store::make_storage(config_);
  }
  storage_->initialize(backend_config);
  initialized_ = true;
  BOOST_LOG_TRIVIAL(info) << "Chunk saver: Initialized with " << config_.chunk_max_bytes << " byte chunks";
}

void ChunkSaverBackend::shutdown() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!storage_) {
    return;
  }
  storage_->shutdown();
  initialized_ = false;
}

std::unique_ptr<ChunkSaver> ChunkSaverBackend::create_stream() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!initialized_) {
    throw store::StorageError("Chunk saver: Backend is not initialized");
  }
  return std::make_unique<ChunkSaver>(storage_, config_.chunk_max_bytes);
}

config::ChunkSaverConfig ChunkSaverBackend::config() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_;
}

store::StoragePtr ChunkSaverBackend::storage() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return storage_;
}


//==============================================
// REGISTRATION
//==============================================

void register_chunk_saver(backends::StreamRegistry& registry, backends::Service& service,
                          std::shared_ptr<ChunkSaverBackend> backend) {
  service.add_initializer([backend](const config::BackendConfig& backend_config) {
    backend->initialize(backend_config);
  });
  service.add_shutdowner([backend]() {
    backend->shutdown();
  });
  registry.add(CHUNK_SAVER_NAME, [backend]() -> std::unique_ptr<backends::StreamDecorator> {
    return backend->create_stream();
  });
}

} // namespace chunk
} // namespace mailchunk
