#include "cli/cli.hpp"
#include <sstream>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "chunk/message_reader.hpp"

namespace mailchunk {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(store::StoragePtr storage, std::istream& in, std::ostream& out)
  : running_(false)
  , storage_(std::move(storage))
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "mailchunk> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    running_ = execute(line);
    if (running_) {
      out_ << "mailchunk> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command, argument;

  iss >> command;
  if (command.empty()) {
    return true;
  }
  if (command == "quit") {
    return false;
  }

  if (command == "help") {
    process_command(command, "");
  } else if (iss >> argument) {
    process_command(command, argument);
  } else {
    out_ << "Invalid input. Usage: <command> <argument>" << std::endl;
  }
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::string& argument) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with argument: " << argument;

  if (command == "get") {
    handle_get_command(argument);
  }
  else if (command == "info") {
    handle_info_command(argument);
  }
  else if (command == "chunk") {
    handle_chunk_command(argument);
  }
  else if (command == "help") {
    handle_help_command();
  }
  else {
    out_ << "Unknown command: " << command << ". Type 'help' for available commands." << std::endl;
  }
}

void CLI::handle_get_command(const std::string& argument) {
  try {
    chunk::MessageReader reader(storage_);
    reader.read(parse_message_id(argument), out_);
    out_ << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Failed to read message " + argument, e.what());
  }
}

void CLI::handle_info_command(const std::string& argument) {
  try {
    store::Email email = storage_->get_message(parse_message_id(argument));
    out_ << "Message " << email.id << (email.closed ? "" : " (open)") << "\n"
         << "  From:      " << email.from << "\n"
         << "  To:        " << email.recipient << "\n"
         << "  HELO:      " << email.helo << "\n"
         << "  Remote IP: " << email.remote_ip << (email.tls ? " (TLS)" : "") << "\n"
         << "  Queue id:  " << email.queued_id << "\n"
         << "  Subject:   " << email.subject << "\n"
         << "  Size:      " << email.size << " bytes in " << email.manifest.chunks.size() << " chunks\n";
    for (const auto& descriptor : email.manifest.chunks) {
      out_ << "    " << store::to_hex(descriptor.hash) << " " << descriptor.size
           << " part " << descriptor.part_id << " " << descriptor.content_type << "\n";
    }
    out_ << std::flush;
  } catch (const std::exception& e) {
    log_and_display_error("Failed to read message " + argument, e.what());
  }
}

void CLI::handle_chunk_command(const std::string& argument) {
  try {
    store::StoredChunk chunk = storage_->get_chunk(store::hash_from_hex(argument));
    out_ << "Chunk " << store::to_hex(chunk.hash) << ": " << chunk.size << " bytes, "
         << chunk.references << " references" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Failed to read chunk " + argument, e.what());
  }
}

void CLI::handle_help_command() {
  out_ << "\nAvailable commands:\n"
       << "  get <id>       - Print the reassembled message\n"
       << "  info <id>      - Show the message record and its chunk manifest\n"
       << "  chunk <hash>   - Show size and reference count of a chunk\n"
       << "  help           - Show this help message\n"
       << "  quit           - Exit the program\n" << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << "Error: " << message << ": " << error << std::endl;
}

store::MessageId CLI::parse_message_id(const std::string& argument) {
  try {
    std::size_t used = 0;
    store::MessageId id = std::stoull(argument, &used);
    if (used != argument.size()) {
      throw std::invalid_argument(argument);
    }
    return id;
  } catch (const std::logic_error&) {
    throw std::invalid_argument("not a message id: " + argument);
  }
}

} // namespace cli
} // namespace mailchunk
