#pragma once

#include <iostream>
#include <string>
#include "store/storage.hpp"

namespace mailchunk {
namespace cli {

// Interactive shell for inspecting a chunk store
class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit CLI(store::StoragePtr storage, std::istream& in = std::cin, std::ostream& out = std::cout);


    // ---- STARTUP ----
    void run();

    // Runs one command line, returns false on "quit"
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    store::StoragePtr storage_;
    std::istream& in_;
    std::ostream& out_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::string& argument);
    void handle_get_command(const std::string& argument);
    void handle_info_command(const std::string& argument);
    void handle_chunk_command(const std::string& argument);
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
    static store::MessageId parse_message_id(const std::string& argument);
};

} // namespace cli
} // namespace mailchunk
