#include <gtest/gtest.h>
#include <sstream>
#include "cli/cli.hpp"
#include "store/memory_storage.hpp"

using namespace mailchunk;

class CLITest : public ::testing::Test {
protected:
    std::shared_ptr<store::MemoryStorage> storage = std::make_shared<store::MemoryStorage>();
    std::istringstream input;
    std::ostringstream output;
    store::MessageId id = 0;
    std::string body = "Subject: stored\r\n\r\nSaved through the chunk store.\r\n";

    void SetUp() override {
        storage->initialize(config::BackendConfig());
        storage->add_chunk(store::hash_chunk(body), body);

        store::Manifest manifest;
        store::ChunkDescriptor descriptor;
        descriptor.hash = store::hash_chunk(body);
        descriptor.size = body.size();
        descriptor.part_id = "1";
        descriptor.content_type = "text/plain";
        manifest.chunks.push_back(descriptor);

        id = storage->open_message("a@b.example", "mx.b.example", "c@d.example",
                                   boost::asio::ip::make_address("198.51.100.7"), "a@b.example", false);
        storage->close_message(id, body.size(), manifest, "stored", "q-cli", "c@d.example", "a@b.example");
    }
};

TEST_F(CLITest, GetPrintsReassembledMessage) {
    cli::CLI shell(storage, input, output);
    EXPECT_TRUE(shell.execute("get " + std::to_string(id)));
    EXPECT_NE(output.str().find(body), std::string::npos);
}

TEST_F(CLITest, InfoShowsRecordAndManifest) {
    cli::CLI shell(storage, input, output);
    EXPECT_TRUE(shell.execute("info " + std::to_string(id)));
    EXPECT_NE(output.str().find("Subject:   stored"), std::string::npos);
    EXPECT_NE(output.str().find("198.51.100.7"), std::string::npos);
    EXPECT_NE(output.str().find(store::to_hex(store::hash_chunk(body))), std::string::npos);
}

TEST_F(CLITest, ChunkShowsReferenceCount) {
    cli::CLI shell(storage, input, output);
    EXPECT_TRUE(shell.execute("chunk " + store::to_hex(store::hash_chunk(body))));
    EXPECT_NE(output.str().find("1 references"), std::string::npos);
}

TEST_F(CLITest, ErrorsAreReportedNotThrown) {
    cli::CLI shell(storage, input, output);
    EXPECT_NO_THROW(shell.execute("chunk not-hex"));
    EXPECT_NO_THROW(shell.execute("info 12abc"));
    EXPECT_NO_THROW(shell.execute("get 999999"));
    EXPECT_NO_THROW(shell.execute("bogus 1"));

    const std::string text = output.str();
    EXPECT_NE(text.find("Error: Failed to read chunk not-hex"), std::string::npos);
    EXPECT_NE(text.find("Error: Failed to read message 12abc"), std::string::npos);
    EXPECT_NE(text.find("Error: Failed to read message 999999"), std::string::npos);
    EXPECT_NE(text.find("Unknown command: bogus"), std::string::npos);
}

TEST_F(CLITest, RunStopsAtQuit) {
    input.str("help\ninfo " + std::to_string(id) + "\nquit\ninfo " + std::to_string(id) + "\n");
    cli::CLI shell(storage, input, output);
    shell.run();

    const std::string text = output.str();
    EXPECT_NE(text.find("Available commands"), std::string::npos);
    // The command after quit is never executed
    auto first = text.find("Message " + std::to_string(id));
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(text.find("Message " + std::to_string(id), first + 1), std::string::npos);
}
