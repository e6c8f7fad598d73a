#include <gtest/gtest.h>
#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "store/memory_storage.hpp"

using namespace mailchunk;
using namespace mailchunk::store;

class MemoryStorageTest : public ::testing::Test {
protected:
  std::shared_ptr<MemoryStorage> storage;

  void SetUp() override {
    storage = std::make_shared<MemoryStorage>(6);
    ASSERT_NO_THROW(storage->initialize(config::BackendConfig()));
  }

  MessageId open() {
    return storage->open_message("sender@example.com", "mx.example.com", "rcpt@example.org",
                                 boost::asio::ip::make_address("192.0.2.10"),
                                 "sender@example.com", false);
  }

  static Manifest manifest_of(const std::vector<std::string>& chunks) {
    Manifest manifest;
    for (const auto& data : chunks) {
      ChunkDescriptor descriptor;
      descriptor.hash = hash_chunk(data);
      descriptor.size = data.size();
      descriptor.part_id = "1";
      manifest.chunks.push_back(descriptor);
    }
    return manifest;
  }
};

TEST_F(MemoryStorageTest, InsertThenIncrement) {
  const std::string data(2048, 'A');
  HashKey hash = hash_chunk(data);

  EXPECT_FALSE(storage->add_chunk(hash, data));
  EXPECT_TRUE(storage->add_chunk(hash, data));
  EXPECT_TRUE(storage->add_chunk(hash, data));

  StoredChunk chunk = storage->get_chunk(hash);
  EXPECT_EQ(chunk.references, 3u);
  EXPECT_EQ(chunk.size, data.size());
  EXPECT_EQ(chunk.data, data);
  EXPECT_EQ(storage->chunk_count(), 1u);
}

TEST_F(MemoryStorageTest, PayloadSurvivesEveryCompressLevel) {
  const std::string data = "Subject: compressed\r\n\r\n" + std::string(4000, 'z') + "tail";
  for (int level = -1; level <= 9; ++level) {
    auto engine = std::make_shared<MemoryStorage>(level);
    engine->initialize(config::BackendConfig());
    engine->add_chunk(hash_chunk(data), data);
    EXPECT_EQ(engine->get_chunk(hash_chunk(data)).data, data) << "level " << level;
  }
}

TEST_F(MemoryStorageTest, InvalidCompressLevel) {
  EXPECT_THROW(MemoryStorage(10).initialize(config::BackendConfig()), config::ConfigurationError);
  EXPECT_THROW(MemoryStorage(-2).initialize(config::BackendConfig()), config::ConfigurationError);
}

TEST_F(MemoryStorageTest, MessageIdsAreFresh) {
  std::set<MessageId> ids;
  for (int i = 0; i < 100; ++i) {
    EXPECT_TRUE(ids.insert(open()).second);
  }
  EXPECT_EQ(storage->message_count(), 100u);
}

TEST_F(MemoryStorageTest, OpenRecordsEnvelope) {
  MessageId id = open();
  Email email = storage->get_message(id);
  EXPECT_EQ(email.id, id);
  EXPECT_EQ(email.from, "sender@example.com");
  EXPECT_EQ(email.helo, "mx.example.com");
  EXPECT_EQ(email.recipient, "rcpt@example.org");
  EXPECT_EQ(email.remote_ip, "192.0.2.10");
  EXPECT_FALSE(email.closed);
}

TEST_F(MemoryStorageTest, CloseStoresManifest) {
  MessageId id = open();
  Manifest manifest = manifest_of({"From: a@b.example\r\n\r\n", "body text\r\n"});
  storage->close_message(id, manifest.total_size(), manifest, "Greetings", "q-42",
                         "rcpt@example.org", "a@b.example");

  Email email = storage->get_message(id);
  EXPECT_TRUE(email.closed);
  EXPECT_EQ(email.size, manifest.total_size());
  ASSERT_EQ(email.manifest.chunks.size(), 2u);
  EXPECT_EQ(email.manifest.chunks[1].hash, manifest.chunks[1].hash);
  EXPECT_EQ(email.subject, "Greetings");
  EXPECT_EQ(email.queued_id, "q-42");
  EXPECT_EQ(email.header_to, "rcpt@example.org");
  EXPECT_EQ(email.header_from, "a@b.example");
}

TEST_F(MemoryStorageTest, CloseGuards) {
  MessageId id = open();
  Manifest manifest = manifest_of({"twelve bytes"});

  // Size disagrees with the manifest
  EXPECT_THROW(storage->close_message(id, 11, manifest, "", "", "", ""), StorageError);
  EXPECT_FALSE(storage->get_message(id).closed);

  // Unknown id
  EXPECT_THROW(storage->close_message(id + 1000, 12, manifest, "", "", "", ""), StorageError);

  // Second close
  ASSERT_NO_THROW(storage->close_message(id, 12, manifest, "", "", "", ""));
  EXPECT_THROW(storage->close_message(id, 12, manifest, "", "", "", ""), StorageError);
}

TEST_F(MemoryStorageTest, UnknownKeys) {
  EXPECT_THROW(storage->get_chunk(hash_chunk("never stored")), StorageError);
  EXPECT_THROW(storage->get_message(424242), StorageError);
}

TEST_F(MemoryStorageTest, ConcurrentDedup) {
  const size_t num_threads = 8;
  const size_t ops_per_thread = 200;
  const std::string shared(2048, 'S');
  HashKey shared_hash = hash_chunk(shared);
  std::atomic<size_t> inserts{0};
  std::vector<std::thread> threads;

  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([&]() {
      for (size_t j = 0; j < ops_per_thread; ++j) {
        if (!storage->add_chunk(shared_hash, shared)) {
          ++inserts;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(inserts.load(), 1u);
  EXPECT_EQ(storage->chunk_count(), 1u);
  EXPECT_EQ(storage->get_chunk(shared_hash).references, num_threads * ops_per_thread);
}
