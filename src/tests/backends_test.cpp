#include <gtest/gtest.h>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "backends/service.hpp"
#include "backends/stream_registry.hpp"
#include "chunk/chunk_saver.hpp"
#include "chunk/message_reader.hpp"
#include "store/memory_storage.hpp"
#include "test_utils.hpp"

using namespace mailchunk;

namespace {

// Upper-cases everything it forwards and records its lifecycle
class UpperCaseStage : public backends::StreamDecorator {
public:
    explicit UpperCaseStage(std::vector<std::string>& events) : events_(events) {}

    void open(mail::Envelope&) override { events_.push_back("open"); }
    void close() override { events_.push_back("close"); }

    std::size_t write(std::string_view data) override {
        std::string upper(data);
        for (auto& c : upper) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        return write_next(upper);
    }

private:
    std::vector<std::string>& events_;
};

class FailingCloseStage : public backends::StreamDecorator {
public:
    void open(mail::Envelope&) override {}
    void close() override { throw std::runtime_error("close failed"); }
    std::size_t write(std::string_view data) override { return write_next(data); }
};

} // namespace

TEST(ServiceTest, InitializersRunInOrder) {
    backends::Service service;
    std::vector<int> order;
    service.add_initializer([&](const config::BackendConfig&) { order.push_back(1); });
    service.add_initializer([&](const config::BackendConfig&) { order.push_back(2); });

    service.initialize(config::BackendConfig());
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(ServiceTest, FirstInitializerFailureStopsStartup) {
    backends::Service service;
    bool second_ran = false;
    service.add_initializer([](const config::BackendConfig&) {
        throw config::ConfigurationError("bad setting");
    });
    service.add_initializer([&](const config::BackendConfig&) { second_ran = true; });

    EXPECT_THROW(service.initialize(config::BackendConfig()), config::ConfigurationError);
    EXPECT_FALSE(second_ran);
}

TEST(ServiceTest, ShutdownRunsEveryHook) {
    backends::Service service;
    int ran = 0;
    service.add_shutdowner([&]() { ++ran; throw std::runtime_error("first"); });
    service.add_shutdowner([&]() { ++ran; throw std::logic_error("second"); });
    service.add_shutdowner([&]() { ++ran; });

    try {
        service.shutdown();
        FAIL() << "shutdown should rethrow";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "first");
    }
    EXPECT_EQ(ran, 3);
}

TEST(StreamRegistryTest, UnknownNameThrows) {
    backends::StreamRegistry registry;
    EXPECT_FALSE(registry.has("compressor"));
    EXPECT_THROW(registry.create("compressor"), std::out_of_range);

    CollectingSink sink;
    EXPECT_THROW(backends::StreamChain(registry, {"compressor"}, sink), std::out_of_range);
}

TEST(StreamRegistryTest, ChainForwardsInOrder) {
    backends::StreamRegistry registry;
    std::vector<std::string> events;
    registry.add("upper", [&]() { return std::make_unique<UpperCaseStage>(events); });

    CollectingSink sink;
    backends::StreamChain chain(registry, {"upper"}, sink);
    mail::Envelope envelope = make_envelope();

    chain.open(envelope);
    EXPECT_EQ(chain.write("hello"), 5u);
    chain.close();

    EXPECT_EQ(sink.data(), "HELLO");
    EXPECT_EQ(events, (std::vector<std::string>{"open", "close"}));
}

TEST(StreamRegistryTest, EmptyChainWritesToSink) {
    backends::StreamRegistry registry;
    CollectingSink sink;
    backends::StreamChain chain(registry, {}, sink);
    EXPECT_EQ(chain.size(), 0u);
    chain.write("raw");
    EXPECT_EQ(sink.data(), "raw");
}

TEST(StreamRegistryTest, CloseFailureDoesNotSkipLaterStages) {
    backends::StreamRegistry registry;
    std::vector<std::string> events;
    registry.add("failing", []() { return std::make_unique<FailingCloseStage>(); });
    registry.add("upper", [&]() { return std::make_unique<UpperCaseStage>(events); });

    CollectingSink sink;
    backends::StreamChain chain(registry, {"failing", "upper"}, sink);
    mail::Envelope envelope = make_envelope();
    chain.open(envelope);

    EXPECT_THROW(chain.close(), std::runtime_error);
    EXPECT_EQ(events, (std::vector<std::string>{"open", "close"}));
}

TEST(ChunkSaverBackendTest, StreamBeforeInitializeThrows) {
    chunk::ChunkSaverBackend backend;
    EXPECT_THROW(backend.create_stream(), store::StorageError);
}

TEST(ChunkSaverBackendTest, DefaultsToSixteenKilobyteChunks) {
    auto storage = std::make_shared<store::MemoryStorage>();
    chunk::ChunkSaverBackend backend(chunk::ChunkSaverBackend::Overrides{storage});
    backend.initialize(config::BackendConfig());

    EXPECT_EQ(backend.config().chunk_max_bytes, 16384u);
    EXPECT_EQ(backend.storage(), storage);
    EXPECT_EQ(backend.create_stream()->buffer().capacity(), 16384u);
}

TEST(ChunkSaverBackendTest, InvalidConfigurationFailsInitialize) {
    chunk::ChunkSaverBackend backend;
    config::BackendConfig backend_config;
    backend_config.put(config::STORAGE_ENGINE_KEY, "memory");
    backend_config.put(config::COMPRESS_LEVEL_KEY, 12);

    EXPECT_THROW(backend.initialize(backend_config), config::ConfigurationError);
    EXPECT_THROW(backend.create_stream(), store::StorageError);
}

TEST(ChunkSaverBackendTest, OversizedChunkSizeFailsInitialize) {
    chunk::ChunkSaverBackend backend;
    config::BackendConfig backend_config;
    backend_config.put(config::STORAGE_ENGINE_KEY, "memory");
    backend_config.put(config::CHUNK_SIZE_KEY, "1000000000000000");

    EXPECT_THROW(backend.initialize(backend_config), config::ConfigurationError);
    EXPECT_THROW(backend.create_stream(), store::StorageError);
}

TEST(ChunkSaverBackendTest, RegisteredChainSavesMessages) {
    backends::StreamRegistry registry;
    backends::Service service;
    auto backend = std::make_shared<chunk::ChunkSaverBackend>();
    chunk::register_chunk_saver(registry, service, backend);
    ASSERT_TRUE(registry.has(chunk::CHUNK_SAVER_NAME));

    config::BackendConfig backend_config;
    backend_config.put(config::STORAGE_ENGINE_KEY, "memory");
    backend_config.put(config::CHUNK_SIZE_KEY, 64);
    backend_config.put(config::COMPRESS_LEVEL_KEY, 9);
    service.initialize(backend_config);

    auto storage = std::dynamic_pointer_cast<store::MemoryStorage>(backend->storage());
    ASSERT_NE(storage, nullptr);
    EXPECT_EQ(storage->compress_level(), 9);

    TestMessage message = make_multipart(
        "From: a@b.example\r\nSubject: chained\r\n",
        {{"Content-Type: text/plain\r\n", std::string(200, 'm')}});

    CollectingSink sink;
    backends::StreamChain chain(registry, {chunk::CHUNK_SAVER_NAME}, sink);
    mail::Envelope envelope = make_envelope();
    envelope.values[mail::MIME_PARTS_KEY] = message.parts;

    chain.open(envelope);
    chain.write(message.bytes);
    chain.close();

    EXPECT_EQ(sink.data(), message.bytes);
    auto id = std::any_cast<store::MessageId>(envelope.values[mail::MESSAGE_ID_KEY]);
    store::Email email = storage->get_message(id);
    EXPECT_TRUE(email.closed);
    EXPECT_EQ(email.subject, "chained");
    for (const auto& descriptor : email.manifest.chunks) {
        EXPECT_LE(descriptor.size, 64u);
    }

    std::ostringstream output;
    chunk::MessageReader(storage).read(id, output);
    EXPECT_EQ(output.str(), message.bytes);

    service.shutdown();
    EXPECT_THROW(backend->create_stream(), store::StorageError);
}
