#include "backends/HttpBackend.hpp"
#include "backends/MemoryBackend.hpp"
#include "node/StorageNode.hpp"
#include "support/TestBackends.hpp"

#include <cpr/cpr.h>
#include <drogon/drogon.h>
#include <gtest/gtest.h>

#include <future>
#include <memory>
#include <string>
#include <thread>

namespace {

using chunkgate::backends::HttpBackend;
using chunkgate::backends::HttpBackendConfig;
using chunkgate::backends::MemoryBackend;

constexpr std::uint16_t kNodePort = 18481;
const std::string kNodeUrl = "http://127.0.0.1:" + std::to_string(kNodePort);

// Runs a storage node on the drogon loop of this process. drogon allows a single
// run() per process, so the node is shared by every test in the suite.
class NodeRoundTripTest : public ::testing::Test {
   protected:
    static void SetUpTestSuite() {
        store_ = std::make_shared<MemoryBackend>("node-store", kNodeUrl);
        drogon::app().addListener("127.0.0.1", kNodePort);
        chunkgate::node::registerNodeRoutes(drogon::app(), store_);

        std::promise<void> started;
        auto ready = started.get_future();
        loop_ = std::thread([&started]() {
            drogon::app().getLoop()->queueInLoop([&started]() { started.set_value(); });
            drogon::app().run();
        });
        ready.get();
    }

    static void TearDownTestSuite() {
        drogon::app().getLoop()->queueInLoop([]() { drogon::app().quit(); });
        loop_.join();
        store_.reset();
    }

    NodeRoundTripTest() : backend_(HttpBackendConfig{"node-0", kNodeUrl}) {}

    HttpBackend backend_;

    static inline std::shared_ptr<MemoryBackend> store_;
    static inline std::thread loop_;
};

}  // namespace

TEST_F(NodeRoundTripTest, StoredChunkComesBackWithItsOrder) {
    auto content = chunkgate::testing::patternedBytes(4096, 11);

    auto saved = backend_.saveChunk("resource-rt", 4, content.data(), content.size());
    ASSERT_TRUE(saved.ok()) << saved.error->message;
    EXPECT_EQ(saved.data->bytes, content.size());

    auto fetched = backend_.getChunk("resource-rt");
    ASSERT_TRUE(fetched.ok()) << fetched.error->message;
    EXPECT_EQ(fetched.data->order, 4U);
    EXPECT_EQ(fetched.data->data, content);
}

TEST_F(NodeRoundTripTest, EmptyChunkIsStored) {
    auto saved = backend_.saveChunk("resource-empty", 0, nullptr, 0);
    ASSERT_TRUE(saved.ok()) << saved.error->message;

    auto fetched = backend_.getChunk("resource-empty");
    ASSERT_TRUE(fetched.ok()) << fetched.error->message;
    EXPECT_TRUE(fetched.data->data.empty());
}

TEST_F(NodeRoundTripTest, MissingChunkIsNotFound) {
    auto fetched = backend_.getChunk("resource-missing");

    ASSERT_FALSE(fetched.ok());
    EXPECT_EQ(fetched.error->type, "not_found");
    EXPECT_NE(fetched.error->message.find("not found"), std::string::npos);
    EXPECT_EQ(fetched.error->backend, "node-0");
}

TEST_F(NodeRoundTripTest, RejectedSaveCarriesNodeMessage) {
    const std::uint8_t byte = 7;
    auto saved = backend_.saveChunk("", 0, &byte, 1);

    ASSERT_FALSE(saved.ok());
    EXPECT_EQ(saved.error->type, "backend_error");
    EXPECT_EQ(saved.error->code, "400");
    EXPECT_EQ(saved.error->message, "name is required");
}

TEST_F(NodeRoundTripTest, SizeMismatchIsBadRequest) {
    auto response = cpr::Post(cpr::Url{kNodeUrl + "/save-chunk"},
                              cpr::Parameters{{"name", "resource-short"}, {"order", "0"}, {"size", "5"}},
                              cpr::Header{{"Content-Type", "application/octet-stream"}}, cpr::Body{"abc"});

    EXPECT_EQ(response.status_code, 400);
    EXPECT_NE(response.text.find("size 5 does not match body length 3"), std::string::npos) << response.text;
    EXPECT_FALSE(store_->getChunk("resource-short").ok());
}

TEST_F(NodeRoundTripTest, GetWithoutNameIsBadRequest) {
    auto response = cpr::Get(cpr::Url{kNodeUrl + "/get-chunk"});

    EXPECT_EQ(response.status_code, 400);
    EXPECT_EQ(response.text, "name is required");
}
