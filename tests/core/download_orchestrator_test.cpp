#include "core/DownloadOrchestrator.hpp"

#include "core/ChunkRegistry.hpp"
#include "core/UploadOrchestrator.hpp"
#include "support/TestBackends.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

namespace {

using chunkgate::core::ByteSpan;
using chunkgate::core::ChunkLocation;
using chunkgate::core::ChunkRegistry;
using chunkgate::core::DownloadOrchestrator;
using chunkgate::core::UploadOrchestrator;
using chunkgate::testing::ScriptedBackend;

class DownloadOrchestratorTest : public ::testing::Test {
   protected:
    DownloadOrchestratorTest()
        : backends_(chunkgate::testing::makeScriptedBackends(6)),
          uploader_(chunkgate::testing::asBackendList(backends_), registry_),
          downloader_(chunkgate::testing::asBackendList(backends_), registry_) {}

    int totalGetCalls() const {
        int total = 0;
        for (const auto &backend : backends_) {
            total += backend->getCalls.load();
        }
        return total;
    }

    std::vector<std::shared_ptr<ScriptedBackend>> backends_;
    ChunkRegistry registry_;
    UploadOrchestrator uploader_;
    DownloadOrchestrator downloader_;
};

}  // namespace

TEST_F(DownloadOrchestratorTest, RoundTripRestoresOriginalBytes) {
    auto content = chunkgate::testing::patternedBytes(601, 11);
    auto uploaded = uploader_.upload("report.pdf", ByteSpan(content));
    ASSERT_TRUE(uploaded.ok());

    auto downloaded = downloader_.download(uploaded.data->resourceId);

    ASSERT_TRUE(downloaded.ok()) << downloaded.error->message;
    EXPECT_EQ(downloaded.data->resourceId, uploaded.data->resourceId);
    EXPECT_EQ(downloaded.data->fileName, "report.pdf");
    EXPECT_EQ(downloaded.data->content, content);
    EXPECT_EQ(totalGetCalls(), 6);
}

TEST_F(DownloadOrchestratorTest, RoundTripWhenFileIsSmallerThanBackendCount) {
    auto content = chunkgate::testing::patternedBytes(4, 2);
    auto uploaded = uploader_.upload("tiny.bin", ByteSpan(content));
    ASSERT_TRUE(uploaded.ok());

    auto downloaded = downloader_.download(uploaded.data->resourceId);

    ASSERT_TRUE(downloaded.ok());
    EXPECT_EQ(downloaded.data->content, content);
}

TEST_F(DownloadOrchestratorTest, UnknownResourceIsNotFound) {
    auto downloaded = downloader_.download("does-not-exist");

    ASSERT_FALSE(downloaded.ok());
    EXPECT_EQ(downloaded.error->type, "not_found");
    EXPECT_EQ(downloaded.error->message, "File not found");
    EXPECT_EQ(totalGetCalls(), 0);
}

TEST_F(DownloadOrchestratorTest, EmptyIdIsValidationError) {
    auto downloaded = downloader_.download("");

    ASSERT_FALSE(downloaded.ok());
    EXPECT_EQ(downloaded.error->type, "validation_error");
    EXPECT_EQ(downloaded.error->code, "missing_resource_id");
    EXPECT_EQ(totalGetCalls(), 0);
}

TEST_F(DownloadOrchestratorTest, FailedUploadIsNeverServed) {
    backends_[2]->failSaves = true;
    ChunkRegistry registry;
    UploadOrchestrator uploader(chunkgate::testing::asBackendList(backends_), registry,
                                []() { return std::string("partial"); });
    DownloadOrchestrator downloader(chunkgate::testing::asBackendList(backends_), registry);
    auto content = chunkgate::testing::patternedBytes(120);

    ASSERT_FALSE(uploader.upload("partial.bin", ByteSpan(content)).ok());
    ASSERT_TRUE(registry.get("partial").has_value());

    auto downloaded = downloader.download("partial");

    ASSERT_FALSE(downloaded.ok());
    EXPECT_EQ(downloaded.error->type, "not_found");
    EXPECT_EQ(totalGetCalls(), 0);
}

TEST_F(DownloadOrchestratorTest, FetchFailureFailsDownload) {
    auto content = chunkgate::testing::patternedBytes(300);
    auto uploaded = uploader_.upload("data.bin", ByteSpan(content));
    ASSERT_TRUE(uploaded.ok());
    backends_[4]->failGets = true;

    auto downloaded = downloader_.download(uploaded.data->resourceId);

    ASSERT_FALSE(downloaded.ok());
    EXPECT_EQ(downloaded.error->type, "network_error");
    EXPECT_EQ(downloaded.error->backend, backends_[4]->name());
    EXPECT_EQ(backends_[5]->getCalls.load(), 0);
}

TEST_F(DownloadOrchestratorTest, ChunkMissingFromBackendIsStorageFault) {
    registry_.createEmpty("ghost");
    ChunkLocation location;
    location.resourceId = "ghost";
    location.fileName = "ghost.bin";
    location.order = 0;
    location.backendRef = backends_[0]->address();
    registry_.append("ghost", location);
    ASSERT_TRUE(registry_.commit("ghost"));

    auto downloaded = downloader_.download("ghost");

    ASSERT_FALSE(downloaded.ok());
    EXPECT_EQ(downloaded.error->type, "backend_error");
    EXPECT_EQ(downloaded.error->code, "chunk_not_found");
}

TEST_F(DownloadOrchestratorTest, OrderBeyondBackendListIsInternalError) {
    registry_.createEmpty("stray");
    ChunkLocation location;
    location.resourceId = "stray";
    location.fileName = "stray.bin";
    location.order = 42;
    registry_.append("stray", location);
    ASSERT_TRUE(registry_.commit("stray"));

    auto downloaded = downloader_.download("stray");

    ASSERT_FALSE(downloaded.ok());
    EXPECT_EQ(downloaded.error->type, "internal_error");
    EXPECT_EQ(downloaded.error->code, "backend_out_of_range");
    EXPECT_EQ(totalGetCalls(), 0);
}
