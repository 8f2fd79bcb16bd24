#include "core/ChunkRegistry.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

namespace {

using chunkgate::core::ChunkLocation;
using chunkgate::core::ChunkRegistry;

ChunkLocation makeLocation(const std::string &resourceId, std::uint32_t order) {
    ChunkLocation location;
    location.resourceId = resourceId;
    location.fileName = "report.pdf";
    location.order = order;
    location.backendRef = "http://localhost:" + std::to_string(8081 + order);
    return location;
}

class ChunkRegistryTest : public ::testing::Test {
   protected:
    ChunkRegistry registry_;
};

}  // namespace

TEST_F(ChunkRegistryTest, UnknownResourceIsAbsent) {
    EXPECT_FALSE(registry_.get("missing").has_value());
    EXPECT_EQ(registry_.size(), 0U);
}

TEST_F(ChunkRegistryTest, CreatedEntryStartsEmptyAndUncommitted) {
    registry_.createEmpty("r1", 6);

    auto entry = registry_.get("r1");
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->chunks.empty());
    EXPECT_FALSE(entry->committed);
    EXPECT_EQ(registry_.size(), 1U);
}

TEST_F(ChunkRegistryTest, CommitSortsChunksByOrder) {
    registry_.createEmpty("r1");
    registry_.append("r1", makeLocation("r1", 2));
    registry_.append("r1", makeLocation("r1", 0));
    registry_.append("r1", makeLocation("r1", 1));

    ASSERT_TRUE(registry_.commit("r1"));

    auto entry = registry_.get("r1");
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->committed);
    ASSERT_EQ(entry->chunks.size(), 3U);
    for (std::uint32_t i = 0; i < 3; ++i) {
        EXPECT_EQ(entry->chunks[i].order, i);
        EXPECT_EQ(entry->chunks[i].fileName, "report.pdf");
    }
}

TEST_F(ChunkRegistryTest, CommitOfUnknownResourceFails) {
    EXPECT_FALSE(registry_.commit("nope"));
    EXPECT_EQ(registry_.size(), 0U);
}

TEST_F(ChunkRegistryTest, GetReturnsSnapshot) {
    registry_.createEmpty("r1");
    registry_.append("r1", makeLocation("r1", 0));

    auto snapshot = registry_.get("r1");
    registry_.append("r1", makeLocation("r1", 1));

    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->chunks.size(), 1U);
    EXPECT_EQ(registry_.get("r1")->chunks.size(), 2U);
}

TEST_F(ChunkRegistryTest, ConcurrentAppendsAreAllRecorded) {
    constexpr std::uint32_t kWriters = 8;
    constexpr std::uint32_t kPerWriter = 200;
    registry_.createEmpty("shared", kWriters * kPerWriter);
    registry_.createEmpty("other");

    std::vector<std::thread> writers;
    for (std::uint32_t w = 0; w < kWriters; ++w) {
        writers.emplace_back([this, w]() {
            for (std::uint32_t i = 0; i < kPerWriter; ++i) {
                registry_.append("shared", makeLocation("shared", w * kPerWriter + i));
                if (i % 10 == 0) {
                    registry_.append("other", makeLocation("other", w));
                }
            }
        });
    }
    for (auto &writer : writers) {
        writer.join();
    }

    ASSERT_TRUE(registry_.commit("shared"));
    auto entry = registry_.get("shared");
    ASSERT_TRUE(entry.has_value());
    ASSERT_EQ(entry->chunks.size(), kWriters * kPerWriter);
    for (std::uint32_t i = 0; i < entry->chunks.size(); ++i) {
        EXPECT_EQ(entry->chunks[i].order, i);
        EXPECT_EQ(entry->chunks[i].resourceId, "shared");
    }
    EXPECT_EQ(registry_.get("other")->chunks.size(), kWriters * (kPerWriter / 10));
}
