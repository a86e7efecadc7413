#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "crypto/digest.hpp"
#include "protocol/header_block.hpp"
#include "store/memory_store.hpp"
#include "store/store.hpp"
#include "test_utils.hpp"

using namespace gntp::store;

class StoreTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir;
    std::unique_ptr<Store> store;
    gntp::protocol::HeaderBlock resource_headers;

    void SetUp() override {
        gntp::test::quiet_logging();
        test_dir = std::filesystem::temp_directory_path() /
            ("resource_store_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(test_dir);
        store = std::make_unique<Store>(test_dir.string());
    }

    void TearDown() override {
        store.reset();
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    // Writes data through a cache slot the way the resource reader does
    CacheSlot write_slot(const std::string& identifier, const std::string& data) {
        CacheSlot slot = store->acquire_cache_slot(identifier, resource_headers);
        if (slot.sink) {
            slot.sink->write(data.data(), static_cast<std::streamsize>(data.size()));
        }
        return slot;
    }

    std::string read_stored(const std::string& identifier) const {
        std::ifstream file(store->resolve_key_path(identifier), std::ios::binary);
        std::ostringstream content;
        if (file.peek() != std::ifstream::traits_type::eof()) {
            content << file.rdbuf();
        }
        return content.str();
    }

    std::size_t count_part_files() const {
        std::size_t count = 0;
        for (const auto& entry : std::filesystem::recursive_directory_iterator(test_dir)) {
            if (entry.path().extension() == ".part") {
                ++count;
            }
        }
        return count;
    }
};

//==============================================
// KEY LAYOUT
//==============================================

TEST_F(StoreTest, KeyPathLayout) {
    const std::filesystem::path path = store->resolve_key_path("icon");
    const std::filesystem::path relative = std::filesystem::relative(path, test_dir);

    std::vector<std::string> parts;
    for (const auto& part : relative) {
        parts.push_back(part.string());
    }
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0].size(), 2u);
    EXPECT_EQ(parts[1].size(), 2u);
    EXPECT_EQ(parts[2].size(), 2u);
    EXPECT_EQ(parts[3].size(), 58u);
    EXPECT_EQ(parts[0] + parts[1] + parts[2] + parts[3],
              gntp::crypto::to_hex(gntp::crypto::compute_digest(gntp::crypto::HashAlgorithm::SHA256,
                                                                std::vector<uint8_t>{'i', 'c', 'o', 'n'})));

    EXPECT_EQ(store->resolve_key_path("icon"), path);
    EXPECT_NE(store->resolve_key_path("other"), path);
    EXPECT_FALSE(store->has("icon"));
}

//==============================================
// CACHE SLOTS
//==============================================

TEST_F(StoreTest, MissThenCommitThenHit) {
    CacheSlot slot = write_slot("res-1", "payload");
    EXPECT_FALSE(slot.already_cached);
    ASSERT_NE(slot.sink, nullptr);
    EXPECT_EQ(slot.location, store->resolve_key_path("res-1").string());
    EXPECT_FALSE(store->has("res-1"));

    store->commit_cache_slot(slot);
    EXPECT_TRUE(store->has("res-1"));
    EXPECT_EQ(count_part_files(), 0u);
    EXPECT_EQ(read_stored("res-1"), "payload");

    const CacheSlot second = store->acquire_cache_slot("res-1", resource_headers);
    EXPECT_TRUE(second.already_cached);
    EXPECT_EQ(second.sink, nullptr);
    EXPECT_EQ(second.location, slot.location);
}

TEST_F(StoreTest, EmptyResourceCommits) {
    CacheSlot slot = write_slot("empty", "");
    ASSERT_NE(slot.sink, nullptr);
    EXPECT_NO_THROW(store->commit_cache_slot(slot));

    EXPECT_TRUE(store->has("empty"));
    EXPECT_EQ(std::filesystem::file_size(store->resolve_key_path("empty")), 0u);
    EXPECT_TRUE(store->acquire_cache_slot("empty", resource_headers).already_cached);
}

TEST_F(StoreTest, BinaryPayloadKeptExactly) {
    const std::string payload("\x89PNG\r\n\x1a\n\0\xff", 10);
    CacheSlot slot = write_slot("icon", payload);
    store->commit_cache_slot(slot);

    EXPECT_EQ(read_stored("icon"), payload);
}

TEST_F(StoreTest, AbandonRemovesPartialFile) {
    CacheSlot slot = write_slot("res-2", "half");
    EXPECT_EQ(count_part_files(), 1u);

    store->abandon_cache_slot(slot);
    EXPECT_EQ(count_part_files(), 0u);
    EXPECT_FALSE(store->has("res-2"));

    // A second abandon of the same slot is a no-op
    EXPECT_NO_THROW(store->abandon_cache_slot(slot));
}

TEST_F(StoreTest, ConcurrentSlotsForSameKey) {
    CacheSlot first = write_slot("shared", "same bytes");
    CacheSlot second = write_slot("shared", "same bytes");
    EXPECT_FALSE(first.already_cached);
    EXPECT_FALSE(second.already_cached);
    EXPECT_EQ(count_part_files(), 2u);

    store->commit_cache_slot(first);
    store->commit_cache_slot(second);
    EXPECT_EQ(count_part_files(), 0u);
    EXPECT_EQ(std::filesystem::file_size(store->resolve_key_path("shared")), 10u);
    EXPECT_EQ(read_stored("shared"), "same bytes");
}

TEST_F(StoreTest, CommitUnknownSlotThrows) {
    CacheSlot foreign;
    foreign.identifier = "foreign";
    foreign.sink = std::make_shared<std::ostringstream>();
    EXPECT_THROW(store->commit_cache_slot(foreign), StoreError);

    CacheSlot slot = write_slot("once", "x");
    store->commit_cache_slot(slot);
    EXPECT_THROW(store->commit_cache_slot(slot), StoreError);
}

//==============================================
// MEMORY AND DISCARD STORES
//==============================================

class MemoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        gntp::test::quiet_logging();
    }

    static void commit(MemoryStore& target, const std::string& identifier, const std::string& data) {
        gntp::protocol::HeaderBlock headers;
        CacheSlot slot = target.acquire_cache_slot(identifier, headers);
        ASSERT_NE(slot.sink, nullptr);
        *slot.sink << data;
        target.commit_cache_slot(slot);
    }

    MemoryStore store;
    gntp::protocol::HeaderBlock resource_headers;
};

TEST_F(MemoryStoreTest, MissThenCommitThenHit) {
    CacheSlot slot = store.acquire_cache_slot("img", resource_headers);
    EXPECT_FALSE(slot.already_cached);
    EXPECT_EQ(slot.location, "memory://img");
    ASSERT_NE(slot.sink, nullptr);

    *slot.sink << "bytes";
    EXPECT_FALSE(store.has("img"));
    store.commit_cache_slot(slot);

    EXPECT_TRUE(store.has("img"));
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.total_bytes(), 5u);
    EXPECT_EQ(store.get("img"), std::string("bytes"));

    const CacheSlot hit = store.acquire_cache_slot("img", resource_headers);
    EXPECT_TRUE(hit.already_cached);
    EXPECT_EQ(hit.sink, nullptr);
}

TEST_F(MemoryStoreTest, UnknownIdentifier) {
    EXPECT_FALSE(store.get("nothing").has_value());
    EXPECT_FALSE(store.has("nothing"));
    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(store.max_bytes(), MemoryStore::DEFAULT_MAX_BYTES);
}

TEST_F(MemoryStoreTest, AbandonKeepsNothing) {
    CacheSlot slot = store.acquire_cache_slot("img", resource_headers);
    *slot.sink << "partial";
    store.abandon_cache_slot(slot);
    EXPECT_FALSE(store.has("img"));
    EXPECT_EQ(store.total_bytes(), 0u);
}

TEST_F(MemoryStoreTest, CommitWithoutBufferThrows) {
    CacheSlot slot;
    slot.identifier = "img";
    EXPECT_THROW(store.commit_cache_slot(slot), std::invalid_argument);
}

TEST_F(MemoryStoreTest, EvictsOldestPastLimit) {
    MemoryStore bounded(10);
    commit(bounded, "first", "aaaa");
    commit(bounded, "second", "bbbb");
    EXPECT_EQ(bounded.total_bytes(), 8u);

    commit(bounded, "third", "cccc");
    EXPECT_FALSE(bounded.has("first"));
    EXPECT_TRUE(bounded.has("second"));
    EXPECT_TRUE(bounded.has("third"));
    EXPECT_EQ(bounded.size(), 2u);
    EXPECT_EQ(bounded.total_bytes(), 8u);

    // An evicted resource is a cache miss again
    EXPECT_FALSE(bounded.acquire_cache_slot("first", resource_headers).already_cached);
}

TEST_F(MemoryStoreTest, OversizedPayloadNotKept) {
    MemoryStore bounded(4);
    commit(bounded, "small", "abc");
    commit(bounded, "huge", "0123456789");

    EXPECT_FALSE(bounded.has("huge"));
    EXPECT_TRUE(bounded.has("small"));
    EXPECT_EQ(bounded.total_bytes(), 3u);
}

TEST_F(MemoryStoreTest, RecommitReplacesSize) {
    // Two requests racing on the same identifier both miss
    MemoryStore bounded(10);
    CacheSlot first = bounded.acquire_cache_slot("img", resource_headers);
    CacheSlot second = bounded.acquire_cache_slot("img", resource_headers);
    ASSERT_NE(first.sink, nullptr);
    ASSERT_NE(second.sink, nullptr);
    *first.sink << "123456";
    *second.sink << "12";
    bounded.commit_cache_slot(first);
    bounded.commit_cache_slot(second);
    EXPECT_EQ(bounded.size(), 1u);

    commit(bounded, "other", "12345678");

    EXPECT_TRUE(bounded.has("img"));
    EXPECT_TRUE(bounded.has("other"));
    EXPECT_EQ(bounded.get("img"), std::string("12"));
    EXPECT_EQ(bounded.total_bytes(), 10u);
}

TEST(DiscardStoreTest, DropsEverything) {
    gntp::test::quiet_logging();
    DiscardStore store;
    gntp::protocol::HeaderBlock resource_headers;

    const CacheSlot slot = store.acquire_cache_slot("img", resource_headers);
    EXPECT_FALSE(slot.already_cached);
    EXPECT_EQ(slot.sink, nullptr);
    EXPECT_TRUE(slot.location.empty());
    EXPECT_NO_THROW(store.commit_cache_slot(slot));
}
