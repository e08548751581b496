#include <gtest/gtest.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <string_view>
#include <vector>

#include "memory_client.hpp"
#include "rangecat/core/errors.hpp"
#include "rangecat/stream/ranged_reader.hpp"

using namespace rangecat::core;
using rangecat::storage::BufferMut;
using rangecat::storage::RangeBody;
using rangecat::stream::RangedObjectReader;
using rangecat::stream::fetch_range_all;
using rangecat::testing::MemoryObjectClient;
using rangecat::testing::pattern_bytes;

namespace {

// Drains the reader and returns chunk sizes; bytes are appended to 'all'.
Status drain(RangedObjectReader& reader, std::vector<std::size_t>* sizes, std::vector<u8>* all) {
    for (;;) {
        OutputChunk chunk;
        bool done = false;
        Status s = reader.next(&chunk, &done);
        if (!is_ok(s)) {
            return s;
        }
        if (done) {
            EXPECT_TRUE(chunk.empty());
            return s;
        }
        sizes->push_back(chunk.size());
        all->insert(all->end(), chunk.bytes.begin(), chunk.bytes.end());
    }
}

// Answers every ranged read with 'extra' bytes more than were asked for.
class OverlongClient final : public rangecat::storage::ObjectClient {
public:
    explicit OverlongClient(u64 extra) : extra_(extra) {}

    Status open_range(const FetchRange& range, std::unique_ptr<RangeBody>* out) const noexcept override {
        *out = std::make_unique<Body>(range.length() + extra_);
        return ok_status();
    }

    Status object_size(std::string_view, std::string_view, u64* out) const noexcept override {
        *out = 0;
        return ok_status();
    }

private:
    class Body final : public RangeBody {
    public:
        explicit Body(u64 left) : left_(left) {}

        Status read(BufferMut out, u32* n) noexcept override {
            const u64 take = std::min<u64>(out.len, left_);
            std::memset(out.data, 0x5a, static_cast<std::size_t>(take));
            left_ -= take;
            *n = static_cast<u32>(take);
            return ok_status();
        }

    private:
        u64 left_;
    };

    u64 extra_;
};

} // namespace

// ============================================================================
// Chunking
// ============================================================================

TEST(RangedReader, SubChunksHaveExactSizeExceptLast) {
    MemoryObjectClient client;
    const auto data = pattern_bytes(1000);
    client.put("c", "k", data);
    client.set_read_size(7); // response framing unrelated to the sub-chunk size

    RangedObjectReader reader(client, FetchRange{"k", "c", 100, 449}, 100);
    std::vector<std::size_t> sizes;
    std::vector<u8> all;
    ASSERT_EQ(drain(reader, &sizes, &all).code, StatusCode::Ok);

    EXPECT_EQ(sizes, (std::vector<std::size_t>{100, 100, 100, 50}));
    EXPECT_EQ(all, std::vector<u8>(data.begin() + 100, data.begin() + 450));
    EXPECT_EQ(reader.bytes_read(), 350u);
}

TEST(RangedReader, ExactMultipleHasNoEmptyTrailingChunk) {
    MemoryObjectClient client;
    client.put("c", "k", pattern_bytes(400));

    RangedObjectReader reader(client, FetchRange{"k", "c", 0, 399}, 100);
    std::vector<std::size_t> sizes;
    std::vector<u8> all;
    ASSERT_EQ(drain(reader, &sizes, &all).code, StatusCode::Ok);
    EXPECT_EQ(sizes, (std::vector<std::size_t>{100, 100, 100, 100}));
}

TEST(RangedReader, SingleByteRange) {
    MemoryObjectClient client;
    const auto data = pattern_bytes(10);
    client.put("c", "k", data);

    RangedObjectReader reader(client, FetchRange{"k", "c", 9, 9}, 64);
    std::vector<std::size_t> sizes;
    std::vector<u8> all;
    ASSERT_EQ(drain(reader, &sizes, &all).code, StatusCode::Ok);
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0], data[9]);
}

TEST(RangedReader, RangePastEndOfObjectIsClipped) {
    MemoryObjectClient client;
    const auto data = pattern_bytes(50);
    client.put("c", "k", data);

    RangedObjectReader reader(client, FetchRange{"k", "c", 40, 99}, 8);
    std::vector<std::size_t> sizes;
    std::vector<u8> all;
    ASSERT_EQ(drain(reader, &sizes, &all).code, StatusCode::Ok);
    EXPECT_EQ(all, std::vector<u8>(data.begin() + 40, data.end()));
}

TEST(RangedReader, DoneIsRepeatable) {
    MemoryObjectClient client;
    client.put("c", "k", pattern_bytes(4));

    RangedObjectReader reader(client, FetchRange{"k", "c", 0, 3}, 16);
    OutputChunk chunk;
    bool done = false;
    ASSERT_EQ(reader.next(&chunk, &done).code, StatusCode::Ok);
    EXPECT_FALSE(done);
    EXPECT_EQ(chunk.size(), 4u);

    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(reader.next(&chunk, &done).code, StatusCode::Ok);
        EXPECT_TRUE(done);
        EXPECT_TRUE(chunk.empty());
    }
    EXPECT_EQ(client.open_bodies(), 0u);
}

// ============================================================================
// Request lifecycle
// ============================================================================

TEST(RangedReader, RequestIsIssuedOnFirstNext) {
    MemoryObjectClient client;
    client.put("c", "k", pattern_bytes(10));

    RangedObjectReader reader(client, FetchRange{"k", "c", 0, 9}, 4);
    EXPECT_EQ(client.request_count(), 0u);

    OutputChunk chunk;
    bool done = false;
    ASSERT_EQ(reader.next(&chunk, &done).code, StatusCode::Ok);
    EXPECT_EQ(client.request_count(), 1u);
    EXPECT_EQ(client.requests()[0], (FetchRange{"k", "c", 0, 9}));
    EXPECT_EQ(client.open_bodies(), 1u);
}

TEST(RangedReader, OpenFailureIsReturnedAndSticky) {
    MemoryObjectClient client;
    client.put("c", "k", pattern_bytes(10));
    client.fail_open("c", "k", make_status(StatusDomain::Net, StatusCode::PermissionDenied, 403));

    RangedObjectReader reader(client, FetchRange{"k", "c", 0, 9}, 4);
    OutputChunk chunk;
    bool done = false;
    Status s = reader.next(&chunk, &done);
    EXPECT_EQ(s.code, StatusCode::PermissionDenied);
    EXPECT_EQ(s.aux, 403u);
    EXPECT_TRUE(is_transport_error(s));

    s = reader.next(&chunk, &done);
    EXPECT_EQ(s.code, StatusCode::PermissionDenied);
    EXPECT_FALSE(done);
    EXPECT_EQ(client.request_count(), 1u);
}

TEST(RangedReader, MissingObjectIsNotFound) {
    MemoryObjectClient client;
    RangedObjectReader reader(client, FetchRange{"nope", "c", 0, 9}, 4);
    OutputChunk chunk;
    bool done = false;
    const Status s = reader.next(&chunk, &done);
    EXPECT_EQ(s.code, StatusCode::NotFound);
    EXPECT_EQ(s.domain, StatusDomain::Storage);
}

TEST(RangedReader, MidBodyFailureAfterDeliveredChunks) {
    MemoryObjectClient client;
    const auto data = pattern_bytes(400);
    client.put("c", "k", data);
    client.fail_after("c", "k", 200);
    client.set_read_size(33);

    RangedObjectReader reader(client, FetchRange{"k", "c", 0, 399}, 100);
    OutputChunk chunk;
    bool done = false;

    ASSERT_EQ(reader.next(&chunk, &done).code, StatusCode::Ok);
    EXPECT_EQ(chunk.bytes, std::vector<u8>(data.begin(), data.begin() + 100));
    ASSERT_EQ(reader.next(&chunk, &done).code, StatusCode::Ok);
    EXPECT_EQ(chunk.bytes, std::vector<u8>(data.begin() + 100, data.begin() + 200));

    Status s = reader.next(&chunk, &done);
    EXPECT_EQ(s.code, StatusCode::Io);
    EXPECT_TRUE(chunk.empty());
    EXPECT_FALSE(done);
    EXPECT_EQ(client.open_bodies(), 0u);

    s = reader.next(&chunk, &done);
    EXPECT_EQ(s.code, StatusCode::Io);
}

TEST(RangedReader, RejectsZeroSubChunkSize) {
    MemoryObjectClient client;
    client.put("c", "k", pattern_bytes(10));
    RangedObjectReader reader(client, FetchRange{"k", "c", 0, 9}, 0);
    OutputChunk chunk;
    bool done = false;
    const Status s = reader.next(&chunk, &done);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(s.domain, StatusDomain::Stream);
    EXPECT_EQ(client.request_count(), 0u);
}

TEST(RangedReader, BodyLongerThanRangeIsTransportError) {
    OverlongClient client(3);
    RangedObjectReader reader(client, FetchRange{"k", "c", 100, 139}, 16);
    std::vector<std::size_t> sizes;
    std::vector<u8> all;
    const Status s = drain(reader, &sizes, &all);
    EXPECT_EQ(s.code, StatusCode::Protocol);
    EXPECT_EQ(s.domain, StatusDomain::Stream);
    EXPECT_TRUE(is_transport_error(s));
    EXPECT_FALSE(is_configuration_error(s));
    EXPECT_EQ(all.size(), 32u);

    OutputChunk chunk;
    bool done = false;
    EXPECT_EQ(reader.next(&chunk, &done).code, StatusCode::Protocol);
}

TEST(RangedReader, NullArgumentsAreInvalid) {
    MemoryObjectClient client;
    RangedObjectReader reader(client, FetchRange{"k", "c", 0, 9}, 4);
    bool done = false;
    EXPECT_EQ(reader.next(nullptr, &done).code, StatusCode::Invalid);
    OutputChunk chunk;
    EXPECT_EQ(reader.next(&chunk, nullptr).code, StatusCode::Invalid);
}

// ============================================================================
// fetch_range_all
// ============================================================================

TEST(FetchRangeAll, CollectsWholeRange) {
    MemoryObjectClient client;
    const auto data = pattern_bytes(300, 5);
    client.put("c", "k", data);
    client.set_read_size(13);

    std::vector<u8> out;
    ASSERT_EQ(fetch_range_all(client, FetchRange{"k", "c", 278, 299}, 8, &out).code, StatusCode::Ok);
    EXPECT_EQ(out, std::vector<u8>(data.begin() + 278, data.end()));
}

TEST(FetchRangeAll, PropagatesFailure) {
    MemoryObjectClient client;
    client.put("c", "k", pattern_bytes(300));
    client.fail_after("c", "k", 10);

    std::vector<u8> out;
    EXPECT_EQ(fetch_range_all(client, FetchRange{"k", "c", 0, 299}, 64, &out).code, StatusCode::Io);
}
