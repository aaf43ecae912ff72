#include <gtest/gtest.h>
#include "../../src/tee/broadcaster.h"
#include <atomic>
#include <chrono>
#include <cstring>
#include <thread>
#include <vector>

using namespace Teepipe;
using namespace std::chrono_literals;

namespace {

std::string Bytes(std::initializer_list<int> values) {
    std::string s;
    for (int v : values) s.push_back(static_cast<char>(v));
    return s;
}

// 8-byte chunk: index followed by its complement, so a reader can check that
// every chunk it sees is whole.
std::string SequenceChunk(uint32_t index) {
    uint32_t words[2] = {index, ~index};
    return std::string(reinterpret_cast<const char*>(words), sizeof(words));
}

} // namespace

class BroadcasterTest : public ::testing::Test {
protected:
    Broadcaster tee_;
};

TEST_F(BroadcasterTest, SmallBuffers) {
    auto r0 = tee_.NewReader(0, 0);
    auto r1 = tee_.NewReader(0, 1);
    auto r2 = tee_.NewReader(0, 2);
    tee_.Write(Bytes({1, 2, 3}));
    tee_.Write(Bytes({4, 5, 6}));
    tee_.Write(Bytes({7, 8, 9}));
    ASSERT_TRUE(tee_.Close().ok());

    auto [buf0, err0] = ReadAll(*r0);
    auto [buf1, err1] = ReadAll(*r1);
    auto [buf2, err2] = ReadAll(*r2);
    EXPECT_TRUE(err0.ok());
    EXPECT_TRUE(err1.ok());
    EXPECT_TRUE(err2.ok());
    EXPECT_EQ(buf0, "");
    EXPECT_EQ(buf1, Bytes({1, 2, 3}));
    // Queues of capacity <= 2 never catch-up drop, so the second chunk survives.
    EXPECT_EQ(buf2, Bytes({1, 2, 3, 4, 5, 6}));
}

TEST_F(BroadcasterTest, SmallBufferCatchUp) {
    auto r3 = tee_.NewReader(0, 3);
    tee_.Write(Bytes({1, 2, 3}));
    tee_.Write(Bytes({4, 5, 6}));
    tee_.Write(Bytes({7, 8, 9}));
    tee_.Write(Bytes({10, 11, 12}));
    tee_.Close().IgnoreError();

    // First fill leaves 2 of 3 slots occupied, which drops the backlog.
    auto [buf3, err3] = ReadAll(*r3);
    EXPECT_TRUE(err3.ok());
    EXPECT_EQ(buf3, Bytes({1, 2, 3}));
    EXPECT_EQ(r3->stats().chunks_rejected, 1u);
    EXPECT_EQ(r3->stats().chunks_dropped, 2u);
}

TEST_F(BroadcasterTest, ReadersSeeOnlyLaterWrites) {
    constexpr int kWrites = 256;
    std::vector<std::thread> consumers;
    std::vector<std::unique_ptr<Reader>> idle;
    std::atomic<int> mismatches{0};

    for (int i = 0; i < kWrites; ++i) {
        tee_.Write(Bytes({i & 0xff, (i + 1) & 0xff, (i + 2) & 0xff}));
        auto reader = tee_.NewReader(0, 256);
        if (i % 7 == 3) {
            // Never read; must not hold up the writer or anyone else.
            idle.push_back(std::move(reader));
            continue;
        }
        consumers.emplace_back([i, r = std::move(reader), &mismatches]() {
            auto [buf, err] = ReadAll(*r);
            if (!err.ok() || buf.size() != static_cast<size_t>(3 * (kWrites - 1 - i))) {
                ++mismatches;
            }
            r->Close().IgnoreError();
        });
    }
    ASSERT_TRUE(tee_.Close().ok());
    for (auto& t : consumers) {
        t.join();
    }
    EXPECT_EQ(mismatches.load(), 0);
    for (auto& r : idle) {
        EXPECT_TRUE(r->Close().ok());
    }
}

TEST_F(BroadcasterTest, WriteReportsFullLength) {
    auto reader = tee_.NewReader(0, 1);
    std::string payload(1000, 'x');
    IoResult first = tee_.Write(payload);
    IoResult dropped = tee_.Write(payload);  // reader queue is full
    EXPECT_EQ(first.bytes, payload.size());
    EXPECT_TRUE(first.status.ok());
    EXPECT_EQ(dropped.bytes, payload.size());
    EXPECT_TRUE(dropped.status.ok());
    EXPECT_EQ(reader->stats().chunks_rejected, 1u);
}

TEST_F(BroadcasterTest, WriteCopiesCallerBuffer) {
    auto reader = tee_.NewReader(0, 4);
    char buf[4] = {'a', 'b', 'c', 'd'};
    tee_.Write(buf, sizeof(buf));
    std::memset(buf, 'z', sizeof(buf));
    tee_.Close().IgnoreError();

    auto [data, err] = ReadAll(*reader);
    EXPECT_TRUE(err.ok());
    EXPECT_EQ(data, "abcd");
}

TEST_F(BroadcasterTest, StalledReaderDoesNotBlockWriter) {
    auto stalled = tee_.NewReader(0, 4);
    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 10000; ++i) {
        tee_.Write("chunk");
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    ReaderStats s = stalled->stats();
    EXPECT_EQ(s.chunks_rejected, 10000u - 4u);
    EXPECT_EQ(tee_.stats().chunks_written, 10000u);
    EXPECT_EQ(tee_.stats().deliveries, 4u);
}

TEST_F(BroadcasterTest, CloseIsIdempotent) {
    auto reader = tee_.NewReader(0, 4);
    tee_.Write("x");
    EXPECT_TRUE(tee_.Close().ok());
    EXPECT_TRUE(tee_.Close().ok());

    auto [data, err] = ReadAll(*reader);
    EXPECT_TRUE(err.ok());
    EXPECT_EQ(data, "x");
}

TEST_F(BroadcasterTest, ReaderCreatedAfterCloseIsAtEndOfStream) {
    tee_.Close().IgnoreError();
    auto reader = tee_.NewReader(0, 4);
    tee_.Write("ignored");
    EXPECT_EQ(reader->id(), 0u);
    EXPECT_EQ(tee_.NumReaders(), 0u);

    char buf[16];
    IoResult r = reader->Read(buf, sizeof(buf));
    EXPECT_EQ(r.bytes, 0u);
    EXPECT_TRUE(IsEndOfStream(r.status));
}

TEST_F(BroadcasterTest, NumReadersTracksRegistration) {
    auto a = tee_.NewReader(0, 4);
    auto b = tee_.NewReader(0, 4);
    EXPECT_EQ(tee_.NumReaders(), 2u);
    EXPECT_NE(a->id(), b->id());
    a->Close().IgnoreError();
    EXPECT_EQ(tee_.NumReaders(), 1u);
    b.reset();
    EXPECT_EQ(tee_.NumReaders(), 0u);
}

TEST_F(BroadcasterTest, DefaultReaderUsesConfiguration) {
    auto reader = tee_.NewReader();
    for (int i = 0; i < 100; ++i) {
        tee_.Write("x");
    }
    // Default highwater is 64.
    EXPECT_EQ(reader->stats().chunks_rejected, 36u);
}

TEST(BroadcasterLifetimeTest, ReaderOutlivesBroadcaster) {
    std::unique_ptr<Reader> reader;
    {
        Broadcaster tee;
        reader = tee.NewReader(0, 8);
        tee.Write("before destruction");
    }
    auto [data, err] = ReadAll(*reader);
    EXPECT_TRUE(err.ok());
    EXPECT_EQ(data, "before destruction");
    EXPECT_TRUE(reader->Close().ok());
}

TEST(BroadcasterPipelineTest, ReaderFeedsAnotherBroadcaster) {
    Broadcaster upstream;
    Broadcaster downstream;
    auto bridge = upstream.NewReader(0, 16);
    auto sink_reader = downstream.NewReader(0, 16);

    std::thread pump([&]() {
        IoResult r = bridge->WriteTo(downstream);
        EXPECT_TRUE(r.status.ok());
        EXPECT_EQ(r.bytes, 6u);
        downstream.Close().IgnoreError();
    });
    upstream.Write("abc");
    upstream.Write("def");
    upstream.Close().IgnoreError();
    pump.join();

    auto [data, err] = ReadAll(*sink_reader);
    EXPECT_TRUE(err.ok());
    EXPECT_EQ(data, "abcdef");
}

TEST_F(BroadcasterTest, ConcurrentReadersObserveWholeChunksInOrder) {
    constexpr uint32_t kChunks = 20000;
    struct Config { int lowwater; int highwater; };
    const std::vector<Config> configs = {{0, 3}, {1, 8}, {4, 16}, {0, 1024}, {8, 64}};

    std::vector<std::thread> consumers;
    std::atomic<int> violations{0};
    for (size_t c = 0; c < configs.size(); ++c) {
        auto reader = tee_.NewReader(configs[c].lowwater, configs[c].highwater);
        consumers.emplace_back([c, r = std::move(reader), &violations]() {
            std::string stream;
            char buf[24];  // deliberately not a multiple of the chunk size
            while (true) {
                IoResult res = r->Read(buf, sizeof(buf));
                stream.append(buf, res.bytes);
                if (c % 2 == 0) std::this_thread::yield();
                if (!res.status.ok()) {
                    if (!IsEndOfStream(res.status)) ++violations;
                    break;
                }
            }
            if (stream.size() % 8 != 0) {
                ++violations;
                return;
            }
            int64_t last = -1;
            for (size_t off = 0; off < stream.size(); off += 8) {
                uint32_t words[2];
                std::memcpy(words, stream.data() + off, sizeof(words));
                if (words[1] != ~words[0] || static_cast<int64_t>(words[0]) <= last) {
                    ++violations;
                    return;
                }
                last = words[0];
            }
        });
    }
    for (uint32_t i = 0; i < kChunks; ++i) {
        tee_.Write(SequenceChunk(i));
    }
    tee_.Close().IgnoreError();
    for (auto& t : consumers) {
        t.join();
    }
    EXPECT_EQ(violations.load(), 0);
}
