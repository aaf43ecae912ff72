#include <gtest/gtest.h>
#include "../../src/tee/io.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <unistd.h>

using namespace Teepipe;

namespace {

// Source over a fixed string, returning at most step bytes per Read.
class StringSource : public Source {
public:
    StringSource(std::string data, size_t step) : data_(std::move(data)), step_(step) {}

    IoResult Read(void* buf, size_t len) override {
        size_t n = std::min({len, step_, data_.size() - offset_});
        std::memcpy(buf, data_.data() + offset_, n);
        offset_ += n;
        IoResult r{n, absl::OkStatus()};
        if (offset_ == data_.size()) {
            r.status = fail_with_.ok() ? EndOfStreamError() : fail_with_;
        }
        return r;
    }

    absl::Status Close() override { return absl::OkStatus(); }

    void FailAtEnd(absl::Status status) { fail_with_ = std::move(status); }

private:
    std::string data_;
    size_t step_;
    size_t offset_ = 0;
    absl::Status fail_with_;
};

class PushingSource : public StringSource, public WriterTo {
public:
    using StringSource::StringSource;

    IoResult WriteTo(Sink& sink) override {
        ++write_to_calls;
        return sink.Write("pushed", 6);
    }

    int write_to_calls = 0;
};

} // namespace

TEST(IoTest, EndOfStreamIsOutOfRange) {
    EXPECT_TRUE(IsEndOfStream(EndOfStreamError()));
    EXPECT_FALSE(IsEndOfStream(absl::OkStatus()));
    EXPECT_FALSE(IsEndOfStream(absl::CancelledError()));
}

TEST(IoTest, ReadAllCollectsEverything) {
    std::string payload(5000, 'q');
    StringSource src(payload, 333);
    auto [data, err] = ReadAll(src);
    EXPECT_TRUE(err.ok());
    EXPECT_EQ(data, payload);
}

TEST(IoTest, ReadAllReturnsErrorWithPartialData) {
    StringSource src("partial", 3);
    src.FailAtEnd(absl::AbortedError("boom"));
    auto [data, err] = ReadAll(src);
    EXPECT_TRUE(absl::IsAborted(err));
    EXPECT_EQ(data, "partial");
}

TEST(IoTest, CopyUsesReadLoop) {
    StringSource src("abcdefghij", 4);
    StringSink sink;
    IoResult r = Copy(sink, src);
    EXPECT_TRUE(r.status.ok());
    EXPECT_EQ(r.bytes, 10u);
    EXPECT_EQ(sink.contents(), "abcdefghij");
}

TEST(IoTest, CopyPrefersWriteTo) {
    PushingSource src("unused", 1);
    StringSink sink;
    IoResult r = Copy(sink, src);
    EXPECT_TRUE(r.status.ok());
    EXPECT_EQ(src.write_to_calls, 1);
    EXPECT_EQ(sink.contents(), "pushed");
}

TEST(IoTest, StringSinkRelease) {
    StringSink sink;
    sink.Write("abc", 3);
    EXPECT_EQ(sink.Release(), "abc");
}

TEST(IoTest, FdSinkWritesToPipe) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    ScopedFd read_end(fds[0]);
    {
        FdSink sink{ScopedFd(fds[1])};
        IoResult r = sink.Write("hello", 5);
        EXPECT_TRUE(r.status.ok());
        EXPECT_EQ(r.bytes, 5u);
    }
    // The owned write end is closed, so the reader sees EOF after the data.
    char buf[16];
    ssize_t n = ::read(read_end.get(), buf, sizeof(buf));
    ASSERT_EQ(n, 5);
    EXPECT_EQ(std::string(buf, 5), "hello");
    EXPECT_EQ(::read(read_end.get(), buf, sizeof(buf)), 0);
}

TEST(IoTest, FdSinkReportsErrno) {
    FdSink sink(-1);
    IoResult r = sink.Write("x", 1);
    EXPECT_EQ(r.bytes, 0u);
    EXPECT_FALSE(r.status.ok());
    EXPECT_EQ(absl::ErrnoToStatus(EBADF, "").code(), r.status.code());
}
