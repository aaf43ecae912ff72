#pragma once

/**
 * Byte-stream capabilities shared by the tee and its callers.
 *
 * Results are reported as IoResult: a byte count plus an absl::Status. A non-OK
 * status may accompany a positive byte count; callers consume the bytes first.
 * End-of-stream is absl::OutOfRangeError (see EndOfStreamError()).
 */

#include <cstddef>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "../common/scoped_fd.h"

namespace Teepipe {

struct IoResult {
	size_t bytes = 0;
	absl::Status status;
};

absl::Status EndOfStreamError();
bool IsEndOfStream(const absl::Status& status);

/**
 * Destination of bytes. A Write that returns fewer bytes than requested must
 * also return a non-OK status.
 */
class Sink {
public:
	virtual ~Sink() = default;
	virtual IoResult Write(const void* data, size_t len) = 0;
};

/**
 * Readable, closable byte stream.
 */
class Source {
public:
	virtual ~Source() = default;
	virtual IoResult Read(void* buf, size_t len) = 0;
	virtual absl::Status Close() = 0;
};

/**
 * Implemented by sources that can push their contents into a sink without an
 * intermediate copy buffer.
 */
class WriterTo {
public:
	virtual ~WriterTo() = default;
	virtual IoResult WriteTo(Sink& sink) = 0;
};

/**
 * Copy src into dst until end-of-stream, an error, or a sink failure.
 * Clean end-of-stream is reported as OK.
 */
IoResult Copy(Sink& dst, Source& src);

/**
 * Read src to end-of-stream. Clean end-of-stream is reported as OK.
 */
std::pair<std::string, absl::Status> ReadAll(Source& src);

// Appends everything written to an in-memory string.
class StringSink : public Sink {
public:
	IoResult Write(const void* data, size_t len) override;

	const std::string& contents() const { return contents_; }
	std::string Release() { return std::move(contents_); }

private:
	std::string contents_;
};

/**
 * Writes to a POSIX file descriptor. Retries on EINTR and partial writes.
 * An owned descriptor is closed on destruction.
 */
class FdSink : public Sink {
public:
	// Borrow fd; the caller keeps ownership.
	explicit FdSink(int fd) : fd_(fd) {}
	// Take ownership of fd.
	explicit FdSink(ScopedFd fd) : owned_(std::move(fd)), fd_(owned_.get()) {}

	IoResult Write(const void* data, size_t len) override;

	int fd() const { return fd_; }

private:
	ScopedFd owned_;
	int fd_;
};

} // namespace Teepipe
