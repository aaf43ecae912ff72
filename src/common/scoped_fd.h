// RAII wrapper for file descriptors handed to an FdSink.
#ifndef TEEPIPE_SRC_COMMON_SCOPED_FD_H_
#define TEEPIPE_SRC_COMMON_SCOPED_FD_H_

#include <unistd.h>

namespace Teepipe {

struct ScopedFd {
	int fd = -1;

	ScopedFd() = default;
	explicit ScopedFd(int f) : fd(f) {}

	~ScopedFd() { Reset(); }

	ScopedFd(const ScopedFd&) = delete;
	ScopedFd& operator=(const ScopedFd&) = delete;

	ScopedFd(ScopedFd&& o) noexcept : fd(o.fd) { o.fd = -1; }
	ScopedFd& operator=(ScopedFd&& o) noexcept {
		if (this != &o) {
			Reset();
			fd = o.fd;
			o.fd = -1;
		}
		return *this;
	}

	int get() const { return fd; }
	bool valid() const { return fd >= 0; }

	void Reset() {
		if (fd >= 0) {
			::close(fd);
			fd = -1;
		}
	}
};

}  // namespace Teepipe

#endif  // TEEPIPE_SRC_COMMON_SCOPED_FD_H_
