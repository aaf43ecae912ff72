#include "io.h"

#include <cerrno>
#include <vector>

#include <unistd.h>

#include <glog/logging.h>

namespace Teepipe {

namespace {
	constexpr size_t kCopyBufferSize = 32 * 1024;
	constexpr size_t kReadAllInitialSize = 512;
}

absl::Status EndOfStreamError() {
	return absl::OutOfRangeError("end of stream");
}

bool IsEndOfStream(const absl::Status& status) {
	return absl::IsOutOfRange(status);
}

IoResult Copy(Sink& dst, Source& src) {
	if (auto* writer_to = dynamic_cast<WriterTo*>(&src)) {
		IoResult result = writer_to->WriteTo(dst);
		if (IsEndOfStream(result.status)) {
			result.status = absl::OkStatus();
		}
		return result;
	}

	IoResult total;
	std::vector<char> buf(kCopyBufferSize);
	while (true) {
		IoResult r = src.Read(buf.data(), buf.size());
		if (r.bytes > 0) {
			IoResult w = dst.Write(buf.data(), r.bytes);
			total.bytes += w.bytes;
			if (!w.status.ok()) {
				total.status = w.status;
				return total;
			}
			if (w.bytes != r.bytes) {
				total.status = absl::DataLossError("short write");
				return total;
			}
		}
		if (IsEndOfStream(r.status)) {
			return total;
		}
		if (!r.status.ok()) {
			total.status = r.status;
			return total;
		}
	}
}

std::pair<std::string, absl::Status> ReadAll(Source& src) {
	std::string out;
	out.resize(kReadAllInitialSize);
	size_t filled = 0;
	while (true) {
		if (filled == out.size()) {
			out.resize(out.size() * 2);
		}
		IoResult r = src.Read(&out[filled], out.size() - filled);
		filled += r.bytes;
		if (!r.status.ok()) {
			out.resize(filled);
			if (IsEndOfStream(r.status)) {
				return {std::move(out), absl::OkStatus()};
			}
			return {std::move(out), r.status};
		}
	}
}

IoResult StringSink::Write(const void* data, size_t len) {
	contents_.append(static_cast<const char*>(data), len);
	return {len, absl::OkStatus()};
}

IoResult FdSink::Write(const void* data, size_t len) {
	IoResult result;
	const char* p = static_cast<const char*>(data);
	while (result.bytes < len) {
		ssize_t n = ::write(fd_, p + result.bytes, len - result.bytes);
		if (n < 0) {
			if (errno == EINTR) continue;
			int err = errno;
			VLOG(1) << "FdSink: write to fd=" << fd_ << " failed after " << result.bytes << " bytes";
			result.status = absl::ErrnoToStatus(err, "write");
			return result;
		}
		result.bytes += static_cast<size_t>(n);
	}
	return result;
}

} // namespace Teepipe
