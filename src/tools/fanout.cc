#include "fanout.h"

#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <glog/logging.h>

#include "absl/status/status.h"
#include "absl/time/time.h"
#include "../common/scoped_fd.h"
#include "../tee/broadcaster.h"

namespace Teepipe {

namespace {

std::unique_ptr<Sink> OpenOutput(const std::string& prefix, int index) {
	if (prefix.empty()) {
		return std::make_unique<FdSink>(STDOUT_FILENO);
	}
	std::string path = prefix + "." + std::to_string(index);
	ScopedFd fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
	if (!fd.valid()) {
		LOG(ERROR) << "Failed to open " << path << ": " << strerror(errno);
		return nullptr;
	}
	return std::make_unique<FdSink>(std::move(fd));
}

// Returns false if reading in_fd failed.
bool PumpInput(Broadcaster& tee, int in_fd, size_t chunk_size) {
	std::vector<char> buf(chunk_size);
	while (true) {
		ssize_t n = ::read(in_fd, buf.data(), buf.size());
		if (n < 0) {
			if (errno == EINTR) continue;
			LOG(ERROR) << "Failed to read input fd=" << in_fd << ": " << strerror(errno);
			return false;
		}
		if (n == 0) return true;
		tee.Write(buf.data(), static_cast<size_t>(n));
	}
}

} // namespace

int RunFanout(const TeepipeConfig& config, int in_fd) {
	std::vector<std::string> errors;
	if (!Configuration::validateConfig(config, &errors)) {
		for (const auto& error : errors) {
			LOG(ERROR) << "Config validation error: " << error;
		}
		return 1;
	}

	const int num_readers = config.fanout.num_readers.get();
	const int lowwater = config.reader.lowwater.get();
	const int highwater = config.reader.highwater.get();
	const int timeout_ms = config.fanout.timeout_ms.get();
	const size_t chunk_size = config.fanout.chunk_size.get();
	const std::string prefix = config.fanout.output_prefix.get();

	LOG(INFO) << "teepipe_fanout: readers=" << num_readers << " lowwater=" << lowwater
	          << " highwater=" << highwater << " chunk_size=" << chunk_size;

	Broadcaster tee;
	std::vector<std::unique_ptr<Sink>> sinks;
	std::vector<std::unique_ptr<Reader>> readers;
	for (int i = 0; i < num_readers; ++i) {
		std::unique_ptr<Sink> sink = OpenOutput(prefix, i);
		if (!sink) {
			return 1;
		}
		sinks.push_back(std::move(sink));
		if (timeout_ms > 0) {
			readers.push_back(tee.NewReaderWithCancellation(
				CancelToken::WithTimeout(absl::Milliseconds(timeout_ms)), lowwater, highwater));
		} else {
			readers.push_back(tee.NewReader(lowwater, highwater));
		}
	}

	std::vector<IoResult> results(num_readers);
	std::vector<std::thread> workers;
	workers.reserve(num_readers);
	for (int i = 0; i < num_readers; ++i) {
		workers.emplace_back([&, i]() {
			results[i] = readers[i]->WriteTo(*sinks[i]);
		});
	}

	bool ok = PumpInput(tee, in_fd, chunk_size);
	tee.Close().IgnoreError();
	for (auto& worker : workers) {
		worker.join();
	}

	BroadcasterStats tee_stats = tee.stats();
	LOG(INFO) << "teepipe_fanout: wrote " << tee_stats.chunks_written << " chunks ("
	          << tee_stats.bytes_written << " bytes)";
	for (int i = 0; i < num_readers; ++i) {
		ReaderStats s = readers[i]->stats();
		LOG(INFO) << "reader " << i << ": " << results[i].bytes << " bytes, "
		          << s.chunks_delivered << " chunks delivered, " << s.chunks_rejected
		          << " rejected, " << s.chunks_dropped << " dropped";
		if (absl::IsDeadlineExceeded(results[i].status)) {
			LOG(INFO) << "reader " << i << " timed out";
		} else if (!results[i].status.ok()) {
			LOG(ERROR) << "reader " << i << " stopped: " << results[i].status;
			ok = false;
		}
	}
	return ok ? 0 : 1;
}

} // namespace Teepipe
