#pragma once

/**
 * Broadcaster: non-blocking one-to-many byte pipe ("lossy tee").
 *
 * A single logical producer calls Write()/Close(); any number of Readers,
 * created and closed at any time, each receive a copy of the stream at their
 * own pace. Write() never blocks on a reader: a reader whose queue is full
 * misses that chunk, and a reader that falls far behind drops its backlog to
 * catch up. Each chunk reaches a given reader entirely or not at all.
 *
 * Because Broadcaster is a Sink, a Reader of one broadcaster can WriteTo()
 * another to build tee pipelines.
 *
 * @threading All methods are thread-safe.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "cancel_token.h"
#include "io.h"
#include "reader.h"

namespace Teepipe {

class ReaderRegistry;

struct BroadcasterStats {
	uint64_t chunks_written = 0;
	uint64_t bytes_written = 0;
	// Sum over chunks of the number of readers that accepted each one.
	uint64_t deliveries = 0;
};

class Broadcaster : public Sink {
public:
	Broadcaster();
	// Closes the broadcaster. Outstanding readers drain what they hold, then
	// see end-of-stream.
	~Broadcaster() override;

	Broadcaster(const Broadcaster&) = delete;
	Broadcaster& operator=(const Broadcaster&) = delete;

	/**
	 * Copy data and offer it to every registered reader without blocking.
	 * @return Always {len, OK}; the caller may reuse data immediately.
	 */
	IoResult Write(const void* data, size_t len) override;
	IoResult Write(absl::string_view data) { return Write(data.data(), data.size()); }

	/**
	 * End the stream for every registered reader. Idempotent.
	 */
	absl::Status Close();

	/**
	 * Create and register a reader.
	 * @param lowwater Chunks to coalesce per read when the reader is idle
	 *                 (0 or 1: return on the first chunk)
	 * @param highwater Queue capacity in chunks
	 */
	std::unique_ptr<Reader> NewReader(int lowwater, int highwater);

	// NewReader() with reader.lowwater / reader.highwater from Configuration.
	std::unique_ptr<Reader> NewReader();

	/**
	 * As NewReader(lowwater, highwater); blocking reads also return when
	 * cancel fires, with cancel->Reason() as the status.
	 */
	std::unique_ptr<Reader> NewReaderWithCancellation(std::shared_ptr<CancelToken> cancel,
	                                                  int lowwater, int highwater);

	size_t NumReaders() const;
	BroadcasterStats stats() const;

private:
	std::shared_ptr<ReaderRegistry> registry_;

	std::atomic<uint64_t> chunks_written_{0};
	std::atomic<uint64_t> bytes_written_{0};
	std::atomic<uint64_t> deliveries_{0};
};

} // namespace Teepipe
