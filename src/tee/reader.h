#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "cancel_token.h"
#include "chunk_queue.h"
#include "io.h"

namespace Teepipe {

class ReaderRegistry;

struct ReaderStats {
	uint64_t chunks_delivered = 0;
	uint64_t bytes_delivered = 0;
	// Chunks the broadcaster could not enqueue because the queue was full.
	uint64_t chunks_rejected = 0;
	// Chunks discarded by catch-up drops.
	uint64_t chunks_dropped = 0;
};

/**
 * Reader: one consumer of a Broadcaster's stream.
 *
 * Receives a copy of every chunk written while it is registered, minus the
 * chunks it loses by falling behind: a write that finds the queue full is not
 * delivered, and a fill that leaves the queue near capacity discards the
 * whole backlog. Chunks are delivered whole or not at all, in write order.
 *
 * If no chunk is queued when a fill starts and lowwater > 1, the fill waits
 * for lowwater chunks (or end-of-stream / cancellation) and returns them as one
 * burst.
 *
 * @threading Read() and WriteTo() are serialized against each other. Close()
 * may be called from any thread, including while a Read() is blocked; the
 * blocked Read() then observes end-of-stream.
 */
class Reader : public Source, public WriterTo {
public:
	~Reader() override;

	Reader(const Reader&) = delete;
	Reader& operator=(const Reader&) = delete;

	/**
	 * Copy up to len bytes into buf. Returns pending bytes first; otherwise
	 * blocks for the next chunk (or burst). The status is OK, end-of-stream,
	 * or the cancellation token's reason, and may accompany bytes > 0.
	 */
	IoResult Read(void* buf, size_t len) override;

	/**
	 * Forward the stream into sink until end-of-stream, cancellation or a sink
	 * failure. End-of-stream is reported as OK. Closes the reader on return.
	 */
	IoResult WriteTo(Sink& sink) override;

	/**
	 * Deregister from the broadcaster and end the stream. Bytes already queued
	 * stay readable. Idempotent.
	 */
	absl::Status Close() override;

	// 0 if the reader was created after the broadcaster closed.
	uint64_t id() const { return id_; }
	ReaderStats stats() const;

private:
	friend class Broadcaster;

	Reader(uint64_t id,
	       std::shared_ptr<ReaderRegistry> registry,
	       std::shared_ptr<ChunkQueue> queue,
	       int lowwater,
	       std::shared_ptr<CancelToken> cancel);

	// Refill pending from the queue if it is empty. Returns the terminal
	// condition observed, if any.
	absl::Status FillPending() ABSL_EXCLUSIVE_LOCKS_REQUIRED(read_mu_);
	size_t PendingSize() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(read_mu_) {
		return accumulator_.size() - pending_offset_;
	}
	absl::Status FlushPending(Sink& sink, size_t* written) ABSL_EXCLUSIVE_LOCKS_REQUIRED(read_mu_);

	const uint64_t id_;
	const std::shared_ptr<ReaderRegistry> registry_;
	const std::shared_ptr<ChunkQueue> queue_;
	const int lowwater_;
	const std::shared_ptr<CancelToken> cancel_;
	std::atomic<CancelToken::CallbackHandle> cancel_handle_{0};

	absl::Mutex read_mu_;
	// Coalesced bytes of the last fill; pending is [pending_offset_, size()).
	std::string accumulator_ ABSL_GUARDED_BY(read_mu_);
	size_t pending_offset_ ABSL_GUARDED_BY(read_mu_) = 0;
	absl::Status terminal_ ABSL_GUARDED_BY(read_mu_);

	std::atomic<uint64_t> chunks_delivered_{0};
	std::atomic<uint64_t> bytes_delivered_{0};
};

} // namespace Teepipe
