#pragma once

/**
 * ChunkQueue: bounded per-reader delivery queue.
 *
 * Storage is a folly::MPMCQueue of shared, immutable chunks. The producer side
 * (TryPush) never blocks: a full queue rejects the chunk. The consumer side
 * (Pop) blocks on a three-way wait: next chunk, end-of-stream, cancellation.
 * Wakeups use an epoch counter under mu_, the same event-driven pattern as a
 * per-queue condition variable in front of a lock-free queue.
 *
 * @threading One producer at a time (serialized by the broadcaster's registry
 * lock) and one consumer at a time (serialized by the reader). Close() and
 * Interrupt() may be called from any thread.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "folly/MPMCQueue.h"

namespace Teepipe {

class CancelToken;

// One Write() call's bytes, shared read-only by every reader that received it.
using Chunk = std::shared_ptr<const std::string>;

struct ChunkQueueStats {
	uint64_t accepted = 0;
	uint64_t rejected_full = 0;
	uint64_t drained = 0;
};

class ChunkQueue {
public:
	enum class PopResult {
		kChunk,
		kClosed,
		kCancelled,
	};

	/**
	 * @param capacity Maximum number of queued chunks. 0 accepts nothing.
	 */
	explicit ChunkQueue(size_t capacity);

	ChunkQueue(const ChunkQueue&) = delete;
	ChunkQueue& operator=(const ChunkQueue&) = delete;

	/**
	 * Non-blocking enqueue. Returns false (and drops chunk) when the queue is
	 * full or closed.
	 */
	bool TryPush(Chunk chunk);

	/**
	 * Block until a chunk is available, the queue is closed and empty, or
	 * cancel fires (cancel may be null). Chunks still buffered at close are
	 * returned before kClosed.
	 */
	PopResult Pop(Chunk* out, const CancelToken* cancel);

	/**
	 * Mark end-of-stream and wake the consumer. Returns true if this call
	 * closed the queue.
	 */
	bool Close();

	// Wake the consumer so it re-checks its cancellation token.
	void Interrupt();

	// Discard every queued chunk; returns the number discarded.
	size_t Drain();

	size_t Size() const;
	size_t capacity() const { return capacity_; }
	bool closed() const { return closed_.load(std::memory_order_acquire); }
	ChunkQueueStats stats() const;

private:
	bool TryRead(Chunk* out);
	void Notify();

	const size_t capacity_;
	// Null when capacity_ == 0; folly::MPMCQueue requires a positive capacity.
	std::unique_ptr<folly::MPMCQueue<Chunk>> queue_;
	std::atomic<bool> closed_{false};

	absl::Mutex mu_;
	absl::CondVar cv_;
	uint64_t epoch_ ABSL_GUARDED_BY(mu_) = 0;

	std::atomic<uint64_t> accepted_{0};
	std::atomic<uint64_t> rejected_full_{0};
	std::atomic<uint64_t> drained_{0};
};

} // namespace Teepipe
