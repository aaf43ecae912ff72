#include "chunk_queue.h"
#include "cancel_token.h"

#include <algorithm>
#include <sys/types.h>

namespace Teepipe {

ChunkQueue::ChunkQueue(size_t capacity) : capacity_(capacity) {
	if (capacity_ > 0) {
		queue_ = std::make_unique<folly::MPMCQueue<Chunk>>(capacity_);
	}
}

bool ChunkQueue::TryPush(Chunk chunk) {
	if (closed_.load(std::memory_order_acquire)) {
		return false;
	}
	if (!queue_ || !queue_->write(std::move(chunk))) {
		rejected_full_.fetch_add(1, std::memory_order_relaxed);
		return false;
	}
	accepted_.fetch_add(1, std::memory_order_relaxed);
	Notify();
	return true;
}

ChunkQueue::PopResult ChunkQueue::Pop(Chunk* out, const CancelToken* cancel) {
	const absl::Time deadline = cancel ? cancel->deadline() : absl::InfiniteFuture();
	absl::MutexLock lock(&mu_);
	while (true) {
		if (cancel && cancel->Cancelled()) {
			return PopResult::kCancelled;
		}
		if (TryRead(out)) {
			return PopResult::kChunk;
		}
		if (closed_.load(std::memory_order_acquire)) {
			// A push may have landed between the read above and the close.
			return TryRead(out) ? PopResult::kChunk : PopResult::kClosed;
		}
		// Producers bump epoch_ under mu_ after a successful write, so a chunk
		// that arrived after TryRead() above cannot be missed here.
		const uint64_t seen = epoch_;
		while (epoch_ == seen) {
			if (cv_.WaitWithDeadline(&mu_, deadline)) {
				break;  // deadline reached; re-check cancel
			}
		}
	}
}

bool ChunkQueue::Close() {
	bool expected = false;
	if (!closed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
		return false;
	}
	Notify();
	return true;
}

void ChunkQueue::Interrupt() {
	Notify();
}

size_t ChunkQueue::Drain() {
	size_t n = 0;
	Chunk discarded;
	while (TryRead(&discarded)) {
		++n;
	}
	if (n > 0) {
		drained_.fetch_add(n, std::memory_order_relaxed);
	}
	return n;
}

size_t ChunkQueue::Size() const {
	if (!queue_) return 0;
	return static_cast<size_t>(std::max<ssize_t>(0, queue_->sizeGuess()));
}

ChunkQueueStats ChunkQueue::stats() const {
	ChunkQueueStats s;
	s.accepted = accepted_.load(std::memory_order_relaxed);
	s.rejected_full = rejected_full_.load(std::memory_order_relaxed);
	s.drained = drained_.load(std::memory_order_relaxed);
	return s;
}

bool ChunkQueue::TryRead(Chunk* out) {
	return queue_ && queue_->read(*out);
}

void ChunkQueue::Notify() {
	absl::MutexLock lock(&mu_);
	++epoch_;
	cv_.SignalAll();
}

} // namespace Teepipe
