#include "reader.h"
#include "reader_registry.h"

#include <algorithm>
#include <cstring>
#include <utility>

#include <glog/logging.h>

namespace Teepipe {

namespace {
	// Catch-up drops only apply to queues larger than this.
	constexpr size_t kMinCatchUpCapacity = 2;
}

Reader::Reader(uint64_t id,
               std::shared_ptr<ReaderRegistry> registry,
               std::shared_ptr<ChunkQueue> queue,
               int lowwater,
               std::shared_ptr<CancelToken> cancel)
	: id_(id),
	  registry_(std::move(registry)),
	  queue_(std::move(queue)),
	  lowwater_(lowwater),
	  cancel_(std::move(cancel)) {
	if (cancel_) {
		std::weak_ptr<ChunkQueue> weak_queue = queue_;
		cancel_handle_.store(cancel_->AddCallback([weak_queue]() {
			if (auto q = weak_queue.lock()) {
				q->Interrupt();
			}
		}));
	}
}

Reader::~Reader() {
	Close().IgnoreError();
}

IoResult Reader::Read(void* buf, size_t len) {
	absl::MutexLock lock(&read_mu_);
	IoResult result;
	result.status = FillPending();
	size_t n = std::min(len, PendingSize());
	if (n > 0) {
		std::memcpy(buf, accumulator_.data() + pending_offset_, n);
		pending_offset_ += n;
	}
	result.bytes = n;
	return result;
}

IoResult Reader::WriteTo(Sink& sink) {
	IoResult result;
	{
		absl::MutexLock lock(&read_mu_);
		while (true) {
			absl::Status fill = FillPending();
			absl::Status sink_status = FlushPending(sink, &result.bytes);
			if (!sink_status.ok()) {
				VLOG(1) << "Reader " << id_ << ": sink failed after " << result.bytes
				        << " bytes: " << sink_status;
				result.status = std::move(sink_status);
				break;
			}
			if (!fill.ok()) {
				if (!IsEndOfStream(fill)) {
					result.status = std::move(fill);
				}
				break;
			}
		}
	}
	Close().IgnoreError();
	return result;
}

absl::Status Reader::Close() {
	CancelToken::CallbackHandle handle = cancel_handle_.exchange(0);
	if (cancel_ && handle != 0) {
		cancel_->RemoveCallback(handle);
	}
	if (registry_->Deregister(id_)) {
		VLOG(1) << "Reader " << id_ << ": closed (delivered " << chunks_delivered_.load()
		        << " chunks, " << bytes_delivered_.load() << " bytes)";
	}
	return absl::OkStatus();
}

ReaderStats Reader::stats() const {
	ChunkQueueStats q = queue_->stats();
	ReaderStats s;
	s.chunks_delivered = chunks_delivered_.load(std::memory_order_relaxed);
	s.bytes_delivered = bytes_delivered_.load(std::memory_order_relaxed);
	s.chunks_rejected = q.rejected_full;
	s.chunks_dropped = q.drained;
	return s;
}

absl::Status Reader::FillPending() {
	if (PendingSize() > 0) {
		return absl::OkStatus();
	}
	if (!terminal_.ok()) {
		return terminal_;
	}

	// Only coalesce when already idle; a reader with a backlog takes one chunk.
	int target = 1;
	if (lowwater_ > 1 && queue_->Size() == 0) {
		target = lowwater_;
	}

	accumulator_.clear();
	pending_offset_ = 0;
	for (int i = 0; i < target; ++i) {
		Chunk chunk;
		ChunkQueue::PopResult r = queue_->Pop(&chunk, cancel_.get());
		if (r == ChunkQueue::PopResult::kChunk) {
			accumulator_.append(*chunk);
			chunks_delivered_.fetch_add(1, std::memory_order_relaxed);
			bytes_delivered_.fetch_add(chunk->size(), std::memory_order_relaxed);
			continue;
		}
		if (r == ChunkQueue::PopResult::kClosed) {
			terminal_ = EndOfStreamError();
		} else {
			terminal_ = cancel_->Reason();
			VLOG(1) << "Reader " << id_ << ": " << terminal_;
		}
		break;
	}

	const size_t capacity = queue_->capacity();
	if (capacity > kMinCatchUpCapacity && queue_->Size() >= capacity - 1) {
		size_t dropped = queue_->Drain();
		VLOG(2) << "Reader " << id_ << ": fell behind, dropped " << dropped << " queued chunks";
	}

	return terminal_;
}

absl::Status Reader::FlushPending(Sink& sink, size_t* written) {
	while (PendingSize() > 0) {
		const size_t want = PendingSize();
		IoResult w = sink.Write(accumulator_.data() + pending_offset_, want);
		const size_t n = std::min(w.bytes, want);
		pending_offset_ += n;
		*written += n;
		if (!w.status.ok()) {
			return w.status;
		}
		if (n < want) {
			return absl::DataLossError("short write");
		}
	}
	return absl::OkStatus();
}

} // namespace Teepipe
