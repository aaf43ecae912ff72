#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "chunk_queue.h"

namespace Teepipe {

/**
 * Set of active reader queues keyed by a monotonically increasing id.
 *
 * One mutex guards membership and the enumeration done by Broadcast() and
 * CloseAll(). It is never held across a blocking queue operation: queue pushes
 * are non-blocking.
 *
 * Shared (via shared_ptr) by a Broadcaster and every Reader it creates, so a
 * Reader can deregister itself even after the Broadcaster is gone.
 */
class ReaderRegistry {
public:
	ReaderRegistry() = default;
	ReaderRegistry(const ReaderRegistry&) = delete;
	ReaderRegistry& operator=(const ReaderRegistry&) = delete;

	/**
	 * Register queue and return its id. If the registry is already closed the
	 * queue is closed instead and 0 is returned.
	 */
	uint64_t Register(std::shared_ptr<ChunkQueue> queue);

	/**
	 * Remove id and close its queue. Returns false if id is not registered.
	 */
	bool Deregister(uint64_t id);

	/**
	 * Offer chunk to every registered queue without blocking.
	 * @return Number of queues that accepted it.
	 */
	size_t Broadcast(const Chunk& chunk);

	/**
	 * Close every registered queue and clear the registry. Later calls are
	 * no-ops and return false.
	 */
	bool CloseAll();

	size_t size() const;

private:
	mutable absl::Mutex mu_;
	absl::flat_hash_map<uint64_t, std::shared_ptr<ChunkQueue>> readers_ ABSL_GUARDED_BY(mu_);
	uint64_t next_id_ ABSL_GUARDED_BY(mu_) = 1;
	bool closed_ ABSL_GUARDED_BY(mu_) = false;
};

} // namespace Teepipe
