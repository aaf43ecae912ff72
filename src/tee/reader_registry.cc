#include "reader_registry.h"

#include <glog/logging.h>

namespace Teepipe {

uint64_t ReaderRegistry::Register(std::shared_ptr<ChunkQueue> queue) {
	absl::MutexLock lock(&mu_);
	if (closed_) {
		queue->Close();
		return 0;
	}
	uint64_t id = next_id_++;
	readers_.emplace(id, std::move(queue));
	return id;
}

bool ReaderRegistry::Deregister(uint64_t id) {
	absl::MutexLock lock(&mu_);
	auto it = readers_.find(id);
	if (it == readers_.end()) {
		return false;
	}
	it->second->Close();
	readers_.erase(it);
	return true;
}

size_t ReaderRegistry::Broadcast(const Chunk& chunk) {
	absl::MutexLock lock(&mu_);
	size_t accepted = 0;
	for (auto& entry : readers_) {
		if (entry.second->TryPush(chunk)) {
			++accepted;
		}
	}
	return accepted;
}

bool ReaderRegistry::CloseAll() {
	absl::MutexLock lock(&mu_);
	if (closed_) {
		return false;
	}
	closed_ = true;
	for (auto& entry : readers_) {
		entry.second->Close();
	}
	VLOG(1) << "ReaderRegistry: closed " << readers_.size() << " readers";
	readers_.clear();
	return true;
}

size_t ReaderRegistry::size() const {
	absl::MutexLock lock(&mu_);
	return readers_.size();
}

} // namespace Teepipe
