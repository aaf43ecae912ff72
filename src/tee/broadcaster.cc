#include "broadcaster.h"
#include "reader_registry.h"
#include "../common/configuration.h"

#include <string>
#include <utility>

#include <glog/logging.h>

namespace Teepipe {

Broadcaster::Broadcaster() : registry_(std::make_shared<ReaderRegistry>()) {}

Broadcaster::~Broadcaster() {
	Close().IgnoreError();
}

IoResult Broadcaster::Write(const void* data, size_t len) {
	Chunk chunk = len > 0
		? std::make_shared<std::string>(static_cast<const char*>(data), len)
		: std::make_shared<std::string>();
	size_t accepted = registry_->Broadcast(chunk);
	chunks_written_.fetch_add(1, std::memory_order_relaxed);
	bytes_written_.fetch_add(len, std::memory_order_relaxed);
	deliveries_.fetch_add(accepted, std::memory_order_relaxed);
	VLOG(5) << "Broadcaster::Write len=" << len << " accepted_by=" << accepted;
	return {len, absl::OkStatus()};
}

absl::Status Broadcaster::Close() {
	if (!registry_->CloseAll()) {
		VLOG(1) << "Broadcaster::Close called on a closed broadcaster";
	}
	return absl::OkStatus();
}

std::unique_ptr<Reader> Broadcaster::NewReader(int lowwater, int highwater) {
	return NewReaderWithCancellation(nullptr, lowwater, highwater);
}

std::unique_ptr<Reader> Broadcaster::NewReader() {
	const TeepipeConfig& config = Configuration::getInstance().config();
	return NewReader(config.reader.lowwater.get(), config.reader.highwater.get());
}

std::unique_ptr<Reader> Broadcaster::NewReaderWithCancellation(std::shared_ptr<CancelToken> cancel,
                                                               int lowwater, int highwater) {
	if (highwater < 0) {
		LOG(WARNING) << "Broadcaster::NewReader: negative highwater " << highwater << ", using 0";
		highwater = 0;
	}
	auto queue = std::make_shared<ChunkQueue>(static_cast<size_t>(highwater));
	uint64_t id = registry_->Register(queue);
	if (id == 0) {
		VLOG(1) << "Broadcaster::NewReader after Close; reader starts at end of stream";
	} else {
		VLOG(1) << "Reader " << id << ": registered lowwater=" << lowwater << " highwater=" << highwater;
	}
	return std::unique_ptr<Reader>(
		new Reader(id, registry_, std::move(queue), lowwater, std::move(cancel)));
}

size_t Broadcaster::NumReaders() const {
	return registry_->size();
}

BroadcasterStats Broadcaster::stats() const {
	BroadcasterStats s;
	s.chunks_written = chunks_written_.load(std::memory_order_relaxed);
	s.bytes_written = bytes_written_.load(std::memory_order_relaxed);
	s.deliveries = deliveries_.load(std::memory_order_relaxed);
	return s;
}

} // namespace Teepipe
