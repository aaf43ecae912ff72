#include "cancel_token.h"

#include <algorithm>

#include <glog/logging.h>

namespace Teepipe {

std::shared_ptr<CancelToken> CancelToken::Background() {
	static const std::shared_ptr<CancelToken> background = std::make_shared<CancelToken>(absl::InfiniteFuture(), false);
	return background;
}

std::shared_ptr<CancelToken> CancelToken::WithCancel() {
	return std::make_shared<CancelToken>();
}

std::shared_ptr<CancelToken> CancelToken::WithDeadline(absl::Time deadline) {
	return std::make_shared<CancelToken>(deadline);
}

std::shared_ptr<CancelToken> CancelToken::WithTimeout(absl::Duration timeout) {
	return std::make_shared<CancelToken>(absl::Now() + timeout);
}

CancelToken::CancelToken(absl::Time deadline, bool cancellable)
	: deadline_(deadline), cancellable_(cancellable) {}

void CancelToken::Cancel() {
	if (!cancellable_) return;
	std::vector<std::pair<CallbackHandle, Callback>> to_run;
	{
		absl::MutexLock lock(&mu_);
		if (!reason_.ok()) return;
		reason_ = absl::CancelledError("cancelled");
		to_run.swap(callbacks_);
	}
	VLOG(2) << "CancelToken: cancelled, running " << to_run.size() << " callbacks";
	// Run outside mu_ so callbacks may take their own locks.
	for (auto& entry : to_run) {
		entry.second();
	}
}

bool CancelToken::Cancelled() const {
	return !Reason().ok();
}

absl::Status CancelToken::Reason() const {
	{
		absl::MutexLock lock(&mu_);
		if (!reason_.ok()) return reason_;
	}
	if (deadline_ != absl::InfiniteFuture() && absl::Now() >= deadline_) {
		absl::MutexLock lock(&mu_);
		if (reason_.ok()) {
			reason_ = absl::DeadlineExceededError("deadline exceeded");
		}
		return reason_;
	}
	return absl::OkStatus();
}

CancelToken::CallbackHandle CancelToken::AddCallback(Callback fn) {
	if (!cancellable_) return 0;
	{
		absl::MutexLock lock(&mu_);
		if (reason_.ok()) {
			CallbackHandle handle = next_handle_++;
			callbacks_.emplace_back(handle, std::move(fn));
			return handle;
		}
	}
	fn();
	return 0;
}

void CancelToken::RemoveCallback(CallbackHandle handle) {
	if (handle == 0) return;
	absl::MutexLock lock(&mu_);
	callbacks_.erase(std::remove_if(callbacks_.begin(), callbacks_.end(),
	                                [handle](const auto& entry) { return entry.first == handle; }),
	                 callbacks_.end());
}

} // namespace Teepipe
