#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

namespace Teepipe {

/**
 * External cancellation source observed by readers during blocking waits.
 *
 * A token fires either when Cancel() is called (reason kCancelled) or when its
 * deadline passes (reason kDeadlineExceeded). The first reason sticks.
 * Deadline expiry needs no timer: waiters bound their wait by deadline().
 *
 * @threading All methods are thread-safe.
 */
class CancelToken {
public:
	using Callback = std::function<void()>;
	using CallbackHandle = uint64_t;

	// A token that never fires.
	static std::shared_ptr<CancelToken> Background();
	static std::shared_ptr<CancelToken> WithCancel();
	static std::shared_ptr<CancelToken> WithDeadline(absl::Time deadline);
	static std::shared_ptr<CancelToken> WithTimeout(absl::Duration timeout);

	explicit CancelToken(absl::Time deadline = absl::InfiniteFuture(), bool cancellable = true);

	CancelToken(const CancelToken&) = delete;
	CancelToken& operator=(const CancelToken&) = delete;

	/**
	 * Fire the token with absl::CancelledError and run registered callbacks.
	 * No-op if it has already fired, and on the Background() token.
	 */
	void Cancel();

	bool Cancelled() const;

	/**
	 * OK while the token has not fired, otherwise the reason it fired.
	 */
	absl::Status Reason() const;

	absl::Time deadline() const { return deadline_; }

	/**
	 * Register fn to run when Cancel() fires. Runs fn immediately (and returns
	 * 0) if the token was already cancelled. Callbacks are not run on deadline
	 * expiry.
	 */
	CallbackHandle AddCallback(Callback fn);
	void RemoveCallback(CallbackHandle handle);

private:
	const absl::Time deadline_;
	const bool cancellable_;

	mutable absl::Mutex mu_;
	// Latched on first observation of expiry, hence mutable.
	mutable absl::Status reason_ ABSL_GUARDED_BY(mu_);
	CallbackHandle next_handle_ ABSL_GUARDED_BY(mu_) = 1;
	std::vector<std::pair<CallbackHandle, Callback>> callbacks_ ABSL_GUARDED_BY(mu_);
};

} // namespace Teepipe
