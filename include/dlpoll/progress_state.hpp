#pragma once

#include <dlpoll/dlpoll_export.h>

#include <cstdint>
#include <dlpoll/types.hpp>
#include <mutex>

namespace dlpoll {

/// ProgressState - the single shared progress record.
///
/// Holds the latest ProgressSnapshot. Writers replace the whole value and
/// readers receive a copy, so a poller can never observe a mix of old and new
/// fields. The lock is only held for the copy, so read() never waits on a
/// running download.
class DLPOLL_EXPORT ProgressState {
   public:
	ProgressState() = default;
	explicit ProgressState(ProgressSnapshot initial);

	ProgressState(const ProgressState &) = delete;
	ProgressState &operator=(const ProgressState &) = delete;

	/// Replace the current snapshot. Values are clamped to the snapshot
	/// invariants (percent in [0, 100], current <= total) before publishing.
	void write(ProgressSnapshot snapshot);

	[[nodiscard]] ProgressSnapshot read() const;

	/// Number of writes so far; lets tests and pollers detect a change.
	[[nodiscard]] std::uint64_t generation() const;

   private:
	mutable std::mutex mutex_;
	ProgressSnapshot snapshot_;
	std::uint64_t generation_{0};
};

}  // namespace dlpoll
