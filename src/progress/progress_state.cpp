#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <dlpoll/progress_state.hpp>
#include <utility>

namespace dlpoll {

namespace {

ProgressSnapshot sanitize(ProgressSnapshot s) {
	if (!std::isfinite(s.percent)) s.percent = 0.0;
	s.percent = std::clamp(s.percent, 0.0, 100.0);
	if (s.current > s.total) {
		spdlog::debug("ProgressState: clamping current {} to total {}",
					  s.current, s.total);
		s.current = s.total;
	}
	return s;
}

}  // namespace

ProgressState::ProgressState(ProgressSnapshot initial)
	: snapshot_(sanitize(std::move(initial))) {}

void ProgressState::write(ProgressSnapshot snapshot) {
	auto clean = sanitize(std::move(snapshot));
	std::lock_guard lock(mutex_);
	snapshot_ = std::move(clean);
	++generation_;
}

ProgressSnapshot ProgressState::read() const {
	std::lock_guard lock(mutex_);
	return snapshot_;
}

std::uint64_t ProgressState::generation() const {
	std::lock_guard lock(mutex_);
	return generation_;
}

}  // namespace dlpoll
