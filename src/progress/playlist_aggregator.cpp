#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <dlpoll/playlist_aggregator.hpp>
#include <utility>

namespace dlpoll {

void PlaylistAggregator::start(std::size_t items_total,
							   std::vector<std::string> titles) {
	items_total_ = std::max<std::size_t>(items_total, 1);
	items_completed_ = 0;
	percent_ = 0.0;
	titles_ = std::move(titles);
	finished_.clear();
}

std::string PlaylistAggregator::key_for(const ItemRef &item) const {
	if (item.playlist_index) return "#" + std::to_string(*item.playlist_index);
	if (!item.id.empty()) return "id:" + item.id;
	// Single-item jobs carry no index; everything refers to the one item.
	return "#1";
}

bool PlaylistAggregator::finish_item(const ItemRef &item) {
	auto key = key_for(item);
	if (finished_.count(key) != 0) {
		spdlog::trace("PlaylistAggregator: duplicate finish for {}", key);
		return false;
	}
	if (items_completed_ >= items_total_) {
		spdlog::warn(
			"PlaylistAggregator: item {} finished but all {} items are "
			"already counted",
			key, items_total_);
		return false;
	}

	finished_.insert(std::move(key));
	++items_completed_;
	spdlog::debug("PlaylistAggregator: {}/{} items finished",
				  items_completed_, items_total_);
	return true;
}

void PlaylistAggregator::update_percent(double percent) {
	if (!std::isfinite(percent)) percent = 0.0;
	percent_ = std::clamp(percent, 0.0, 100.0);
}

void PlaylistAggregator::complete() {
	if (items_completed_ < items_total_) {
		spdlog::info(
			"PlaylistAggregator: engine done with {}/{} finish signals, "
			"counting the rest as complete",
			items_completed_, items_total_);
	}
	items_completed_ = items_total_;
	percent_ = 100.0;
}

std::optional<std::string> PlaylistAggregator::title_for(
	const ItemRef &item) const {
	std::size_t index = item.playlist_index.value_or(1);
	if (index == 0 || index > titles_.size()) return std::nullopt;
	const auto &title = titles_[index - 1];
	if (title.empty()) return std::nullopt;
	return title;
}

PlaylistAggregator::Progress PlaylistAggregator::progress() const {
	return {items_completed_, items_total_, percent_};
}

}  // namespace dlpoll
