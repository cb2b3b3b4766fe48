#pragma once

#include <dlpoll/dlpoll_export.h>

#include <cstddef>
#include <dlpoll/types.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dlpoll {

/// PlaylistAggregator - tracks item completion across a multi-item job.
///
/// The per-item percent and the completed-item count are kept apart: while
/// item 2 of 3 is at 30%, progress() reports current=1, total=3, percent=30,
/// not a blended figure.
class DLPOLL_EXPORT PlaylistAggregator {
   public:
	struct Progress {
		std::size_t current = 0;
		std::size_t total = 1;
		double percent = 0.0;
	};

	/// Reset for a new job. A total of 0 is treated as 1.
	void start(std::size_t items_total, std::vector<std::string> titles = {});

	/// Count an item as finished. Returns false for a duplicate signal (the
	/// engine reports "finished" once per downloaded file, so a merged
	/// video+audio item finishes twice) or when every item is already counted.
	bool finish_item(const ItemRef &item);

	void update_percent(double percent);

	/// The engine reported overall success; items it skipped without a
	/// finished tick are counted as done.
	void complete();

	[[nodiscard]] std::optional<std::string> title_for(
		const ItemRef &item) const;

	[[nodiscard]] Progress progress() const;
	[[nodiscard]] std::size_t items_total() const { return items_total_; }
	[[nodiscard]] std::size_t items_completed() const {
		return items_completed_;
	}
	[[nodiscard]] bool all_items_done() const {
		return items_completed_ == items_total_;
	}

   private:
	[[nodiscard]] std::string key_for(const ItemRef &item) const;

	std::size_t items_total_{1};
	std::size_t items_completed_{0};
	double percent_{0.0};
	std::vector<std::string> titles_;
	std::set<std::string> finished_;
};

}  // namespace dlpoll
