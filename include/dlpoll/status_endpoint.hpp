#pragma once

#include <dlpoll/dlpoll_export.h>

#include <dlpoll/progress_state.hpp>
#include <memory>
#include <nlohmann/json.hpp>

namespace dlpoll {

/// StatusEndpoint - read-only view of the shared ProgressState for pollers.
///
/// poll() never waits on the running job and has no side effects: two polls
/// with no write in between render the same document.
class DLPOLL_EXPORT StatusEndpoint {
   public:
	explicit StatusEndpoint(std::shared_ptr<const ProgressState> state);

	/// {"progress":"42.0%","percent":42.0,"current":1,"total":3,
	///  "title":"...","status":"downloading","message":"..."}
	/// title and message are left out when unset.
	[[nodiscard]] nlohmann::json poll() const;

	[[nodiscard]] static nlohmann::json to_json(const ProgressSnapshot &snap);

   private:
	std::shared_ptr<const ProgressState> state_;
};

}  // namespace dlpoll
