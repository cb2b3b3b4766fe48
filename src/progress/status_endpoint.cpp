#include <fmt/format.h>

#include <dlpoll/status_endpoint.hpp>
#include <utility>

namespace dlpoll {

StatusEndpoint::StatusEndpoint(std::shared_ptr<const ProgressState> state)
	: state_(std::move(state)) {}

nlohmann::json StatusEndpoint::poll() const { return to_json(state_->read()); }

nlohmann::json StatusEndpoint::to_json(const ProgressSnapshot &snap) {
	nlohmann::json j = {
		{"progress", fmt::format("{:.1f}%", snap.percent)},
		{"percent", snap.percent},
		{"current", snap.current},
		{"total", snap.total},
		{"status", std::string(to_string(snap.status))},
		{"job_id", snap.job_id},
	};
	if (snap.title) j["title"] = *snap.title;
	if (snap.message) j["message"] = *snap.message;
	return j;
}

}  // namespace dlpoll
