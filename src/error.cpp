#include <dlpoll/result.hpp>
#include <string>

namespace dlpoll {

struct dlpoll_error_category : std::error_category {
	const char *name() const noexcept override { return "dlpoll"; }

	std::string message(int ev) const override {
		switch (static_cast<errc>(ev)) {
			case errc::success: return "Success";
			case errc::invalid_url: return "Invalid URL";
			case errc::invalid_quality:
				return "Quality not supported for this download type";
			case errc::invalid_request: return "Invalid request";
			case errc::metadata_failed: return "Could not fetch media info";
			case errc::no_items: return "No downloadable items found";
			case errc::engine_failed: return "Download engine failed";
			case errc::engine_unavailable:
				return "Download engine is not available";
			case errc::malformed_output:
				return "Download engine produced malformed output";
			case errc::job_in_progress: return "A download is already running";
			case errc::no_active_job: return "No download is running";
			case errc::invalid_config: return "Invalid configuration";
			default: return "Unknown error";
		}
	}
};

const std::error_category &dlpoll_category() {
	static dlpoll_error_category category;
	return category;
}

std::error_code make_error_code(errc e) {
	return {static_cast<int>(e), dlpoll_category()};
}

bool is_metadata_error(const std::error_code &ec) {
	if (ec.category() != dlpoll_category()) return false;
	switch (static_cast<errc>(ec.value())) {
		case errc::invalid_url:
		case errc::invalid_quality:
		case errc::invalid_request:
		case errc::metadata_failed:
		case errc::no_items: return true;
		default: return false;
	}
}

}  // namespace dlpoll
