#pragma once

#include <dlpoll/dlpoll_export.h>

#include <boost/outcome.hpp>
#include <system_error>

namespace dlpoll {

namespace outcome = boost::outcome_v2;

enum class errc {
	success = 0,
	// Request validation
	invalid_url = 10,
	invalid_quality,
	invalid_request,

	// Metadata
	metadata_failed = 20,
	no_items,

	// Engine / transfer
	engine_failed = 30,
	engine_unavailable,
	malformed_output,

	// Job slot
	job_in_progress = 40,
	no_active_job,

	// Configuration
	invalid_config = 50,

	unknown = 100
};

DLPOLL_EXPORT const std::error_category &dlpoll_category();

DLPOLL_EXPORT std::error_code make_error_code(errc e);

/// True for errors that reject a submission before any download started.
DLPOLL_EXPORT bool is_metadata_error(const std::error_code &ec);

}  // namespace dlpoll

namespace std {
template <>
struct is_error_code_enum<dlpoll::errc> : true_type {};
}  // namespace std

namespace dlpoll {
template <typename T>
using Result = outcome::result<T, std::error_code>;
}  // namespace dlpoll
