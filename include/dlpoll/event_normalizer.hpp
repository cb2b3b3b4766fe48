#pragma once

#include <dlpoll/dlpoll_export.h>

#include <dlpoll/types.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace dlpoll {

struct DLPOLL_EXPORT NormalizedEvent {
	double percent = 0.0;			  // always within [0, 100]
	std::optional<JobStatus> status;  // nullopt: keep the last known status
};

/// EventNormalizer - turns a noisy engine tick into a canonical
/// (percent, status) pair.
///
/// Never fails: a percentage that cannot be parsed becomes 0.0. A "finished"
/// status here refers to the item the tick belongs to; deciding whether the
/// whole job finished is up to the caller.
class DLPOLL_EXPORT EventNormalizer {
   public:
	[[nodiscard]] NormalizedEvent normalize(const RawProgressEvent &ev) const;

	/// Remove ANSI escape sequences and any other non-printable bytes.
	[[nodiscard]] static std::string strip_control_sequences(
		std::string_view text);

	/// Parse strings like "\x1b[0;94m 42.5%\x1b[0m". Returns 0.0 on failure.
	[[nodiscard]] static double parse_percent(std::string_view raw);

	/// Map an engine status token. Unknown tokens yield std::nullopt.
	[[nodiscard]] static std::optional<JobStatus> map_status(
		std::string_view token);

	/// downloaded / total as a percentage, 0.0 when total is unknown.
	[[nodiscard]] static double percent_from_bytes(
		std::optional<long long> downloaded, std::optional<long long> total,
		std::optional<long long> total_estimate);
};

}  // namespace dlpoll
