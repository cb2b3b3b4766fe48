#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/regex.hpp>
#include <cmath>
#include <dlpoll/event_normalizer.hpp>

#include "utils.hpp"

namespace dlpoll {

namespace {

// CSI sequences (ESC [ params intermediates final) and two-byte escapes.
const boost::regex &escape_pattern() {
	static const boost::regex pattern(
		"\\x1b\\[[0-9;?]*[ -/]*[@-~]|\\x1b[@-_]");
	return pattern;
}

double clamp_percent(double value) {
	if (!std::isfinite(value)) return 0.0;
	return std::clamp(value, 0.0, 100.0);
}

}  // namespace

std::string EventNormalizer::strip_control_sequences(std::string_view text) {
	std::string result = boost::regex_replace(
		std::string(text), escape_pattern(), std::string());
	result.erase(std::remove_if(result.begin(), result.end(),
								[](unsigned char c) {
									return c < 0x20 || c == 0x7f;
								}),
				 result.end());
	return result;
}

double EventNormalizer::parse_percent(std::string_view raw) {
	auto clean = strip_control_sequences(raw);
	auto sv = utils::trim(clean);
	if (!sv.empty() && sv.back() == '%') {
		sv.remove_suffix(1);
		sv = utils::trim(sv);
	}
	if (sv.empty()) return 0.0;

	auto value = utils::to_double(sv);
	if (value.has_error()) {
		spdlog::trace("EventNormalizer: unparseable percentage '{}'", clean);
		return 0.0;
	}
	return clamp_percent(value.value());
}

std::optional<JobStatus> EventNormalizer::map_status(std::string_view token) {
	if (token == "downloading") return JobStatus::downloading;
	if (token == "finished") return JobStatus::finished;
	if (token == "error") return JobStatus::error;
	// postprocessor hook states
	if (token == "started" || token == "processing") {
		return JobStatus::postprocessing;
	}
	return std::nullopt;
}

double EventNormalizer::percent_from_bytes(
	std::optional<long long> downloaded, std::optional<long long> total,
	std::optional<long long> total_estimate) {
	if (!downloaded || *downloaded < 0) return 0.0;

	long long denominator = 0;
	if (total && *total > 0) {
		denominator = *total;
	} else if (total_estimate && *total_estimate > 0) {
		denominator = *total_estimate;
	}
	if (denominator == 0) return 0.0;

	return clamp_percent(static_cast<double>(*downloaded) * 100.0 /
						 static_cast<double>(denominator));
}

NormalizedEvent EventNormalizer::normalize(const RawProgressEvent &ev) const {
	NormalizedEvent out;
	out.status = map_status(ev.status);

	if (ev.percent_str) {
		out.percent = parse_percent(*ev.percent_str);
	} else {
		out.percent = percent_from_bytes(
			ev.downloaded_bytes, ev.total_bytes, ev.total_bytes_estimate);
	}

	// A finished item is complete even if the engine printed a stale figure.
	if (out.status == JobStatus::finished) out.percent = 100.0;

	return out;
}

}  // namespace dlpoll
