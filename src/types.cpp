#include <algorithm>
#include <array>
#include <dlpoll/types.hpp>

namespace dlpoll {

namespace {
constexpr std::array<int, 3> kVideoHeights{360, 720, 1080};
constexpr std::array<int, 3> kAudioBitrates{160, 256, 320};
}  // namespace

std::string_view to_string(JobStatus status) {
	switch (status) {
		case JobStatus::idle: return "idle";
		case JobStatus::fetching_metadata: return "fetching_metadata";
		case JobStatus::downloading: return "downloading";
		case JobStatus::postprocessing: return "postprocessing";
		case JobStatus::finished: return "finished";
		case JobStatus::error: return "error";
		case JobStatus::cancelled: return "cancelled";
	}
	return "idle";
}

std::string_view to_string(DownloadKind kind) {
	return kind == DownloadKind::audio ? "audio" : "video";
}

std::optional<DownloadKind> parse_download_kind(std::string_view token) {
	if (token == "video") return DownloadKind::video;
	if (token == "audio") return DownloadKind::audio;
	return std::nullopt;
}

bool is_terminal(JobStatus status) {
	return status == JobStatus::finished || status == JobStatus::error ||
		   status == JobStatus::cancelled;
}

bool is_valid_quality(DownloadKind kind, int quality) {
	if (kind == DownloadKind::audio) {
		return std::find(kAudioBitrates.begin(), kAudioBitrates.end(),
						 quality) != kAudioBitrates.end();
	}
	return std::find(kVideoHeights.begin(), kVideoHeights.end(), quality) !=
		   kVideoHeights.end();
}

int default_quality(DownloadKind kind) {
	return kind == DownloadKind::audio ? 320 : 720;
}

}  // namespace dlpoll
