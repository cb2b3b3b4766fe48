#pragma once

#include <dlpoll/dlpoll_export.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dlpoll {

enum class JobStatus : std::uint8_t {
	idle,
	fetching_metadata,
	downloading,
	postprocessing,
	finished,
	error,
	cancelled,
};

enum class DownloadKind : std::uint8_t {
	video,
	audio,
};

/// Wire token for a status ("downloading", "finished", ...)
DLPOLL_EXPORT std::string_view to_string(JobStatus status);
DLPOLL_EXPORT std::string_view to_string(DownloadKind kind);

DLPOLL_EXPORT std::optional<DownloadKind> parse_download_kind(
	std::string_view token);

/// finished, error and cancelled
DLPOLL_EXPORT bool is_terminal(JobStatus status);

/// Accepted quality values: max height for video, kbit/s for audio.
DLPOLL_EXPORT bool is_valid_quality(DownloadKind kind, int quality);
DLPOLL_EXPORT int default_quality(DownloadKind kind);

struct DLPOLL_EXPORT JobRequest {
	std::string url;
	DownloadKind kind = DownloadKind::video;
	int quality = 720;
};

// Result of the metadata pre-fetch
struct DLPOLL_EXPORT MediaMetadata {
	std::string title;
	bool is_playlist = false;
	std::size_t item_count = 1;
	std::vector<std::string> item_titles;
};

// Identifies one item of a job as reported by the engine. playlist_index is
// 1-based, as the engine numbers entries.
struct DLPOLL_EXPORT ItemRef {
	std::optional<std::size_t> playlist_index;
	std::string id;
};

/// One progress tick as the engine emits it, before normalization.
struct DLPOLL_EXPORT RawProgressEvent {
	std::string status;						 // engine token
	std::optional<std::string> percent_str;	 // e.g. " 42.0%", may hold ANSI
	std::optional<long long> downloaded_bytes;
	std::optional<long long> total_bytes;
	std::optional<long long> total_bytes_estimate;
	std::optional<std::string> postprocessor;  // set for postprocess ticks
	ItemRef item;
	std::optional<std::string> title;
};

using ProgressSink = std::function<void(RawProgressEvent)>;

/// What the engine needs to run one download.
struct DLPOLL_EXPORT DownloadRequest {
	std::string url;
	DownloadKind kind = DownloadKind::video;
	int quality = 720;
	std::string output_template;  // destination dir + file template
};

/// Value exposed to pollers. Replaced as a whole, never mutated in place.
struct DLPOLL_EXPORT ProgressSnapshot {
	double percent = 0.0;
	std::size_t current = 0;
	std::size_t total = 0;
	std::optional<std::string> title;
	JobStatus status = JobStatus::idle;
	std::optional<std::string> message;
	std::uint64_t job_id = 0;

	bool operator==(const ProgressSnapshot &) const = default;
};

/// Returned to the submitter once the download has been spawned.
struct DLPOLL_EXPORT JobTicket {
	std::uint64_t job_id = 0;
	std::size_t items_total = 1;
};

}  // namespace dlpoll
