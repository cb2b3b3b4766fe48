#pragma once

#include <dlpoll/result.hpp>
#include <dlpoll/types.hpp>
#include <dlpoll/ytdlp_engine.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dlpoll::ytdlp {

// Prefixes of the machine lines written by our --progress-template values.
inline constexpr std::string_view kDownloadTag = "dlpoll";
inline constexpr std::string_view kPostprocessTag = "dlpoll-pp";

/// Arguments for a flat metadata dump of `url`. Socket timeout and extra
/// arguments come from `options`, as for downloads.
std::vector<std::string> metadata_args(std::string_view url,
									   const YtDlpOptions &options);

/// Parse the --dump-single-json output.
Result<MediaMetadata> parse_metadata(std::string_view json_text);

/// yt-dlp -f selector for a request ("bestaudio" for audio).
std::string format_selector(DownloadKind kind, int quality);

std::vector<std::string> download_args(const DownloadRequest &request,
									   const YtDlpOptions &options);

/// Parse one stdout line. Lines that are not ours (merger messages, stray
/// output) yield std::nullopt.
std::optional<RawProgressEvent> parse_progress_line(std::string_view line);

/// Command line for logging, arguments with spaces quoted.
std::string join_command(std::string_view executable,
						 const std::vector<std::string> &args);

}  // namespace dlpoll::ytdlp
