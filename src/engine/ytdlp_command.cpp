#include "engine/ytdlp_command.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <iterator>
#include <nlohmann/json.hpp>

#include "utils.hpp"

namespace dlpoll::ytdlp {

namespace {

using json = nlohmann::json;

// download:<tag>|status|percent|downloaded|total|estimate|index|id|title
constexpr std::string_view kDownloadTemplate =
	"download:dlpoll|%(progress.status)s|%(progress._percent_str)s"
	"|%(progress.downloaded_bytes)s|%(progress.total_bytes)s"
	"|%(progress.total_bytes_estimate)s|%(info.playlist_index)s"
	"|%(info.id)s|%(info.title)s";

// postprocess:<tag>|status|postprocessor|index|id|title
constexpr std::string_view kPostprocessTemplate =
	"postprocess:dlpoll-pp|%(progress.status)s|%(progress.postprocessor)s"
	"|%(info.playlist_index)s|%(info.id)s|%(info.title)s";

constexpr std::size_t kDownloadFields = 9;
constexpr std::size_t kPostprocessFields = 6;

// Split into at most `max_fields`; the last field keeps any further '|'.
std::vector<std::string_view> split_fields(std::string_view line,
										   std::size_t max_fields) {
	std::vector<std::string_view> fields;
	while (fields.size() + 1 < max_fields) {
		auto pos = line.find('|');
		if (pos == std::string_view::npos) break;
		fields.push_back(line.substr(0, pos));
		line.remove_prefix(pos + 1);
	}
	fields.push_back(line);
	return fields;
}

std::optional<std::string> text_field(std::string_view sv) {
	sv = utils::trim(sv);
	if (sv.empty() || sv == "NA" || sv == "None") return std::nullopt;
	return std::string(sv);
}

// Byte counts are ints, but estimates print as floats ("1048576.0").
std::optional<long long> bytes_field(std::string_view sv) {
	sv = utils::trim(sv);
	if (auto v = utils::to_optional_number<long long>(sv)) return v;
	auto d = utils::to_optional_number<double>(sv);
	if (!d || !std::isfinite(*d) || *d < 0) return std::nullopt;
	return static_cast<long long>(*d);
}

ItemRef item_field(std::string_view index, std::string_view id) {
	ItemRef item;
	auto idx = utils::to_optional_number<std::size_t>(utils::trim(index));
	if (idx && *idx > 0) item.playlist_index = idx;
	item.id = text_field(id).value_or("");
	return item;
}

}  // namespace

std::vector<std::string> metadata_args(std::string_view url,
									   const YtDlpOptions &options) {
	std::vector<std::string> args = {"--flat-playlist", "--dump-single-json",
									 "--no-warnings", "--socket-timeout",
									 std::to_string(options.socket_timeout)};
	args.insert(args.end(), options.extra_args.begin(),
				options.extra_args.end());
	args.emplace_back("--");
	args.emplace_back(url);
	return args;
}

Result<MediaMetadata> parse_metadata(std::string_view json_text) {
	auto j = json::parse(json_text, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		spdlog::debug("yt-dlp metadata is not a JSON object");
		return outcome::failure(errc::metadata_failed);
	}

	MediaMetadata meta;
	meta.title = utils::traverse_obj_default<std::string>(j, {"title"}, "");

	const auto *entries = utils::traverse_json(j, {"entries"});
	auto type = utils::traverse_obj_default<std::string>(j, {"_type"}, "video");
	if (!entries || !entries->is_array()) {
		if (type == "playlist") {
			// A playlist dump without entries has nothing to download
			meta.is_playlist = true;
			meta.item_count = 0;
		}
		return meta;
	}

	meta.is_playlist = true;
	meta.item_count = entries->size();
	meta.item_titles.reserve(entries->size());
	for (const auto &entry : *entries) {
		meta.item_titles.push_back(
			utils::traverse_obj_default<std::string>(entry, {"title"}, ""));
	}
	return meta;
}

std::string format_selector(DownloadKind kind, int quality) {
	if (kind == DownloadKind::audio) return "bestaudio";
	return fmt::format("bestvideo[height<={0}]+bestaudio/best[height<={0}]",
					   quality);
}

std::vector<std::string> download_args(const DownloadRequest &request,
									   const YtDlpOptions &options) {
	std::vector<std::string> args = {
		"--newline",
		"--progress",
		"--quiet",
		"--no-warnings",
		"--socket-timeout",
		std::to_string(options.socket_timeout),
		"--progress-template",
		std::string(kDownloadTemplate),
		"--progress-template",
		std::string(kPostprocessTemplate),
		"-o",
		request.output_template,
		"-f",
		format_selector(request.kind, request.quality),
	};

	if (request.kind == DownloadKind::audio) {
		args.insert(args.end(), {"-x", "--audio-format", "mp3",
								 "--audio-quality",
								 fmt::format("{}K", request.quality)});
	} else {
		args.insert(args.end(), {"--merge-output-format", "mp4"});
	}

	args.insert(args.end(), options.extra_args.begin(),
				options.extra_args.end());
	args.emplace_back("--");
	args.push_back(request.url);
	return args;
}

std::optional<RawProgressEvent> parse_progress_line(std::string_view line) {
	while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
		line.remove_suffix(1);
	}

	auto tag_end = line.find('|');
	if (tag_end == std::string_view::npos) return std::nullopt;
	auto tag = line.substr(0, tag_end);
	auto rest = line.substr(tag_end + 1);

	if (tag == kDownloadTag) {
		auto f = split_fields(rest, kDownloadFields - 1);
		if (f.size() != kDownloadFields - 1) return std::nullopt;

		RawProgressEvent ev;
		ev.status = std::string(utils::trim(f[0]));
		ev.percent_str = text_field(f[1]);
		ev.downloaded_bytes = bytes_field(f[2]);
		ev.total_bytes = bytes_field(f[3]);
		ev.total_bytes_estimate = bytes_field(f[4]);
		ev.item = item_field(f[5], f[6]);
		ev.title = text_field(f[7]);
		return ev;
	}

	if (tag == kPostprocessTag) {
		auto f = split_fields(rest, kPostprocessFields - 1);
		if (f.size() != kPostprocessFields - 1) return std::nullopt;

		RawProgressEvent ev;
		ev.status = std::string(utils::trim(f[0]));
		ev.postprocessor = text_field(f[1]).value_or("postprocessor");
		ev.item = item_field(f[2], f[3]);
		ev.title = text_field(f[4]);
		return ev;
	}

	return std::nullopt;
}

std::string join_command(std::string_view executable,
						 const std::vector<std::string> &args) {
	std::string out(executable);
	for (const auto &arg : args) {
		if (arg.find_first_of(" \t\"'") != std::string::npos) {
			fmt::format_to(std::back_inserter(out), " '{}'", arg);
		} else {
			fmt::format_to(std::back_inserter(out), " {}", arg);
		}
	}
	return out;
}

}  // namespace dlpoll::ytdlp
