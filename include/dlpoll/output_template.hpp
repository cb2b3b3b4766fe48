#pragma once

#include <cstdlib>
#include <dlpoll/types.hpp>
#include <filesystem>
#include <string>
#include <string_view>

namespace dlpoll {

/// Where finished files go. Directories may start with "~".
struct OutputConfig {
	std::string video_dir = "~/Music";
	std::string audio_dir = "~/Music/YT-Downloader";
	// Engine-side template, expanded per item by the engine
	std::string file_template = "%(title)s.%(ext)s";
};

/// Expand a leading "~" or "~/" using $HOME. Other paths are returned as is.
inline std::filesystem::path expand_home(std::string_view path) {
	if (path.empty() || path.front() != '~') {
		return std::filesystem::path(path);
	}
	if (path.size() > 1 && path[1] != '/') {
		// ~user is left to the shell
		return std::filesystem::path(path);
	}

	const char *home = std::getenv("HOME");
	std::filesystem::path base = home ? home : ".";
	auto rest = path.substr(1);
	while (!rest.empty() && rest.front() == '/') rest.remove_prefix(1);
	return rest.empty() ? base : base / std::filesystem::path(rest);
}

/// Destination directory for a download kind. Pure function of its inputs.
inline std::filesystem::path destination_for(DownloadKind kind,
											 const OutputConfig &cfg) {
	return expand_home(kind == DownloadKind::audio ? cfg.audio_dir
												   : cfg.video_dir);
}

/// Full engine output template: destination directory + file template.
inline std::string output_template_for(DownloadKind kind,
									   const OutputConfig &cfg) {
	return (destination_for(kind, cfg) / cfg.file_template).string();
}

}  // namespace dlpoll
