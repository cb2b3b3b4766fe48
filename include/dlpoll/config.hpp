#pragma once

#include <dlpoll/dlpoll_export.h>

#include <dlpoll/job_runner.hpp>
#include <dlpoll/output_template.hpp>
#include <dlpoll/result.hpp>
#include <dlpoll/ytdlp_engine.hpp>
#include <optional>
#include <spdlog/common.h>
#include <string>
#include <string_view>

namespace dlpoll {

/// Everything dlpoll-server reads from its command line and config file.
struct DLPOLL_EXPORT ServiceConfig {
	std::string listen = "127.0.0.1";
	unsigned short port = 5000;
	int threads = 1;  // HTTP threads

	OutputConfig output;
	YtDlpOptions engine;
	BusyPolicy on_busy = BusyPolicy::reject;

	spdlog::level::level_enum log_level = spdlog::level::info;
};

struct DLPOLL_EXPORT CommandLine {
	ServiceConfig config;
	bool show_help = false;
	std::optional<std::string> config_file;
};

/// Parse the command line, then the INI file named by --config. Values given
/// on the command line win over the file. Returns errc::invalid_config with
/// the reason logged.
DLPOLL_EXPORT Result<CommandLine> parse_command_line(int argc,
													 const char *const argv[]);

/// Option reference for --help.
DLPOLL_EXPORT std::string usage();

/// trace, debug, info, warn, error, critical, off
DLPOLL_EXPORT std::optional<spdlog::level::level_enum> parse_log_level(
	std::string_view token);

}  // namespace dlpoll
