#pragma once

#include <dlpoll/dlpoll_export.h>

#include <boost/asio/any_io_executor.hpp>
#include <dlpoll/engine.hpp>
#include <memory>
#include <string>
#include <vector>

namespace dlpoll {

struct DLPOLL_EXPORT YtDlpOptions {
	// Name looked up on PATH, or a path to the executable
	std::string executable = "yt-dlp";
	std::vector<std::string> extra_args;
	int socket_timeout = 30;  // seconds
};

/// YtDlpEngine - runs yt-dlp as a child process.
///
/// Metadata comes from a flat JSON dump, downloads report progress through
/// machine-readable progress templates on stdout. All pipe I/O runs on the
/// executor passed to the constructor.
class DLPOLL_EXPORT YtDlpEngine : public Engine {
   public:
	YtDlpEngine(asio::any_io_executor ex, YtDlpOptions options = {});
	~YtDlpEngine() override;

	[[nodiscard]] asio::any_io_executor get_executor() const override;

	void cancel() override;

	[[nodiscard]] const YtDlpOptions &options() const;

   protected:
	void async_fetch_metadata_impl(
		std::string url,
		asio::any_completion_handler<void(Result<MediaMetadata>)> handler,
		CompletionExecutor handler_ex) override;

	void async_download_impl(
		DownloadRequest request, ProgressSink sink,
		asio::any_completion_handler<void(Result<void>)> handler,
		CompletionExecutor handler_ex) override;

   private:
	struct Impl;
	std::shared_ptr<Impl> m_impl;
};

}  // namespace dlpoll
