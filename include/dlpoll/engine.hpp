#pragma once

#include <dlpoll/dlpoll_export.h>

#include <boost/asio/any_completion_executor.hpp>
#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <dlpoll/result.hpp>
#include <dlpoll/types.hpp>
#include <string>
#include <string_view>

namespace dlpoll {

namespace asio = boost::asio;

/// Engine - the black box that fetches and transcodes media.
///
/// Implementations push progress ticks into the ProgressSink from their own
/// executor; the sink must return quickly. A metadata fetch or download
/// aborted through cancel() completes with std::errc::operation_canceled.
class DLPOLL_EXPORT Engine {
   public:
	Engine() = default;
	Engine(const Engine &) = delete;
	Engine &operator=(const Engine &) = delete;
	virtual ~Engine() = default;

	[[nodiscard]] virtual asio::any_io_executor get_executor() const = 0;

	/// Abort the running metadata fetch or download, if any. Thread-safe.
	virtual void cancel() = 0;

	using CompletionExecutor = asio::any_completion_executor;

	/// Resolve item count and titles without downloading.
	/// Signature: void(Result<MediaMetadata>)
	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<MediaMetadata>))
				  CompletionToken>
	auto async_fetch_metadata(std::string_view url, CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken,
									void(Result<MediaMetadata>)>(
			[this, ex, url_s = std::string(url)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler =
					asio::any_completion_handler<void(Result<MediaMetadata>)>{
						std::forward<decltype(handler)>(handler)};

				async_fetch_metadata_impl(std::move(url_s),
										  std::move(any_handler),
										  std::move(handler_ex));
			},
			token);
	}

	/// Run one download to completion, reporting ticks through `sink`.
	/// Signature: void(Result<void>)
	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<void>))
				  CompletionToken>
	auto async_download(DownloadRequest request, ProgressSink sink,
						CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken, void(Result<void>)>(
			[this, ex, request = std::move(request),
			 sink = std::move(sink)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler =
					asio::any_completion_handler<void(Result<void>)>{
						std::forward<decltype(handler)>(handler)};

				async_download_impl(std::move(request), std::move(sink),
									std::move(any_handler),
									std::move(handler_ex));
			},
			token);
	}

   protected:
	virtual void async_fetch_metadata_impl(
		std::string url,
		asio::any_completion_handler<void(Result<MediaMetadata>)> handler,
		CompletionExecutor handler_ex) = 0;

	virtual void async_download_impl(
		DownloadRequest request, ProgressSink sink,
		asio::any_completion_handler<void(Result<void>)> handler,
		CompletionExecutor handler_ex) = 0;
};

}  // namespace dlpoll
