#pragma once

#include <dlpoll/job_runner.hpp>
#include <dlpoll/result.hpp>
#include <dlpoll/status_endpoint.hpp>
#include <dlpoll/types.hpp>
#include <memory>
#include <string>
#include <string_view>

#include "server/rest_api_handler_base.hpp"

namespace dlpoll::server {

/// ApiHandler - the service routes.
///
///   POST /download   submit a job (form-urlencoded or JSON body)
///   GET  /progress   current snapshot
///   POST /cancel     cancel the running job
class ApiHandler : public RestApiHandlerBase {
   public:
	ApiHandler(std::shared_ptr<JobRunner> runner, StatusEndpoint status);

	/// Build a JobRequest from a POST /download body. Fields: url,
	/// download_type (video|audio, default video), quality (default per kind).
	static Result<JobRequest> parse_download_request(
		std::string_view content_type, const std::string &body);

	/// HTTP status for a failed submission.
	static http::status status_for(const std::error_code &ec);

   protected:
	void do_handle_request(Request req, ResponseHandler send) override;

   private:
	void handle_download(const Request &req, ResponseHandler send);
	void handle_cancel(ResponseHandler send);

	std::shared_ptr<JobRunner> runner_;
	StatusEndpoint status_;
};

}  // namespace dlpoll::server
