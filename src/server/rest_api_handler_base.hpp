#pragma once

#include <boost/beast/http.hpp>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace dlpoll::server {

namespace beast = boost::beast;
namespace http = beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

// Invoked exactly once per request, from any thread.
using ResponseHandler = std::function<void(Response)>;

/// RestApiHandlerBase - JSON request routing with CORS.
///
/// Subclasses implement do_handle_request() and answer through `send`, either
/// inline or later from a completion handler. Exceptions thrown while routing
/// turn into a 500 JSON response.
class RestApiHandlerBase {
   public:
	virtual ~RestApiHandlerBase() = default;

	void handle_request(Request req, ResponseHandler send);

   protected:
	virtual void do_handle_request(Request req, ResponseHandler send) = 0;

	static Response create_json_response(http::status status,
										 const nlohmann::json &json);

	static Response create_error_response(http::status status,
										  std::string_view message);

	/// Parse a JSON body; an empty body yields an empty object.
	/// Throws std::invalid_argument for malformed JSON.
	static nlohmann::json parse_request_body(const std::string &body);

	static void add_cors_headers(Response &res);
};

}  // namespace dlpoll::server
