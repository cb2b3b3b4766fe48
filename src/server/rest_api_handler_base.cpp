#include "server/rest_api_handler_base.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <exception>
#include <memory>
#include <stdexcept>
#include <utility>

namespace dlpoll::server {

void RestApiHandlerBase::handle_request(Request req, ResponseHandler send) {
	auto version = req.version();
	auto keep_alive = req.keep_alive();
	auto sent = std::make_shared<std::atomic<bool>>(false);

	ResponseHandler reply = [send = std::move(send), version, keep_alive,
							 sent](Response res) {
		if (sent->exchange(true)) {
			spdlog::warn("Dropping second response for one request");
			return;
		}
		res.version(version);
		res.keep_alive(keep_alive);
		add_cors_headers(res);
		res.prepare_payload();
		send(std::move(res));
	};

	spdlog::debug("{} {}", std::string(req.method_string()),
				  std::string(req.target()));

	if (req.method() == http::verb::options) {
		Response res{http::status::no_content, version};
		return reply(std::move(res));
	}

	try {
		do_handle_request(std::move(req), reply);
	} catch (const std::exception &e) {
		spdlog::error("Request handling failed: {}", e.what());
		reply(create_error_response(
			http::status::internal_server_error,
			std::string("Internal server error: ") + e.what()));
	}
}

Response RestApiHandlerBase::create_json_response(http::status status,
												  const nlohmann::json &json) {
	Response res{status, 11};
	res.set(http::field::content_type, "application/json");
	// Engine-provided titles are not guaranteed to be valid UTF-8
	res.body() =
		json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
	res.prepare_payload();
	return res;
}

Response RestApiHandlerBase::create_error_response(http::status status,
												   std::string_view message) {
	nlohmann::json error_json = {{"success", false},
								 {"error", std::string(message)}};
	return create_json_response(status, error_json);
}

nlohmann::json RestApiHandlerBase::parse_request_body(const std::string &body) {
	if (body.empty()) return nlohmann::json::object();
	try {
		return nlohmann::json::parse(body);
	} catch (const nlohmann::json::parse_error &e) {
		throw std::invalid_argument(std::string("Invalid JSON in request body: ") +
									e.what());
	}
}

void RestApiHandlerBase::add_cors_headers(Response &res) {
	res.set(http::field::access_control_allow_origin, "*");
	res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
	res.set(http::field::access_control_allow_headers, "Content-Type");
}

}  // namespace dlpoll::server
