#include "server/api_handler.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <boost/url/encoding_opts.hpp>
#include <boost/url/parse_query.hpp>
#include <map>
#include <stdexcept>
#include <utility>

#include "utils.hpp"

namespace dlpoll::server {

namespace {

using FieldMap = std::map<std::string, std::string, std::less<>>;

Result<FieldMap> form_fields(std::string_view body) {
	auto parsed = boost::urls::parse_query(body);
	if (parsed.has_error()) return outcome::failure(errc::invalid_request);

	boost::urls::encoding_opts opt;
	opt.space_as_plus = true;

	FieldMap fields;
	for (auto param : parsed.value()) {
		auto key = param.key.decode(opt);
		if (key.empty()) continue;
		fields[key] = param.has_value ? param.value.decode(opt) : "";
	}
	return fields;
}

Result<FieldMap> json_fields(const nlohmann::json &j) {
	if (!j.is_object()) return outcome::failure(errc::invalid_request);

	FieldMap fields;
	for (const auto &[key, value] : j.items()) {
		if (value.is_string()) {
			fields[key] = value.get<std::string>();
		} else if (value.is_number_integer()) {
			fields[key] = std::to_string(value.get<long long>());
		} else if (!value.is_null()) {
			return outcome::failure(errc::invalid_request);
		}
	}
	return fields;
}

std::string_view field(const FieldMap &fields, std::string_view key) {
	auto it = fields.find(key);
	return it == fields.end() ? std::string_view{} : utils::trim(it->second);
}

}  // namespace

ApiHandler::ApiHandler(std::shared_ptr<JobRunner> runner, StatusEndpoint status)
	: runner_(std::move(runner)), status_(std::move(status)) {}

Result<JobRequest> ApiHandler::parse_download_request(
	std::string_view content_type, const std::string &body) {
	Result<FieldMap> fields = outcome::failure(errc::invalid_request);
	if (content_type.find("application/json") != std::string_view::npos) {
		try {
			fields = json_fields(parse_request_body(body));
		} catch (const std::invalid_argument &e) {
			spdlog::debug("{}", e.what());
			return outcome::failure(errc::invalid_request);
		}
	} else {
		fields = form_fields(body);
	}
	if (fields.has_error()) return outcome::failure(fields.error());

	JobRequest request;
	request.url = std::string(field(fields.value(), "url"));
	if (request.url.empty()) return outcome::failure(errc::invalid_url);

	auto type = field(fields.value(), "download_type");
	if (!type.empty()) {
		auto kind = parse_download_kind(type);
		if (!kind) return outcome::failure(errc::invalid_request);
		request.kind = *kind;
	}

	auto quality = field(fields.value(), "quality");
	if (quality.empty()) {
		request.quality = default_quality(request.kind);
	} else {
		auto q = utils::to_number<int>(quality);
		if (q.has_error()) return outcome::failure(errc::invalid_quality);
		request.quality = q.value();
	}
	return request;
}

http::status ApiHandler::status_for(const std::error_code &ec) {
	// A superseded submission fails with operation_canceled
	if (ec == errc::job_in_progress || ec == errc::no_active_job ||
		ec == std::errc::operation_canceled) {
		return http::status::conflict;
	}
	if (is_metadata_error(ec)) return http::status::bad_request;
	return http::status::internal_server_error;
}

void ApiHandler::do_handle_request(Request req, ResponseHandler send) {
	std::string_view target = req.target();
	auto path = target.substr(0, target.find('?'));

	if (path == "/download") {
		if (req.method() != http::verb::post) {
			return send(create_error_response(http::status::method_not_allowed,
											  "Use POST"));
		}
		return handle_download(req, std::move(send));
	}

	if (path == "/progress") {
		if (req.method() != http::verb::get) {
			return send(create_error_response(http::status::method_not_allowed,
											  "Use GET"));
		}
		return send(create_json_response(http::status::ok, status_.poll()));
	}

	if (path == "/cancel") {
		if (req.method() != http::verb::post) {
			return send(create_error_response(http::status::method_not_allowed,
											  "Use POST"));
		}
		return handle_cancel(std::move(send));
	}

	send(create_error_response(http::status::not_found, "Not found"));
}

void ApiHandler::handle_download(const Request &req, ResponseHandler send) {
	auto parsed = parse_download_request(req[http::field::content_type],
										 req.body());
	if (parsed.has_error()) {
		auto message = parsed.error() == errc::invalid_url
						   ? std::string("Missing or invalid URL")
						   : parsed.error().message();
		return send(create_error_response(http::status::bad_request, message));
	}

	runner_->async_submit(
		std::move(parsed).value(),
		[send = std::move(send)](Result<JobTicket> res) {
			if (res.has_error()) {
				const auto &ec = res.error();
				auto message = ec == errc::metadata_failed ||
									   ec == errc::no_items
								   ? fmt::format("Could not fetch info: {}",
												 ec.message())
								   : ec.message();
				return send(create_error_response(status_for(ec), message));
			}

			nlohmann::json body = {{"success", true},
								   {"message", "Download started"},
								   {"job_id", res.value().job_id},
								   {"total", res.value().items_total}};
			send(create_json_response(http::status::accepted, body));
		});
}

void ApiHandler::handle_cancel(ResponseHandler send) {
	runner_->async_cancel([send = std::move(send)](Result<void> res) {
		if (res.has_error()) {
			return send(create_error_response(status_for(res.error()),
											  res.error().message()));
		}
		send(create_json_response(
			http::status::ok, {{"success", true}, {"message", "Cancelled"}}));
	});
}

}  // namespace dlpoll::server
