#include "server/http_server.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/core/ignore_unused.hpp>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace dlpoll::server {

HttpServer::HttpServer(asio::io_context &ioc, tcp::endpoint endpoint,
					   std::shared_ptr<RestApiHandlerBase> api_handler)
	: ioc_(ioc), acceptor_(ioc), api_handler_(std::move(api_handler)) {
	beast::error_code ec;

	acceptor_.open(endpoint.protocol(), ec);
	if (ec) {
		throw std::runtime_error("Failed to open acceptor: " + ec.message());
	}

	acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
	if (ec) {
		throw std::runtime_error("Failed to set reuse_address: " +
								 ec.message());
	}

	acceptor_.bind(endpoint, ec);
	if (ec) {
		throw std::runtime_error("Failed to bind " +
								 endpoint.address().to_string() + ":" +
								 std::to_string(endpoint.port()) + ": " +
								 ec.message());
	}

	acceptor_.listen(asio::socket_base::max_listen_connections, ec);
	if (ec) {
		throw std::runtime_error("Failed to listen: " + ec.message());
	}
}

void HttpServer::run() { do_accept(); }

void HttpServer::stop() {
	beast::error_code ec;
	acceptor_.close(ec);
	if (ec) spdlog::debug("Closing acceptor: {}", ec.message());
}

tcp::endpoint HttpServer::local_endpoint() const {
	return acceptor_.local_endpoint();
}

void HttpServer::do_accept() {
	acceptor_.async_accept(
		asio::make_strand(ioc_),
		beast::bind_front_handler(&HttpServer::on_accept, this));
}

void HttpServer::on_accept(beast::error_code ec, tcp::socket socket) {
	if (ec == asio::error::operation_aborted) return;  // stopped

	if (ec) {
		spdlog::warn("Accept error: {}", ec.message());
	} else {
		std::make_shared<HttpSession>(std::move(socket), api_handler_)->run();
	}

	do_accept();
}

HttpSession::HttpSession(tcp::socket &&socket,
						 std::shared_ptr<RestApiHandlerBase> api_handler)
	: stream_(std::move(socket)), api_handler_(std::move(api_handler)) {}

void HttpSession::run() {
	asio::dispatch(stream_.get_executor(),
				   beast::bind_front_handler(&HttpSession::do_read,
											 shared_from_this()));
}

void HttpSession::do_read() {
	req_ = {};

	stream_.expires_after(std::chrono::seconds(30));

	http::async_read(
		stream_, buffer_, req_,
		beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
}

void HttpSession::on_read(beast::error_code ec, std::size_t bytes_transferred) {
	boost::ignore_unused(bytes_transferred);

	if (ec == http::error::end_of_stream) return do_close();

	if (ec) {
		if (ec != beast::error::timeout) {
			spdlog::debug("Read error: {}", ec.message());
		}
		return;
	}

	// Submissions answer only after the metadata fetch, so the reply may come
	// from the job executor; hop back onto this connection's strand.
	stream_.expires_never();
	api_handler_->handle_request(
		std::move(req_), [self = shared_from_this()](Response res) {
			asio::dispatch(self->stream_.get_executor(),
						   [self, res = std::move(res)]() mutable {
							   self->do_write(std::move(res));
						   });
		});
}

void HttpSession::do_write(Response res) {
	res_ = std::move(res);
	bool close = res_.need_eof();

	stream_.expires_after(std::chrono::seconds(30));
	http::async_write(stream_, res_,
					  beast::bind_front_handler(&HttpSession::on_write,
												shared_from_this(), close));
}

void HttpSession::on_write(bool close, beast::error_code ec,
						   std::size_t bytes_transferred) {
	boost::ignore_unused(bytes_transferred);

	if (ec) {
		spdlog::debug("Write error: {}", ec.message());
		return;
	}

	if (close) return do_close();

	res_ = {};
	do_read();
}

void HttpSession::do_close() {
	beast::error_code ec;
	stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

}  // namespace dlpoll::server
