#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <memory>

#include "server/rest_api_handler_base.hpp"

namespace dlpoll::server {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// One keep-alive connection. Requests are answered in order; the next read
// starts only after the previous response was written.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
   public:
	HttpSession(tcp::socket &&socket,
				std::shared_ptr<RestApiHandlerBase> api_handler);

	void run();

   private:
	void do_read();
	void on_read(beast::error_code ec, std::size_t bytes_transferred);
	void do_write(Response res);
	void on_write(bool close, beast::error_code ec,
				  std::size_t bytes_transferred);
	void do_close();

	beast::tcp_stream stream_;
	beast::flat_buffer buffer_;
	Request req_;
	Response res_;
	std::shared_ptr<RestApiHandlerBase> api_handler_;
};

class HttpServer {
   public:
	/// Opens, binds and listens. Throws std::runtime_error on failure.
	HttpServer(asio::io_context &ioc, tcp::endpoint endpoint,
			   std::shared_ptr<RestApiHandlerBase> api_handler);

	void run();
	void stop();

	[[nodiscard]] tcp::endpoint local_endpoint() const;

   private:
	void do_accept();
	void on_accept(beast::error_code ec, tcp::socket socket);

	asio::io_context &ioc_;
	tcp::acceptor acceptor_;
	std::shared_ptr<RestApiHandlerBase> api_handler_;
};

}  // namespace dlpoll::server
