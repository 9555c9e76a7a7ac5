/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#pragma once

#include "Request.hh"

#include "apx/ProxyHandler.hh"

#include <boost/beast/core/flat_buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>

#include <optional>
#include <string_view>

namespace apx {

// Handles an HTTP server connection
class Session : public std::enable_shared_from_this<Session>
{
public:
	// Take ownership of the socket
	Session(
		boost::asio::ip::tcp::socket socket,
		ProxyHandler&& handler,
		std::size_t nth
	);

	// Start the asynchronous operation
	void run();
	void do_read();
	void on_read(boost::system::error_code ec, std::size_t bytes_transferred);
	void on_write(boost::system::error_code ec, std::size_t bytes_transferred, bool close);
	void do_close();

private:
	template <class Request>
	void log_request(const Request& req);

	template <class Response>
	void send_response(Response&& response);

	void handle_read_error(std::string_view where, boost::system::error_code ec);

private:
	tcp::socket                                             m_socket;
	boost::asio::strand<tcp::socket::executor_type>         m_strand;
	boost::beast::flat_buffer                               m_buffer;

	// The parsed message is stored inside the parser.
	// Use parser::get() or release() to get the message.
	std::optional<EmptyRequestParser> m_parser;

	ProxyHandler m_handler;
	bool m_keep_alive{false};

	// stats
	std::size_t m_nth_session;
	std::size_t m_nth_transaction{};
};

} // end of namespace
