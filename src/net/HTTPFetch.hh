/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#pragma once

#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/ssl/verify_context.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace apx {

namespace http = boost::beast::http;    // from <boost/beast/http.hpp>

/// The parts of an absolute "http" or "https" URL needed to send a request.
struct URL
{
	std::string scheme;
	std::string host;
	std::string port;
	std::string target;

	bool secure() const {return scheme == "https";}

	static std::optional<URL> parse(std::string_view url);
};

/// Sends a single GET request and reads the whole response body into
/// memory. Plain HTTP and HTTPS are both supported.
class HTTPFetch : public std::enable_shared_from_this<HTTPFetch>
{
public:
	using Response   = http::response<http::string_body>;
	using Completion = std::function<void(std::error_code, Response&&)>;

public:
	HTTPFetch(boost::asio::io_context& ioc, boost::asio::ssl::context& ctx, std::size_t body_limit);

	void run(const URL& url, Completion&& comp);

	/// Accepts a server certificate only if the chain is trusted and the
	/// leaf certificate is issued for \a host.
	static bool verify_certificate(const std::string& host, bool preverified, boost::asio::ssl::verify_context& ctx);

private:
	void on_resolve(boost::system::error_code ec, boost::asio::ip::tcp::resolver::results_type results);
	void on_connect(boost::system::error_code ec);
	void on_handshake(boost::system::error_code ec);
	void on_write(boost::system::error_code ec);
	void on_read(boost::system::error_code ec);

	void fail(boost::system::error_code ec, const char *what);

	template <typename Handler>
	void with_stream(Handler&& handler)
	{
		if (m_secure)
			handler(m_stream);
		else
			handler(m_socket);
	}

private:
	boost::asio::ip::tcp::resolver  m_resolver;
	boost::asio::ip::tcp::socket    m_socket;
	boost::asio::ssl::stream<boost::asio::ip::tcp::socket&> m_stream;
	bool                            m_secure{false};

	boost::beast::flat_buffer           m_buffer; // (Must persist between reads)
	http::request<http::empty_body>     m_req;
	http::response_parser<http::string_body> m_parser;

	Completion m_comp;
};

} // end of namespace
