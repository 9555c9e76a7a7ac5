/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#include "HTTPFetch.hh"

#include "util/Escape.hh"
#include "util/Log.hh"

#include <boost/asio/connect.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace apx {

std::optional<URL> URL::parse(std::string_view url)
{
	auto sep = url.find("://");
	if (sep == url.npos)
		return std::nullopt;

	URL result;
	result.scheme = url.substr(0, sep);
	if (result.scheme != "http" && result.scheme != "https")
		return std::nullopt;
	url.remove_prefix(sep + 3);

	auto [authority, slash] = split_left(url, "/");
	if (authority.empty())
		return std::nullopt;

	result.target = "/";
	if (slash == '/')
		result.target.append(url);

	// The port is after the last colon, unless it is an IPv6 literal like "[::1]".
	auto colon = authority.find_last_of(':');
	if (colon != authority.npos && authority.find(']', colon) == authority.npos)
	{
		result.host = authority.substr(0, colon);
		result.port = authority.substr(colon + 1);
		if (result.port.empty() || result.port.find_first_not_of("0123456789") != result.port.npos)
			return std::nullopt;
	}
	else
	{
		result.host = authority;
		result.port = result.secure() ? "443" : "80";
	}

	if (result.host.empty())
		return std::nullopt;

	return result;
}

HTTPFetch::HTTPFetch(boost::asio::io_context& ioc, boost::asio::ssl::context& ctx, std::size_t body_limit) :
	m_resolver{ioc},
	m_socket{ioc},
	m_stream{m_socket, ctx}
{
	m_parser.body_limit(body_limit);
}

bool HTTPFetch::verify_certificate(const std::string& host, bool preverified, boost::asio::ssl::verify_context& ctx)
{
	auto ok = boost::asio::ssl::host_name_verification{host}(preverified, ctx);
	if (!ok)
		Log(LOG_WARNING, "rejecting certificate of %1%", host);
	return ok;
}

void HTTPFetch::run(const URL& url, Completion&& comp)
{
	m_comp   = std::move(comp);
	m_secure = url.secure();

	// Set SNI Hostname (many hosts need this to handshake successfully)
	if (m_secure && !SSL_set_tlsext_host_name(m_stream.native_handle(), url.host.c_str()))
	{
		boost::system::error_code ec{static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()};
		return fail(ec, "SSL_set_tlsext_host_name");
	}

	if (m_secure)
	{
		boost::system::error_code ec;
		m_stream.set_verify_callback([host=url.host](bool preverified, boost::asio::ssl::verify_context& ctx)
		{
			return verify_certificate(host, preverified, ctx);
		}, ec);
		if (ec)
			return fail(ec, "set_verify_callback");
	}

	// Set up an HTTP GET request message
	m_req.version(11);
	m_req.method(http::verb::get);
	m_req.target(url.target);
	m_req.set(http::field::host, url.host);
	m_req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);

	// Look up the domain name
	m_resolver.async_resolve(
		url.host,
		url.port,
		[self=shared_from_this()](auto ec, auto&& results){self->on_resolve(ec, std::move(results));}
	);
}

void HTTPFetch::on_resolve(
	boost::system::error_code ec,
	boost::asio::ip::tcp::resolver::results_type results
)
{
	if (ec)
		return fail(ec, "resolve");

	// Make the connection on the IP address we get from a lookup
	boost::asio::async_connect(
		m_socket,
		results.begin(),
		results.end(),
		[self=shared_from_this()](auto ec, auto&&){self->on_connect(ec);}
	);
}

void HTTPFetch::on_connect(boost::system::error_code ec)
{
	if (ec)
		return fail(ec, "connect");

	if (!m_secure)
		return on_handshake(ec);

	// Perform the SSL handshake
	m_stream.async_handshake(
		boost::asio::ssl::stream_base::client,
		[self=shared_from_this()](auto ec){self->on_handshake(ec);}
	);
}

void HTTPFetch::on_handshake(boost::system::error_code ec)
{
	if (ec)
		return fail(ec, "handshake");

	// Send the HTTP request to the remote host
	with_stream([this](auto& stream)
	{
		http::async_write(
			stream, m_req,
			[self=shared_from_this()](auto ec, auto){self->on_write(ec);}
		);
	});
}

void HTTPFetch::on_write(boost::system::error_code ec)
{
	if (ec)
		return fail(ec, "write");

	// Receive the HTTP response
	with_stream([this](auto& stream)
	{
		http::async_read(
			stream, m_buffer, m_parser,
			[self=shared_from_this()](auto ec, auto){self->on_read(ec);}
		);
	});
}

void HTTPFetch::on_read(boost::system::error_code ec)
{
	if (ec)
		return fail(ec, "read");

	m_comp(std::error_code{}, m_parser.release());

	// The connection is not reused. Closing the socket is enough even
	// for HTTPS because the response has been read completely.
	m_socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
	m_socket.close(ec);
}

void HTTPFetch::fail(boost::system::error_code ec, const char *what)
{
	Log(LOG_WARNING, "cannot fetch %1%%2%: %3% error %4% (%5%)", m_req[http::field::host], m_req.target(), what, ec, ec.message());
	m_comp(std::error_code{ec.value(), ec.category()}, Response{});
}

} // end of namespace
