/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#include "Session.hh"

#include "apx/ProxyHandler.ipp"

#include "util/Log.hh"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>

namespace apx {

Session::Session(
	boost::asio::ip::tcp::socket socket,
	ProxyHandler&& handler,
	std::size_t nth
) :
	m_socket{std::move(socket)},
	m_strand{m_socket.get_executor()},
	m_handler{std::move(handler)},
	m_nth_session{nth}
{
}

// Start the asynchronous operation
void Session::run()
{
	do_read();
}

void Session::do_read()
{
	// Destroy and re-construct the parser for a new HTTP transaction
	m_parser.emplace();

	// Read a request
	async_read(m_socket, m_buffer, *m_parser, boost::asio::bind_executor(
		m_strand,
		[self=shared_from_this()](auto ec, auto bytes) {self->on_read(ec, bytes);}
	));
}

void Session::on_read(boost::system::error_code ec, std::size_t)
{
	// This means they closed the connection
	if (ec)
		return handle_read_error(__PRETTY_FUNCTION__, ec);

	auto req = m_parser->release();
	m_keep_alive = req.keep_alive();
	log_request(req);

	m_handler.handle_request(std::move(req), [self=shared_from_this(), this, nth=m_nth_transaction](auto&& response)
	{
		Log(LOG_INFO, "%1%:%2% response %3%", m_nth_session, nth, response.result_int());
		send_response(std::forward<decltype(response)>(response));
	});
	m_nth_transaction++;
}

template <class Request>
void Session::log_request(const Request& req)
{
	boost::system::error_code ec;
	auto endpoint = m_socket.remote_endpoint(ec);
	if (ec)
		Log(LOG_WARNING, "remote_endpoint() error: %1% %2%", ec, ec.message());

	Log(
		LOG_INFO,
		"%1%:%2% %3% request %4% from %5%",
		m_nth_session,
		m_nth_transaction,
		req.method_string(),
		req.target(),
		endpoint
	);
}

template <class Response>
void Session::send_response(Response&& response)
{
	// The lifetime of the message has to extend
	// for the duration of the async operation so
	// we use a shared_ptr to manage it.
	auto sp = std::make_shared<std::remove_reference_t<Response>>(std::forward<Response>(response));
	sp->set(http::field::server, BOOST_BEAST_VERSION_STRING);
	sp->keep_alive(m_keep_alive);
	sp->prepare_payload();

	// The response may be sent from a thread that runs the completion of
	// the catalog or the object store, so dispatch to our strand first.
	boost::asio::dispatch(m_strand, [self=shared_from_this(), sp]
	{
		async_write(self->m_socket, *sp, boost::asio::bind_executor(
			self->m_strand,
			[self, sp](auto&& ec, auto bytes)
			{ self->on_write(ec, bytes, sp->need_eof()); }
		));
	});
}

void Session::handle_read_error(std::string_view where, boost::system::error_code ec)
{
	// This means they closed the connection
	if (ec == boost::beast::http::error::end_of_stream)
		return do_close();

	Log(LOG_NOTICE, "read error @ %3%: %1% (%2%)", ec, ec.message(), where);
	m_keep_alive = false;
	send_response(ProxyHandler::bad_request(ec.message(), 11));
}

void Session::on_write(
	boost::system::error_code ec,
	std::size_t,
	bool close)
{
	if (close)
	{
		// This means we should close the connection, usually because
		// the response indicated the "Connection: close" semantic.
		return do_close();
	}

	// Read another request
	if (!ec)
		do_read();
}

void Session::do_close()
{
	// Send a TCP shutdown
	boost::system::error_code ec;
	m_socket.shutdown(tcp::socket::shutdown_send, ec);

	// At this point the connection is closed gracefully
}

} // end of namespace
