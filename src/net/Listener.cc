/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#include "Listener.hh"
#include "Session.hh"

#include "util/Exception.hh"
#include "util/Log.hh"

#include <boost/exception/errinfo_api_function.hpp>
#include <boost/exception/info.hpp>
#include <boost/throw_exception.hpp>

namespace apx {

Listener::Listener(
	boost::asio::io_context &ioc,
	boost::asio::ip::tcp::endpoint endpoint,
	SessionFactory session_factory
) :
	m_acceptor{ioc},
	m_socket{ioc},
	m_session_factory{std::move(session_factory)}
{
	boost::system::error_code ec;

	// Open the acceptor
	m_acceptor.open(endpoint.protocol(), ec);
	if (ec)
		BOOST_THROW_EXCEPTION(SystemError()
			<< ErrorCode(std::error_code(ec.value(), std::system_category()))
			<< boost::errinfo_api_function("open")
		);

	m_acceptor.set_option(boost::asio::socket_base::reuse_address{true});

	// Bind to the server address
	m_acceptor.bind(endpoint, ec);
	if (ec)
		BOOST_THROW_EXCEPTION(SystemError()
			<< ErrorCode(std::error_code(ec.value(), std::system_category()))
			<< boost::errinfo_api_function("bind")
		);

	// Start listening for connections
	m_acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
	if (ec)
		BOOST_THROW_EXCEPTION(SystemError()
			<< ErrorCode(std::error_code(ec.value(), std::system_category()))
			<< boost::errinfo_api_function("listen")
		);
}

void Listener::run()
{
	if (m_acceptor.is_open())
		do_accept();
}

void Listener::do_accept()
{
	m_acceptor.async_accept(
		m_socket,
		[self = shared_from_this()](auto ec)
		{
			self->on_accept(ec);
		}
	);
}

void Listener::on_accept(boost::system::error_code ec)
{
	if (ec)
	{
		Log(LOG_WARNING, "accept error: %1%", ec);
	}
	else
	{
		// Create the session and run it
		m_session_factory(std::move(m_socket), m_session_count)->run();
		m_session_count++;
	}

	// Accept another connection
	do_accept();
}

} // end of namespace
