/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#pragma once

#include <boost/asio/ip/tcp.hpp>

#include <memory>
#include <functional>

namespace apx {

class Session;

// Accepts incoming connections and launches the sessions
class Listener : public std::enable_shared_from_this<Listener>
{
public:
	using SessionFactory = std::function<std::shared_ptr<Session>(
		boost::asio::ip::tcp::socket&&,
		std::size_t
	)>;

	Listener(
		boost::asio::io_context &ioc,
		boost::asio::ip::tcp::endpoint endpoint,
		SessionFactory session_factory
	);

	void run();

private:
	void do_accept();
	void on_accept(boost::system::error_code ec);

private:
	boost::asio::ip::tcp::acceptor  m_acceptor;
	boost::asio::ip::tcp::socket    m_socket;
	SessionFactory                  m_session_factory;

	// stats
	std::size_t m_session_count{};
};

} // end of apx namespace
