/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#include "Server.hh"

#include "net/Listener.hh"
#include "net/Session.hh"
#include "util/Configuration.hh"
#include "util/Log.hh"

#include <algorithm>

namespace apx {

Server::Server(const Configuration& cfg) :
	m_cfg{cfg},
	m_ioc{static_cast<int>(std::max<std::size_t>(1, cfg.thread_count()))},
	m_ssl{boost::asio::ssl::context::tls_client},
	m_db{m_ioc, cfg.redis()},
	m_catalog{m_db, cfg.catalog_key_prefix()}
{
	m_ssl.set_default_verify_paths();
	m_ssl.set_verify_mode(boost::asio::ssl::verify_peer);

	if (cfg.storage())
		m_store.emplace(m_ioc, m_ssl, *cfg.storage(), cfg.fetch_limit());
	else
		Log(LOG_WARNING, "object store is not configured. All asset requests will fail with 503.");
}

boost::asio::io_context& Server::get_io_context()
{
	return m_ioc;
}

ProxyHandler Server::start_session()
{
	return {m_catalog, m_store ? &*m_store : nullptr, m_cfg.path_prefix()};
}

void Server::listen()
{
	std::make_shared<Listener>(
		m_ioc,
		m_cfg.listen_http(),
		[this](auto&& sock, auto nth)
		{
			return std::make_shared<Session>(std::move(sock), start_session(), nth);
		}
	)->run();

	Log(LOG_NOTICE, "listening to %1%", m_cfg.listen_http());
}

} // end of namespace
