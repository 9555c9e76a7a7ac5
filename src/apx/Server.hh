/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#pragma once

#include "HTTPObjectStore.hh"
#include "ProxyHandler.hh"
#include "RedisCatalog.hh"

#include "net/Redis.hh"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include <optional>

namespace apx {

class Configuration;

/// The main application logic of asset_proxy. Owns the connections to
/// the catalog and the object store, and creates a ProxyHandler for
/// each incoming connection.
class Server
{
public:
	explicit Server(const Configuration& cfg);

	boost::asio::io_context& get_io_context();

	ProxyHandler start_session();

	void listen();

private:
	const Configuration&        m_cfg;
	boost::asio::io_context     m_ioc;
	boost::asio::ssl::context   m_ssl;

	redis::Pool     m_db;
	RedisCatalog    m_catalog;

	std::optional<HTTPObjectStore> m_store;
};

} // end of namespace
