/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#pragma once

#include "ObjectStore.hh"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

namespace apx {

struct StorageSetting;

/// Object store that serves public objects over HTTP(S) with URLs like
/// "{base}/storage/v1/object/public/{bucket}/{path}".
class HTTPObjectStore : public ObjectStore
{
public:
	HTTPObjectStore(
		boost::asio::io_context& ioc,
		boost::asio::ssl::context& ssl,
		const StorageSetting& setting,
		std::size_t fetch_limit
	);

	std::string public_url(std::string_view storage_path) const override;
	void fetch(const std::string& url, FetchCompletion&& complete) override;

private:
	boost::asio::io_context&    m_ioc;
	boost::asio::ssl::context&  m_ssl;
	std::string                 m_base;
	std::string                 m_bucket;
	std::size_t                 m_fetch_limit;
};

} // end of namespace
