/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#include "HTTPObjectStore.hh"

#include "net/HTTPFetch.hh"
#include "util/Configuration.hh"
#include "util/Error.hh"
#include "util/Escape.hh"
#include "util/Log.hh"

namespace apx {

HTTPObjectStore::HTTPObjectStore(
	boost::asio::io_context& ioc,
	boost::asio::ssl::context& ssl,
	const StorageSetting& setting,
	std::size_t fetch_limit
) :
	m_ioc{ioc},
	m_ssl{ssl},
	m_base{setting.url},
	m_bucket{setting.bucket},
	m_fetch_limit{fetch_limit}
{
}

std::string HTTPObjectStore::public_url(std::string_view storage_path) const
{
	auto url = m_base + "/storage/v1/object/public/" + url_encode(m_bucket);

	// Encode each segment of the path but keep the slashes between them.
	url.append("/");
	url.append(url_encode(storage_path, "/"));
	return url;
}

void HTTPObjectStore::fetch(const std::string& url, FetchCompletion&& complete)
{
	auto parsed = URL::parse(url);
	if (!parsed)
	{
		Log(LOG_WARNING, "invalid object store URL: \"%1%\"", url);
		return complete(Error::storage_unavailable, std::string{});
	}

	std::make_shared<HTTPFetch>(m_ioc, m_ssl, m_fetch_limit)->run(
		*parsed,
		[comp=std::move(complete), url](std::error_code ec, HTTPFetch::Response&& res)
		{
			if (ec)
				return comp(ec, std::string{});

			if (http::to_status_class(res.result()) != http::status_class::successful)
			{
				Log(LOG_NOTICE, "object store responded %1% for %2%", res.result_int(), url);
				return comp(Error::upstream_fetch_failed, std::string{});
			}

			comp(std::error_code{}, std::move(res.body()));
		}
	);
}

} // end of namespace
