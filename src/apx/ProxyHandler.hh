/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#pragma once

#include "AssetRecord.hh"
#include "ProxyTarget.hh"
#include "Transform.hh"

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/vector_body.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

namespace apx {

namespace http = boost::beast::http;    // from <boost/beast/http.hpp>

class Catalog;
class ObjectStore;

/// Serves one proxy request: decodes the token, looks up the asset,
/// redirects stale names, then streams the bytes from the object store,
/// transcoding images on request.
class ProxyHandler
{
public:
	using Payload = std::variant<std::string, std::vector<unsigned char>>;

	/// What to send back to the client. Exactly one of error, redirect
	/// or payload applies.
	struct Outcome
	{
		std::error_code ec;
		std::string     location;
		std::string     mime;
		Payload         body;
	};
	using Completion = std::function<void(Outcome&&)>;

public:
	ProxyHandler(Catalog& catalog, ObjectStore *store, std::string path_prefix);

	// This function produces an HTTP response for the given
	// request. The type of the response object depends on the
	// outcome, so the interface requires the caller to pass a
	// generic lambda for receiving the response.
	template <class Request, class Send>
	void handle_request(Request&& req, Send&& send);

	void serve(const ProxyTarget& target, Completion&& complete);

	static http::status status_of(std::error_code ec);

	static http::response<http::string_body> bad_request(boost::string_view why, unsigned version);
	static http::response<http::string_body> error_response(std::error_code ec, unsigned version);
	static http::response<http::empty_body> moved_permanently(boost::string_view where, unsigned version);

private:
	using SharedCompletion = std::shared_ptr<Completion>;

	static void finish(const SharedCompletion& done, Outcome&& out);
	void on_lookup(ProxyTarget&& target, std::optional<AssetRecord>&& asset, const SharedCompletion& done);
	void on_fetch(ProxyTarget&& target, AssetRecord&& asset, std::string&& bytes, const SharedCompletion& done);

private:
	Catalog&        m_catalog;
	ObjectStore     *m_store{};
	std::string     m_prefix;
};

} // end of namespace
