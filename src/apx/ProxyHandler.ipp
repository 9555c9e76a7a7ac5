/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#pragma once

#include "ProxyHandler.hh"

#include "util/Error.hh"
#include "util/Log.hh"

#include <boost/beast/http/verb.hpp>

#include <exception>
#include <type_traits>

namespace apx {

template <class Request, class Send>
void ProxyHandler::handle_request(Request&& req, Send&& send)
{
	auto version = req.version();
	if (req.method() != http::verb::get)
		return send(bad_request("Unsupported HTTP method", version));

	try
	{
		serve(ProxyTarget{req.target()}, [send, version](Outcome&& out) mutable
		{
			if (out.ec)
				return send(error_response(out.ec, version));

			if (!out.location.empty())
				return send(moved_permanently(out.location, version));

			std::visit([&send, &out, version](auto&& bytes)
			{
				using Body = std::conditional_t<
					std::is_same<std::decay_t<decltype(bytes)>, std::string>::value,
					http::string_body,
					http::vector_body<unsigned char>
				>;

				auto size = bytes.size();
				http::response<Body> res{
					std::piecewise_construct,
					std::make_tuple(std::move(bytes)),
					std::make_tuple(http::status::ok, version)
				};
				res.set(http::field::content_type, out.mime);
				res.content_length(size);
				send(std::move(res));
			}, out.body);
		});
	}
	catch (std::exception& e)
	{
		Log(LOG_WARNING, "exception thrown when serving %1%: %2%", req.target(), e.what());
		send(error_response(Error::unknown_error, version));
	}
}

} // end of namespace
