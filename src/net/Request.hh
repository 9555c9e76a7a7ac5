/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

// This file is intended to be used as a precompile header.
// #pragma once doesn't work well for precompiled headers
// so we use an old-style include guard here
#ifndef APX_NET_REQUEST_PRECOMPILED_HEADER_INCLUDED
#define APX_NET_REQUEST_PRECOMPILED_HEADER_INCLUDED

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/parser.hpp>

#include <boost/asio/ip/tcp.hpp>

namespace apx {

using tcp = boost::asio::ip::tcp;       // from <boost/asio/ip/tcp.hpp>
namespace http = boost::beast::http;    // from <boost/beast/http.hpp>

using EndPoint = boost::asio::ip::tcp::endpoint;

// The proxy only serves GET requests so the request body is never read.
using EmptyRequest       = http::request<http::empty_body>;
using EmptyRequestParser = http::request_parser<http::empty_body>;

}

#endif
