/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#pragma once

#include <boost/utility/string_view.hpp>

#include <string>
#include <string_view>

namespace apx {

/// Splits a request target like "/a/{token}/some/name.png?width=100" into
/// its prefix, token, name and query string.
class ProxyTarget
{
public:
	ProxyTarget() = default;
	explicit ProxyTarget(boost::string_view target);

	const std::string& prefix() const {return m_prefix;}
	const std::string& token() const {return m_token;}

	/// Percent-decoded name segments joined by '/'. May be empty.
	const std::string& name() const {return m_name;}

	/// Raw query string without the leading '?'.
	std::string_view query() const {return m_query;}

	bool valid() const {return !m_prefix.empty() && !m_token.empty();}

private:
	std::string m_prefix;
	std::string m_token;
	std::string m_name;
	std::string m_query;
};

} // end of namespace
