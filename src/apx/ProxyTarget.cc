/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#include "ProxyTarget.hh"

#include "util/Escape.hh"

namespace apx {

ProxyTarget::ProxyTarget(boost::string_view target)
{
	std::string_view path{target.data(), target.size()};

	auto [before_query, match] = split_left(path, "?");
	if (match == '?')
		m_query = path;
	path = before_query;

	if (path.empty() || path.front() != '/')
		return;
	path.remove_prefix(1);

	m_prefix = url_decode(std::get<0>(split_left(path, "/")));
	m_token  = url_decode(std::get<0>(split_left(path, "/")));

	// The rest of the segments form the name. Empty segments are dropped.
	while (!path.empty())
	{
		auto segment = url_decode(std::get<0>(split_left(path, "/")));
		if (segment.empty())
			continue;

		if (!m_name.empty())
			m_name.push_back('/');
		m_name.append(segment);
	}
}

} // end of namespace
