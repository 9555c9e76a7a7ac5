/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#include "Transform.hh"

#include "util/Escape.hh"

#include <algorithm>
#include <limits>
#include <string>

namespace apx {

std::optional<int> parse_positive(std::string_view value)
{
	auto first = value.find_first_not_of(" \t\n\v\f\r");
	if (first == value.npos)
		return std::nullopt;
	value.remove_prefix(first);

	bool negative = false;
	if (value.front() == '+' || value.front() == '-')
	{
		negative = value.front() == '-';
		value.remove_prefix(1);
	}

	// saturate instead of overflow
	long long result = 0;
	bool has_digit = false;
	for (char ch : value)
	{
		if (ch < '0' || ch > '9')
			break;

		has_digit = true;
		result = std::min<long long>(result * 10 + (ch - '0'), std::numeric_limits<int>::max());
	}

	if (!has_digit || negative || result == 0)
		return std::nullopt;

	return static_cast<int>(result);
}

std::optional<Transform> Transform::parse(std::string_view query)
{
	auto [width, height, quality] = find_fields(query, "width", "height", "quality");

	Transform result;
	result.width  = parse_positive(url_decode(width));
	result.height = parse_positive(url_decode(height));

	auto q = parse_positive(url_decode(quality));
	if (!result.resize() && !q)
		return std::nullopt;

	if (q)
		result.quality = std::min(*q, max_quality);

	return result;
}

} // end of namespace
