/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#pragma once

#include "RepeatingTuple.hh"

#include <array>
#include <string>
#include <string_view>
#include <tuple>

namespace apx {

std::string url_encode(std::string_view in, std::string_view keep = {});
std::string url_decode(std::string_view in);

std::tuple<std::string_view, char> split_left(std::string_view& in, std::string_view value);
std::tuple<std::string_view, char> split_right(std::string_view& in, std::string_view value);

/// Extract the values of the given fields from a query string like "a=1&b=2".
/// Only '&' separates fields. Fields that are not found are left empty. If a
/// field appears more than once, the first one is used.
template <typename... Fields>
auto find_fields(std::string_view remain, Fields... fields)
{
	typename RepeatingTuple<std::string_view, sizeof...(fields)>::type result;
	std::array<bool, sizeof...(fields)> seen{};
	while (!remain.empty())
	{
		// Don't remove the temporary variables because the order
		// of execution in function parameters is undefined.
		auto [name, match]  = split_left(remain, "=&");
		auto value = (match == '=' ? std::get<0>(split_left(remain, "&")) : std::string_view{});

		match_field(result, seen, name, value, fields...);
	}
	return result;
}

} // end of namespace
