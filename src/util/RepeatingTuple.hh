/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#pragma once

#include <string_view>
#include <tuple>
#include <utility>

namespace apx {

template<typename Dependent, std::size_t>
using DependOn = Dependent;

template<typename T, std::size_t N, typename Indices = std::make_index_sequence<N>>
struct RepeatingTuple;

template<typename T, std::size_t N, std::size_t... Indices>
struct RepeatingTuple<T, N, std::index_sequence<Indices...>>
{
	using type = std::tuple<DependOn<T, Indices>...>;
};

template <typename ResultTuple, std::size_t remain>
constexpr std::size_t match_index()
{
	static_assert(remain < std::tuple_size<ResultTuple>::value);
	return std::tuple_size<ResultTuple>::value - remain - 1;
}

// The first occurrence of a field wins. Later duplicates are ignored.
template <typename Field, typename Value, typename ResultTuple, typename Seen>
void match_field(ResultTuple& result, Seen& seen, std::string_view name, Value&& value, Field field)
{
	constexpr auto index = match_index<ResultTuple, 0>();
	if (name == field && !seen[index])
	{
		std::get<index>(result) = std::forward<Value>(value);
		seen[index] = true;
	}
}

template <typename... Fields, typename Field, typename Value, typename ResultTuple, typename Seen>
void match_field(ResultTuple& result, Seen& seen, std::string_view name, Value&& value, Field field, Fields... remain)
{
	constexpr auto index = match_index<ResultTuple, sizeof...(remain)>();
	if (name == field)
	{
		if (!seen[index])
		{
			std::get<index>(result) = std::forward<Value>(value);
			seen[index] = true;
		}
	}
	else
		match_field(result, seen, name, std::forward<Value>(value), remain...);
}

} // end of namespace
