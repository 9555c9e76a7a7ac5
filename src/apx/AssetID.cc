/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#include "AssetID.hh"

#include <boost/algorithm/hex.hpp>
#include <boost/multiprecision/cpp_int.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <ostream>
#include <vector>

namespace apx {

using boost::multiprecision::cpp_int;

namespace {

constexpr unsigned base = base62_alphabet.size();
constexpr std::size_t hex_digits = AssetID{}.size() * 2;

// positions of the dashes in the 8-4-4-4-12 form
constexpr std::array<std::size_t, 4> dash_positions{8, 13, 18, 23};

cpp_int to_integer(const AssetID& id)
{
	cpp_int num;
	import_bits(num, id.begin(), id.end());
	return num;
}

AssetID from_integer(cpp_int num)
{
	// keep the most significant 32 hex digits if the value is too large
	if (num != 0)
	{
		auto digits = msb(num) / 4 + 1;
		if (digits > hex_digits)
			num >>= 4 * (digits - hex_digits);
	}

	std::vector<unsigned char> bytes;
	export_bits(num, std::back_inserter(bytes), 8);

	AssetID id{};
	std::copy(bytes.rbegin(), bytes.rend(), id.rbegin());
	return id;
}

} // end of local namespace

std::string to_token(const AssetID& id)
{
	auto num = to_integer(id);

	std::string result;
	result.reserve(token_length);
	while (num > 0)
	{
		cpp_int digit = num % base;
		result.push_back(base62_alphabet[digit.convert_to<std::size_t>()]);
		num /= base;
	}

	// most significant symbol first, zero-padded
	result.append(token_length - std::min(result.size(), token_length), base62_alphabet.front());
	std::reverse(result.begin(), result.end());
	return result;
}

std::optional<AssetID> token_to_asset_id(std::string_view token)
{
	cpp_int num;
	for (char ch : token)
	{
		auto index = base62_alphabet.find(ch);
		if (index == base62_alphabet.npos)
			return std::nullopt;

		num = num * base + index;
	}
	return from_integer(std::move(num));
}

std::string to_uuid(const AssetID& id)
{
	std::string hex(id.size()*2, '\0');
	boost::algorithm::hex_lower(id.begin(), id.end(), hex.begin());

	for (auto pos : dash_positions)
		hex.insert(pos, 1, '-');
	return hex;
}

std::optional<AssetID> uuid_to_asset_id(std::string_view uuid)
{
	std::string hex;
	if (uuid.size() == hex_digits + dash_positions.size())
	{
		for (std::size_t i = 0; i < uuid.size(); ++i)
		{
			auto is_dash_pos = std::find(dash_positions.begin(), dash_positions.end(), i) != dash_positions.end();
			if (is_dash_pos != (uuid[i] == '-'))
				return std::nullopt;
			if (!is_dash_pos)
				hex.push_back(uuid[i]);
		}
	}
	else if (uuid.size() == hex_digits)
		hex = uuid;
	else
		return std::nullopt;

	if (!std::all_of(hex.begin(), hex.end(), [](unsigned char c){return std::isxdigit(c) != 0;}))
		return std::nullopt;

	AssetID result{};
	boost::algorithm::unhex(hex.begin(), hex.end(), result.begin());
	return result;
}

std::ostream& operator<<(std::ostream& os, const AssetID& id)
{
	return os << to_uuid(id);
}

} // end of namespace
