/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#pragma once

#include <array>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace apx {

// If use a typedef (or using), then the argument-dependent lookup (ADL) will not
// work for operator<<
/// 128-bit asset identifier (a UUID) stored as 16 big-endian bytes.
struct AssetID : std::array<unsigned char, 16>
{
};

static_assert(std::is_standard_layout<AssetID>::value);

/// Number of characters in a base-62 token. Every AssetID encodes to exactly
/// this many characters.
constexpr std::size_t token_length = 22;

/// The 62 symbols of the token alphabet, in ascending order of value.
constexpr std::string_view base62_alphabet{"0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz"};

std::string to_token(const AssetID& id);

/// Decode a base-62 token. Returns std::nullopt if any character is outside
/// the alphabet. The length of the token is not checked: short tokens give
/// small values, and only the 32 most significant hex digits of values
/// larger than 128 bits are kept.
std::optional<AssetID> token_to_asset_id(std::string_view token);

/// Lowercase 8-4-4-4-12 hex form, e.g. "8f2a4b1c-7d8e-4f12-b345-6789abcdef01"
std::string to_uuid(const AssetID& id);

/// Accepts the 8-4-4-4-12 form or 32 hex digits without dashes, in any case.
std::optional<AssetID> uuid_to_asset_id(std::string_view uuid);

std::ostream& operator<<(std::ostream& os, const AssetID& id);

} // end of namespace
