/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#pragma once

#include <optional>
#include <string_view>

namespace apx {

/// Resize and re-encode directives of an image request, i.e. the
/// "width", "height" and "quality" query parameters.
struct Transform
{
	static constexpr int default_quality = 80;
	static constexpr int max_quality = 100;

	std::optional<int> width;
	std::optional<int> height;
	int quality{default_quality};

	bool resize() const {return width.has_value() || height.has_value();}

	/// Returns std::nullopt when none of the parameters are present, which
	/// means no transform is requested. Never throws.
	static std::optional<Transform> parse(std::string_view query);
};

/// Parse the leading integer of \a value, ignoring leading spaces and
/// trailing characters. Returns std::nullopt unless the result is
/// strictly positive.
std::optional<int> parse_positive(std::string_view value);

} // end of namespace
