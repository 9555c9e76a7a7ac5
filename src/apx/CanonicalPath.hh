/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace apx {

struct AssetRecord;

/// Lowercase ASCII letters and digits. Every run of other characters becomes
/// a single dash, and leading or trailing dashes are removed.
std::string sanitize_name(std::string_view name);

/// The SEO-friendly name segment of an asset, e.g. "summer-photo.jpg".
/// Returns std::nullopt if the record has no usable slug or filename.
std::optional<std::string> cosmetic_name(const AssetRecord& asset);

/// "/{prefix}/{token}/{cosmetic name}", or std::nullopt if the asset has no
/// cosmetic name.
std::optional<std::string> canonical_path(std::string_view prefix, const AssetRecord& asset);

} // end of namespace
