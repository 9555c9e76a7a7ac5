/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#pragma once

#include <string_view>

namespace apx {

constexpr std::string_view default_mime{"application/octet-stream"};

/// File extension (without the dot) used in proxy URLs for a MIME type.
/// Unknown types use the subtype, or "bin" if there is none.
std::string_view mime_to_extension(std::string_view mime);

/// Raster image types that can be transcoded.
bool is_image(std::string_view mime);

} // end of namespace
