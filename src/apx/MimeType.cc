/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#include "MimeType.hh"

#include <array>
#include <utility>

namespace apx {

std::string_view mime_to_extension(std::string_view mime)
{
	using namespace std::literals;
	static const std::array<std::pair<std::string_view, std::string_view>, 21> table{{
		{"image/jpeg"sv,        "jpg"sv},
		{"image/jpg"sv,         "jpg"sv},
		{"image/png"sv,         "png"sv},
		{"image/gif"sv,         "gif"sv},
		{"image/webp"sv,        "webp"sv},
		{"image/avif"sv,        "avif"sv},
		{"image/bmp"sv,         "bmp"sv},
		{"image/tiff"sv,        "tiff"sv},
		{"image/svg+xml"sv,     "svg"sv},
		{"video/mp4"sv,         "mp4"sv},
		{"video/mpeg"sv,        "mpeg"sv},
		{"video/webm"sv,        "webm"sv},
		{"video/ogg"sv,         "ogv"sv},
		{"video/quicktime"sv,   "mov"sv},
		{"audio/mpeg"sv,        "mp3"sv},
		{"audio/mp3"sv,         "mp3"sv},
		{"audio/wav"sv,         "wav"sv},
		{"audio/ogg"sv,         "ogg"sv},
		{"audio/webm"sv,        "weba"sv},
		{"audio/aac"sv,         "aac"sv},
		{"application/pdf"sv,   "pdf"sv},
	}};

	for (auto&& [type, ext] : table)
		if (type == mime)
			return ext;

	// text after the last slash, or the whole string if there is no slash
	auto subtype = mime.substr(mime.find_last_of('/') + 1);
	return subtype.empty() ? "bin"sv : subtype;
}

bool is_image(std::string_view mime)
{
	// SVG is an image type but cannot be decoded into pixels
	std::string_view image{"image/"};
	return mime.substr(0, image.size()) == image && mime != "image/svg+xml";
}

} // end of namespace
