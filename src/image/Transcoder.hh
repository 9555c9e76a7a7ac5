/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#pragma once

#include "util/Size.hh"

#include <opencv2/core.hpp>

#include <optional>
#include <string_view>
#include <system_error>
#include <vector>

namespace apx {

struct Transform;

/// All transcoded images are encoded in this format.
constexpr std::string_view transcoded_mime{"image/webp"};

cv::Mat load_image(std::string_view raw);

/// Output dimension of a cover-fit resize that never enlarges: each requested
/// dimension is capped at the source dimension. A missing dimension follows
/// the aspect ratio of the source.
Size cover_box(const Size& source, std::optional<int> width, std::optional<int> height);

/// Scale \a image so that it covers \a box and crop the overflow evenly from
/// both sides. \a box must not be larger than the image.
cv::Mat cover_resize(const cv::Mat& image, const Size& box);

/// Decode \a raw, resize it as specified in \a transform and encode the result
/// as WebP. Set \a ec to Error::transcode_failed if the image cannot be
/// decoded or encoded.
std::vector<unsigned char> transcode(std::string_view raw, const Transform& transform, std::error_code& ec);

} // end of namespace apx
