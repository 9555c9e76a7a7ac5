/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#include "Transcoder.hh"

#include "apx/Transform.hh"
#include "util/Error.hh"
#include "util/Log.hh"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace apx {

cv::Mat load_image(std::string_view raw)
{
	if (raw.empty())
		return {};

	return cv::imdecode(
		cv::Mat{1, static_cast<int>(raw.size()), CV_8U, const_cast<char*>(raw.data())},
		cv::IMREAD_UNCHANGED
	);
}

Size cover_box(const Size& source, std::optional<int> width, std::optional<int> height)
{
	auto scaled = [](int length, double ratio)
	{
		return std::max(1, static_cast<int>(std::lround(length * ratio)));
	};

	if (width && height)
		return {std::min(*width, source.width()), std::min(*height, source.height())};

	else if (width)
	{
		auto w = std::min(*width, source.width());
		return {w, scaled(source.height(), static_cast<double>(w) / source.width())};
	}
	else if (height)
	{
		auto h = std::min(*height, source.height());
		return {scaled(source.width(), static_cast<double>(h) / source.height()), h};
	}
	else
		return source;
}

cv::Mat cover_resize(const cv::Mat& image, const Size& box)
{
	if (image.cols == box.width() && image.rows == box.height())
		return image;

	auto ratio = std::max(
		static_cast<double>(box.width())  / image.cols,
		static_cast<double>(box.height()) / image.rows
	);

	// rounding must not leave the scaled image smaller than the box
	cv::Size scaled{
		std::max(box.width(),  static_cast<int>(std::lround(image.cols * ratio))),
		std::max(box.height(), static_cast<int>(std::lround(image.rows * ratio)))
	};

	cv::Mat resized;
	if (scaled.width != image.cols || scaled.height != image.rows)
		cv::resize(image, resized, scaled, 0, 0, cv::INTER_AREA);
	else
		resized = image;

	cv::Rect roi{
		(resized.cols - box.width()) / 2,
		(resized.rows - box.height()) / 2,
		box.width(),
		box.height()
	};
	return resized(roi);
}

std::vector<unsigned char> transcode(std::string_view raw, const Transform& transform, std::error_code& ec)
{
	std::vector<unsigned char> out;
	try
	{
		auto image = load_image(raw);
		if (image.empty())
		{
			Log(LOG_WARNING, "cannot decode image of %1% bytes", raw.size());
			ec = Error::transcode_failed;
			return {};
		}

		// WebP only supports 8-bit channels
		if (image.depth() == CV_16U)
			image.convertTo(image, CV_8U, 1.0/257);
		else if (image.depth() != CV_8U)
			image.convertTo(image, CV_8U);

		if (transform.resize())
			image = cover_resize(
				image,
				cover_box({image.cols, image.rows}, transform.width, transform.height)
			);

		if (!cv::imencode(".webp", image, out, {cv::IMWRITE_WEBP_QUALITY, transform.quality}))
		{
			Log(LOG_WARNING, "cannot encode %1%x%2% image to WebP", image.cols, image.rows);
			ec = Error::transcode_failed;
			return {};
		}
	}
	catch (cv::Exception& e)
	{
		Log(LOG_WARNING, "OpenCV exception when transcoding image: %1%", e.what());
		ec = Error::transcode_failed;
		return {};
	}
	return out;
}

} // end of namespace apx
