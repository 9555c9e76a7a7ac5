/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "image/Transcoder.hh"
#include "apx/Transform.hh"
#include "util/Error.hh"

#include <opencv2/imgcodecs.hpp>

using namespace apx;

namespace {

// A 100x50 image with a different colour on each half.
std::string test_png()
{
	cv::Mat image{50, 100, CV_8UC3, cv::Scalar{255, 0, 0}};
	image(cv::Rect{50, 0, 50, 50}).setTo(cv::Scalar{0, 0, 255});

	std::vector<unsigned char> png;
	REQUIRE(cv::imencode(".png", image, png));
	return {png.begin(), png.end()};
}

Size decoded_size(const std::vector<unsigned char>& webp)
{
	auto image = cv::imdecode(webp, cv::IMREAD_UNCHANGED);
	REQUIRE(!image.empty());
	return {image.cols, image.rows};
}

Transform make_transform(std::optional<int> width, std::optional<int> height, int quality = Transform::default_quality)
{
	Transform t;
	t.width   = width;
	t.height  = height;
	t.quality = quality;
	return t;
}

}

TEST_CASE("cover box never enlarges", "[normal]")
{
	Size source{100, 50};

	REQUIRE(cover_box(source, 200, std::nullopt) == Size{100, 50});
	REQUIRE(cover_box(source, 50, std::nullopt) == Size{50, 25});
	REQUIRE(cover_box(source, std::nullopt, 10) == Size{20, 10});
	REQUIRE(cover_box(source, 30, 30) == Size{30, 30});
	REQUIRE(cover_box(source, 300, 30) == Size{100, 30});
	REQUIRE(cover_box(source, std::nullopt, std::nullopt) == source);

	// never zero
	REQUIRE(cover_box(source, 1, std::nullopt) == Size{1, 1});
}

TEST_CASE("cover resize crops the overflow", "[normal]")
{
	cv::Mat image{50, 100, CV_8UC3, cv::Scalar{255, 0, 0}};

	auto square = cover_resize(image, {50, 50});
	REQUIRE(square.cols == 50);
	REQUIRE(square.rows == 50);

	auto tall = cover_resize(image, {20, 50});
	REQUIRE(tall.cols == 20);
	REQUIRE(tall.rows == 50);

	auto same = cover_resize(image, {100, 50});
	REQUIRE(same.cols == 100);
	REQUIRE(same.rows == 50);
}

TEST_CASE("transcode PNG to WebP", "[normal]")
{
	auto png = test_png();
	std::error_code ec;

	SECTION("requested width larger than the source")
	{
		auto webp = transcode(png, make_transform(200, std::nullopt), ec);
		REQUIRE(!ec);
		REQUIRE(decoded_size(webp) == Size{100, 50});
	}
	SECTION("downscale keeps aspect ratio")
	{
		auto webp = transcode(png, make_transform(50, std::nullopt), ec);
		REQUIRE(!ec);
		REQUIRE(decoded_size(webp) == Size{50, 25});
	}
	SECTION("cover fit with both dimensions")
	{
		auto webp = transcode(png, make_transform(40, 40), ec);
		REQUIRE(!ec);
		REQUIRE(decoded_size(webp) == Size{40, 40});
	}
	SECTION("quality only")
	{
		auto webp = transcode(png, make_transform(std::nullopt, std::nullopt, 50), ec);
		REQUIRE(!ec);
		REQUIRE(decoded_size(webp) == Size{100, 50});

		// RIFF container of WebP
		REQUIRE(webp.size() > 12);
		REQUIRE(std::string(webp.begin(), webp.begin() + 4) == "RIFF");
		REQUIRE(std::string(webp.begin() + 8, webp.begin() + 12) == "WEBP");
	}
}

TEST_CASE("transcode image with alpha channel", "[normal]")
{
	cv::Mat image{40, 40, CV_8UC4, cv::Scalar{0, 255, 0, 128}};
	std::vector<unsigned char> png;
	REQUIRE(cv::imencode(".png", image, png));

	std::error_code ec;
	auto webp = transcode({reinterpret_cast<const char*>(png.data()), png.size()}, make_transform(20, std::nullopt), ec);
	REQUIRE(!ec);

	auto decoded = cv::imdecode(webp, cv::IMREAD_UNCHANGED);
	REQUIRE(decoded.cols == 20);
	REQUIRE(decoded.rows == 20);
	REQUIRE(decoded.channels() == 4);
}

TEST_CASE("transcode corrupted image", "[error]")
{
	std::error_code ec;

	auto webp = transcode("this is not an image", make_transform(100, std::nullopt), ec);
	REQUIRE(ec == apx::Error::transcode_failed);
	REQUIRE(webp.empty());

	ec.clear();
	webp = transcode("", make_transform(std::nullopt, std::nullopt, 80), ec);
	REQUIRE(ec == apx::Error::transcode_failed);
	REQUIRE(webp.empty());
}

TEST_CASE("quality controls the WebP encoder", "[normal]")
{
	// noise so that the lossy encoder has something to throw away
	cv::Mat image{64, 64, CV_8UC3};
	cv::randu(image, cv::Scalar::all(0), cv::Scalar::all(255));

	std::vector<unsigned char> png;
	REQUIRE(cv::imencode(".png", image, png));
	std::string raw{png.begin(), png.end()};

	std::error_code ec;
	auto low = transcode(raw, make_transform(std::nullopt, std::nullopt, 10), ec);
	REQUIRE(!ec);
	auto high = transcode(raw, make_transform(std::nullopt, std::nullopt, 100), ec);
	REQUIRE(!ec);

	REQUIRE(decoded_size(low) == Size{64, 64});
	REQUIRE(decoded_size(high) == Size{64, 64});
	REQUIRE(low.size() < high.size());
}
