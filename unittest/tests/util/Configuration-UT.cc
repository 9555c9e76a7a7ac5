/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "util/Configuration.hh"
#include "util/JsonHelper.hh"

#include <boost/exception/get_error_info.hpp>

using namespace apx;

namespace {

// Put all test data (i.e. the configuration files in this test) in the same directory as
// the source code, and use __FILE__ macro to find the test data.
// Expect __FILE__ to give the absolute path so the unit test can be run in any directory.
const boost::filesystem::path current_src = boost::filesystem::path{__FILE__}.parent_path();
}

TEST_CASE( "--help command line parsing", "[normal]" )
{
	const char *argv[] = {"asset_proxy", "--help"};
	Configuration cfg{sizeof(argv)/sizeof(argv[1]), argv, nullptr};
	REQUIRE(cfg.help());
}

TEST_CASE( "Configuration without command line argument", "[error]" )
{
	REQUIRE_THROWS_AS(Configuration(0, nullptr, ""), Configuration::FileError);
}

TEST_CASE( "Load normal.json", "[normal]" )
{
	auto normal_json = (current_src / "normal.json").string();

	const char *argv[] = {"asset_proxy", "--cfg", normal_json.c_str()};
	Configuration cfg{sizeof(argv)/sizeof(argv[1]), argv, nullptr};

	REQUIRE(!cfg.help());
	REQUIRE(cfg.listen_http().address() == boost::asio::ip::make_address("0.0.0.0"));
	REQUIRE(cfg.listen_http().port() == 8080);
	REQUIRE(cfg.redis().address() == boost::asio::ip::make_address("192.168.1.1"));
	REQUIRE(cfg.redis().port() == 9181);
	REQUIRE(cfg.thread_count() == 4);
	REQUIRE(cfg.fetch_limit() == 10*1024*1024);
	REQUIRE(cfg.path_prefix() == "assets");
	REQUIRE(cfg.catalog_key_prefix() == "media:");

	REQUIRE(cfg.storage().has_value());
	REQUIRE(cfg.storage()->url == "https://example.supabase.co");
	REQUIRE(cfg.storage()->bucket == "public-assets");
}

TEST_CASE( "Configuration file from environment variable", "[normal]" )
{
	auto minimal_json = (current_src / "minimal.json").string();

	const char *argv[] = {"asset_proxy"};
	Configuration cfg{sizeof(argv)/sizeof(argv[1]), argv, minimal_json.c_str()};

	REQUIRE(cfg.listen_http().address() == boost::asio::ip::make_address("127.0.0.1"));
	REQUIRE(cfg.listen_http().port() == 80);

	// defaults
	REQUIRE(cfg.redis().address() == boost::asio::ip::make_address("127.0.0.1"));
	REQUIRE(cfg.redis().port() == 6379);
	REQUIRE(cfg.thread_count() == 1);
	REQUIRE(cfg.fetch_limit() == 64*1024*1024);
	REQUIRE(cfg.path_prefix() == "a");
	REQUIRE(cfg.catalog_key_prefix() == "asset:");
	REQUIRE(!cfg.storage().has_value());
}

TEST_CASE( "Missing HTTP listen address", "[error]" )
{
	auto error_json = (current_src / "missing_http.json").string();

	const char *argv[] = {"asset_proxy", "--cfg", error_json.c_str()};
	REQUIRE_THROWS_AS(Configuration(sizeof(argv)/sizeof(argv[1]), argv, nullptr), json::Error);
}

TEST_CASE( "Path prefix with slash", "[error]" )
{
	auto error_json = (current_src / "bad_prefix.json").string();

	const char *argv[] = {"asset_proxy", "--cfg", error_json.c_str()};
	REQUIRE_THROWS_AS(Configuration(sizeof(argv)/sizeof(argv[1]), argv, nullptr), Configuration::InvalidValue);
}

TEST_CASE( "Storage without bucket", "[error]" )
{
	auto error_json = (current_src / "missing_bucket.json").string();

	const char *argv[] = {"asset_proxy", "--cfg", error_json.c_str()};
	REQUIRE_THROWS_AS(Configuration(sizeof(argv)/sizeof(argv[1]), argv, nullptr), json::Error);
}

TEST_CASE( "JSON syntax error", "[error]" )
{
	auto error_json = (current_src / "syntax_error.json").string();

	const char *argv[] = {"asset_proxy", "--cfg", error_json.c_str()};
	try
	{
		Configuration cfg{sizeof(argv)/sizeof(argv[1]), argv, nullptr};
		FAIL("syntax error is not reported");
	}
	catch (Configuration::Error& e)
	{
		REQUIRE(boost::get_error_info<Configuration::Offset>(e) != nullptr);
		REQUIRE(boost::get_error_info<Configuration::Message>(e) != nullptr);

		auto path = boost::get_error_info<Configuration::Path>(e);
		REQUIRE(path != nullptr);
		REQUIRE(*path == error_json);
	}
}
