/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "net/Redis.hh"
#include "apx/RedisCatalog.hh"
#include "util/Error.hh"

#include <string>

using namespace apx;
using namespace apx::redis;

TEST_CASE("redis reply reader simple normal cases", "[normal]")
{
	ReplyReader subject;

	SECTION("normal one pass")
	{
		std::string_view str{"+OK\r\n"};
		subject.feed(str.data(), str.size());
		auto[reply, result] = subject.get();
		REQUIRE(result == ReplyReader::Result::ok);
		REQUIRE(reply.as_status() == "OK");
	}
	SECTION("two replies in one pass")
	{
		// See https://redis.io/topics/protocol for detail string format
		std::string_view str{"$3\r\nfoo\r\n$3\r\nbar\r\n"};
		subject.feed(str.data(), str.size());

		auto[reply, result] = subject.get();
		REQUIRE(result == ReplyReader::Result::ok);
		REQUIRE(reply.as_string() == "foo");

		std::tie(reply, result) = subject.get();
		REQUIRE(result == ReplyReader::Result::ok);
		REQUIRE(reply.as_string() == "bar");
	}
	SECTION("one reply in two passes")
	{
		std::string_view str{"$10\r\n0123456789\r\n"};
		REQUIRE(str.size() > 5);

		subject.feed(str.data(),   5);
		auto[reply, result] = subject.get();
		REQUIRE(result == ReplyReader::Result::not_ready);
		REQUIRE(!reply);
		REQUIRE(reply.as_string().empty());

		subject.feed(str.data()+5, str.size()-5);
		std::tie(reply, result) = subject.get();
		REQUIRE(result == ReplyReader::Result::ok);
		REQUIRE(reply.as_string() == "0123456789");

		std::tie(reply, result) = subject.get();
		REQUIRE(result == ReplyReader::Result::not_ready);
		REQUIRE(!reply);
	}
	SECTION("array with nil")
	{
		std::string_view str{"*3\r\n$3\r\nfoo\r\n$-1\r\n:42\r\n"};
		subject.feed(str.data(), str.size());

		auto[reply, result] = subject.get();
		REQUIRE(result == ReplyReader::Result::ok);
		REQUIRE(reply.array_size() == 3);
		REQUIRE(reply[0].as_string() == "foo");
		REQUIRE(reply[1].is_nil());
		REQUIRE(reply[2].as_int() == 42);

		// out of range
		REQUIRE(reply[3].is_nil());

		std::error_code ec;
		auto [first, second, third] = reply.as_tuple<3>(ec);
		REQUIRE(!ec);
		REQUIRE(first.as_string() == "foo");
		REQUIRE(second.is_nil());
		REQUIRE(third.as_int() == 42);
	}
}

TEST_CASE("redis reply reader simple error cases", "[error]")
{
	ReplyReader subject;

	SECTION("empty string")
	{
		subject.feed("", 0);
		auto[reply, result] = subject.get();
		REQUIRE(result == ReplyReader::Result::not_ready);
		REQUIRE(!reply);
		REQUIRE(reply.as_string().empty());
	}
	SECTION("protocol error")
	{
		std::string_view str{"?what\r\n"};
		subject.feed(str.data(), str.size());
		auto[reply, result] = subject.get();
		REQUIRE(result == ReplyReader::Result::error);
	}
	SECTION("error reply")
	{
		std::string_view str{"-WRONGTYPE Operation against a key holding the wrong kind of value\r\n"};
		subject.feed(str.data(), str.size());
		auto[reply, result] = subject.get();
		REQUIRE(result == ReplyReader::Result::ok);
		REQUIRE(reply.is_error());
		REQUIRE(!reply);
		REQUIRE(reply.as_error().substr(0, 9) == "WRONGTYPE");
	}
}

TEST_CASE("not enough fields in array", "[error]")
{
	ReplyReader subject;
	std::string_view str{"*1\r\n$3\r\nfoo\r\n"};
	subject.feed(str.data(), str.size());

	auto[reply, result] = subject.get();
	REQUIRE(result == ReplyReader::Result::ok);

	std::error_code ec;
	auto [first, second] = reply.as_tuple<2>(ec);
	REQUIRE(ec == redis::Error::field_not_found);
	REQUIRE(first.as_string().empty());
	REQUIRE(second.is_nil());
}

TEST_CASE("command string formatting", "[normal]")
{
	std::string key{"asset:550e8400-e29b-41d4-a716-446655440000"};
	CommandString cmd{"HMGET %b storage_path", key.data(), key.size()};

	REQUIRE(cmd.str() ==
		"*3\r\n$5\r\nHMGET\r\n$42\r\nasset:550e8400-e29b-41d4-a716-446655440000\r\n$12\r\nstorage_path\r\n"
	);
	REQUIRE(cmd.length() == cmd.str().size());

	CommandString moved{std::move(cmd)};
	REQUIRE(moved.length() > 0);
	REQUIRE(cmd.length() == 0);
}

TEST_CASE("parse HMGET reply of asset record", "[normal]")
{
	auto id = uuid_to_asset_id("550e8400-e29b-41d4-a716-446655440000");
	REQUIRE(id);

	ReplyReader subject;

	SECTION("all fields present")
	{
		std::string_view str{"*4\r\n$20\r\nuploads/2024/cat.png\r\n$9\r\nimage/png\r\n$7\r\ncat.png\r\n$8\r\nfat-cat!\r\n"};
		subject.feed(str.data(), str.size());
		auto [reply, result] = subject.get();
		REQUIRE(result == ReplyReader::Result::ok);

		std::error_code ec;
		auto record = RedisCatalog::parse(*id, reply, ec);
		REQUIRE(!ec);
		REQUIRE(record);
		REQUIRE(record->id == *id);
		REQUIRE(record->storage_path == "uploads/2024/cat.png");
		REQUIRE(record->mime == "image/png");
		REQUIRE(record->filename == "cat.png");
		REQUIRE(record->slug == "fat-cat!");
	}
	SECTION("slug and storage path missing")
	{
		std::string_view str{"*4\r\n$-1\r\n$15\r\napplication/pdf\r\n$10\r\nreport.pdf\r\n$-1\r\n"};
		subject.feed(str.data(), str.size());
		auto [reply, result] = subject.get();
		REQUIRE(result == ReplyReader::Result::ok);

		std::error_code ec;
		auto record = RedisCatalog::parse(*id, reply, ec);
		REQUIRE(!ec);
		REQUIRE(record);
		REQUIRE(record->storage_path.empty());
		REQUIRE(record->mime == "application/pdf");
		REQUIRE(record->slug.empty());
	}
	SECTION("hash does not exist")
	{
		std::string_view str{"*4\r\n$-1\r\n$-1\r\n$-1\r\n$-1\r\n"};
		subject.feed(str.data(), str.size());
		auto [reply, result] = subject.get();
		REQUIRE(result == ReplyReader::Result::ok);

		std::error_code ec;
		auto record = RedisCatalog::parse(*id, reply, ec);
		REQUIRE(!ec);
		REQUIRE(!record);
	}
	SECTION("wrong type")
	{
		std::string_view str{"-WRONGTYPE Operation against a key holding the wrong kind of value\r\n"};
		subject.feed(str.data(), str.size());
		auto [reply, result] = subject.get();
		REQUIRE(result == ReplyReader::Result::ok);

		std::error_code ec;
		auto record = RedisCatalog::parse(*id, reply, ec);
		REQUIRE(ec == apx::Error::catalog_error);
		REQUIRE(!record);
	}
}
