/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#include "RedisCatalog.hh"

#include "net/Redis.hh"
#include "util/Error.hh"
#include "util/Log.hh"

namespace apx {

RedisCatalog::RedisCatalog(redis::Pool& db, std::string key_prefix) :
	m_db{db},
	m_key_prefix{std::move(key_prefix)}
{
}

std::string RedisCatalog::key(const AssetID& id) const
{
	return m_key_prefix + to_uuid(id);
}

void RedisCatalog::lookup(const AssetID& id, LookupCompletion&& complete)
{
	std::shared_ptr<redis::Connection> conn;
	try
	{
		conn = m_db.alloc();
	}
	catch (boost::system::system_error& e)
	{
		Log(LOG_WARNING, "cannot connect to redis: %1%", e.what());
		return complete(std::nullopt, Error::catalog_error);
	}

	auto key = this->key(id);
	conn->command(
		[id, conn, comp=std::move(complete)](redis::Reply reply, std::error_code ec) mutable
		{
			if (ec)
			{
				Log(LOG_WARNING, "redis error when looking up %1%: %2% (%3%)", id, ec, ec.message());
				return comp(std::nullopt, Error::catalog_error);
			}

			auto record = parse(id, reply, ec);
			comp(std::move(record), ec);
		},
		"HMGET %b storage_path mime_type filename slug",
		key.data(), key.size()
	);
}

std::optional<AssetRecord> RedisCatalog::parse(const AssetID& id, const redis::Reply& reply, std::error_code& ec)
{
	if (reply.is_error())
	{
		Log(LOG_WARNING, "redis HMGET error: %1%", reply.as_error());
		ec = Error::catalog_error;
		return std::nullopt;
	}

	auto [storage_path, mime, filename, slug] = reply.as_tuple<4>(ec);
	if (ec)
	{
		ec = Error::catalog_error;
		return std::nullopt;
	}

	// all fields missing means the hash does not exist
	if (storage_path.is_nil() && mime.is_nil() && filename.is_nil() && slug.is_nil())
		return std::nullopt;

	AssetRecord record;
	record.id           = id;
	record.storage_path = storage_path.as_string();
	record.mime         = mime.as_string();
	record.filename     = filename.as_string();
	record.slug         = slug.as_string();
	return record;
}

} // end of namespace
