/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#pragma once

#include "Catalog.hh"

#include <string>

namespace apx {
namespace redis {
class Pool;
class Reply;
}

/// Asset records stored as redis hashes. The key of each hash is the
/// key prefix followed by the dashed UUID of the asset.
class RedisCatalog : public Catalog
{
public:
	RedisCatalog(redis::Pool& db, std::string key_prefix);

	void lookup(const AssetID& id, LookupCompletion&& complete) override;

	std::string key(const AssetID& id) const;

	static std::optional<AssetRecord> parse(const AssetID& id, const redis::Reply& reply, std::error_code& ec);

private:
	redis::Pool&    m_db;
	std::string     m_key_prefix;
};

} // end of namespace
