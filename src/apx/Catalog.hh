/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#pragma once

#include "AssetRecord.hh"

#include <functional>
#include <optional>
#include <system_error>

namespace apx {

/// Read-only access to the asset records.
class Catalog
{
public:
	/// An empty record with no error means the asset does not exist.
	using LookupCompletion = std::function<void(std::optional<AssetRecord>, std::error_code)>;

public:
	virtual ~Catalog() = default;

	virtual void lookup(const AssetID& id, LookupCompletion&& complete) = 0;
};

} // end of namespace
