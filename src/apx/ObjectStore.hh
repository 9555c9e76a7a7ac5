/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <system_error>

namespace apx {

/// Where the asset bytes live.
class ObjectStore
{
public:
	using FetchCompletion = std::function<void(std::error_code, std::string&&)>;

public:
	virtual ~ObjectStore() = default;

	/// Public URL of the object at \a storage_path.
	virtual std::string public_url(std::string_view storage_path) const = 0;

	/// Download the object. Reports Error::upstream_fetch_failed if the
	/// object store responds with anything other than success.
	virtual void fetch(const std::string& url, FetchCompletion&& complete) = 0;
};

} // end of namespace
