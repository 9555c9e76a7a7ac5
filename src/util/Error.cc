/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#include "Error.hh"

#include <string>

namespace apx {

const std::error_category& apx_error_category()
{
	struct Cat : std::error_category
	{
		Cat() = default;
		const char *name() const noexcept override { return "asset_proxy"; }

		std::string message(int ev) const override
		{
			switch (static_cast<Error>(ev))
			{
				case Error::ok: return "no error";
				case Error::invalid_token: return "invalid asset token";
				case Error::asset_not_found: return "asset not found";
				case Error::no_storage_path: return "asset has no storage path";
				case Error::upstream_fetch_failed: return "upstream fetch failed";
				case Error::storage_unavailable: return "object store unavailable";
				case Error::transcode_failed: return "transcoding failed";
				case Error::catalog_error: return "catalog error";
				default: return "unknown error " + std::to_string(ev);
			}
		}
	};
	static const Cat cat{};
	return cat;
}

std::error_code make_error_code(Error err)
{
	return std::error_code(static_cast<int>(err), apx_error_category());
}

} // end of namespace
