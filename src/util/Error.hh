/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#pragma once

#include <system_error>

namespace apx {

enum class Error
{
	ok,
	invalid_token,
	asset_not_found,
	no_storage_path,
	upstream_fetch_failed,
	storage_unavailable,
	transcode_failed,
	catalog_error,

	unknown_error
};

const std::error_category& apx_error_category();
std::error_code make_error_code(Error err);

} // end of namespace apx

namespace std
{
	template <> struct is_error_code_enum<apx::Error> : true_type {};
}
