/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#pragma once

#include "AssetID.hh"

#include <string>

namespace apx {

/// Snapshot of the catalog metadata of an asset. Read-only for the proxy.
struct AssetRecord
{
	AssetID     id{};
	std::string storage_path;   //!< Opaque path into the object store
	std::string mime;
	std::string filename;       //!< Display filename, e.g. "Summer Photo.JPG"
	std::string slug;           //!< Optional. Preferred over filename for the cosmetic name.
};

} // end of namespace
