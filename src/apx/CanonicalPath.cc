/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#include "CanonicalPath.hh"

#include "AssetRecord.hh"
#include "MimeType.hh"

namespace apx {

std::string sanitize_name(std::string_view name)
{
	std::string result;
	result.reserve(name.size());

	bool pending_dash = false;
	for (char ch : name)
	{
		if (ch >= 'A' && ch <= 'Z')
			ch = static_cast<char>(ch - 'A' + 'a');

		if ((ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9'))
		{
			if (pending_dash && !result.empty())
				result.push_back('-');
			result.push_back(ch);
			pending_dash = false;
		}
		else
			pending_dash = true;
	}
	return result;
}

std::optional<std::string> cosmetic_name(const AssetRecord& asset)
{
	std::string_view stem{asset.slug};
	if (stem.empty())
	{
		stem = asset.filename;

		// drop the original extension. The MIME type decides the extension.
		auto dot = stem.find_last_of('.');
		if (dot != stem.npos && dot > 0)
			stem = stem.substr(0, dot);
	}

	auto name = sanitize_name(stem);
	if (name.empty())
		return std::nullopt;

	name.push_back('.');
	name.append(mime_to_extension(asset.mime));
	return name;
}

std::optional<std::string> canonical_path(std::string_view prefix, const AssetRecord& asset)
{
	auto name = cosmetic_name(asset);
	if (!name)
		return std::nullopt;

	std::string path{"/"};
	path.append(prefix);
	path.push_back('/');
	path.append(to_token(asset.id));
	path.push_back('/');
	path.append(*name);
	return path;
}

} // end of namespace
