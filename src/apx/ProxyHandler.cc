/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#include "ProxyHandler.hh"

#include "CanonicalPath.hh"
#include "Catalog.hh"
#include "MimeType.hh"
#include "ObjectStore.hh"

#include "image/Transcoder.hh"
#include "util/Error.hh"
#include "util/Log.hh"

namespace apx {

ProxyHandler::ProxyHandler(Catalog& catalog, ObjectStore *store, std::string path_prefix) :
	m_catalog{catalog},
	m_store{store},
	m_prefix{std::move(path_prefix)}
{
}

void ProxyHandler::serve(const ProxyTarget& target, Completion&& complete)
{
	if (!target.valid() || target.prefix() != m_prefix || target.name().empty())
		return complete(Outcome{Error::asset_not_found});

	auto id = token_to_asset_id(target.token());
	if (!id)
		return complete(Outcome{Error::invalid_token});

	// Shared by every continuation below, and called at most once.
	auto done = std::make_shared<Completion>(std::move(complete));

	try
	{
		m_catalog.lookup(*id, [this, id=*id, target=ProxyTarget{target}, done](auto&& asset, auto ec) mutable
		{
			if (ec)
				return finish(done, Outcome{ec});

			try
			{
				on_lookup(std::move(target), std::move(asset), done);
			}
			catch (std::exception& e)
			{
				Log(LOG_WARNING, "exception thrown after looking up %1%: %2%", id, e.what());
				finish(done, Outcome{Error::unknown_error});
			}
		});
	}
	catch (std::exception& e)
	{
		Log(LOG_WARNING, "exception thrown when looking up %1%: %2%", *id, e.what());
		finish(done, Outcome{Error::unknown_error});
	}
}

void ProxyHandler::finish(const SharedCompletion& done, Outcome&& out)
{
	if (!*done)
		return;

	auto complete = std::move(*done);
	*done = nullptr;
	complete(std::move(out));
}

void ProxyHandler::on_lookup(ProxyTarget&& target, std::optional<AssetRecord>&& asset, const SharedCompletion& done)
{
	if (!asset)
		return finish(done, Outcome{Error::asset_not_found});
	if (asset->storage_path.empty())
		return finish(done, Outcome{Error::no_storage_path});

	// Redirect to the current name of the asset, keeping the query string.
	auto name = cosmetic_name(*asset);
	if (name && *name != target.name())
	{
		auto location = *canonical_path(m_prefix, *asset);
		if (!target.query().empty())
		{
			location.push_back('?');
			location.append(target.query());
		}

		Outcome out;
		out.location = std::move(location);
		return finish(done, std::move(out));
	}

	if (!m_store)
		return finish(done, Outcome{Error::storage_unavailable});

	auto url = m_store->public_url(asset->storage_path);
	m_store->fetch(url, [
		this,
		target=std::move(target),
		id=asset->id,
		asset=std::move(*asset),
		done
	](std::error_code ec, std::string&& bytes) mutable
	{
		if (ec)
			return finish(done, Outcome{ec});

		try
		{
			on_fetch(std::move(target), std::move(asset), std::move(bytes), done);
		}
		catch (std::exception& e)
		{
			Log(LOG_WARNING, "exception thrown when serving %1%: %2%", id, e.what());
			finish(done, Outcome{Error::unknown_error});
		}
	});
}

void ProxyHandler::on_fetch(ProxyTarget&& target, AssetRecord&& asset, std::string&& bytes, const SharedCompletion& done)
{
	Outcome out;

	auto transform = Transform::parse(target.query());
	if (transform && is_image(asset.mime))
	{
		out.body = transcode(bytes, *transform, out.ec);
		out.mime = transcoded_mime;
	}
	else
	{
		out.body = std::move(bytes);
		out.mime = asset.mime.empty() ? std::string{default_mime} : asset.mime;
	}
	finish(done, std::move(out));
}

http::status ProxyHandler::status_of(std::error_code ec)
{
	if (!ec)
		return http::status::ok;

	if (ec == Error::invalid_token || ec == Error::asset_not_found ||
		ec == Error::no_storage_path || ec == Error::upstream_fetch_failed)
		return http::status::not_found;

	if (ec == Error::storage_unavailable)
		return http::status::service_unavailable;

	return http::status::internal_server_error;
}

http::response<http::string_body> ProxyHandler::error_response(std::error_code ec, unsigned version)
{
	auto status = status_of(ec);

	std::string body;
	switch (status)
	{
		case http::status::not_found:           body = "Not found"; break;
		case http::status::service_unavailable: body = "Service unavailable"; break;
		default:                                body = "Internal server error"; break;
	}

	http::response<http::string_body> res{
		std::piecewise_construct,
		std::make_tuple(std::move(body)),
		std::make_tuple(status, version)
	};
	res.set(http::field::content_type, "text/plain");
	return res;
}

http::response<http::string_body> ProxyHandler::bad_request(boost::string_view why, unsigned version)
{
	http::response<http::string_body> res{
		std::piecewise_construct,
		std::make_tuple(why),
		std::make_tuple(http::status::bad_request, version)
	};
	res.set(http::field::content_type, "text/plain");
	return res;
}

http::response<http::empty_body> ProxyHandler::moved_permanently(boost::string_view where, unsigned version)
{
	http::response<http::empty_body> res{http::status::moved_permanently, version};
	res.set(http::field::location, where);
	return res;
}

} // end of namespace
