/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#include "Configuration.hh"
#include "JsonHelper.hh"

#include "config.hh"

#include <boost/program_options.hpp>
#include <boost/exception/info.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/filesystem.hpp>
#include <boost/throw_exception.hpp>

#include <rapidjson/document.h>
#include <rapidjson/pointer.h>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/error/en.h>

#include <fstream>

namespace po = boost::program_options;
namespace ip = boost::asio::ip;

namespace apx {
namespace {

ip::tcp::endpoint parse_endpoint(const rapidjson::Value& json)
{
	auto&& port = json::required(json, "/port");
	if (!port.IsUint() || port.GetUint() > 65535)
		BOOST_THROW_EXCEPTION(json::NotNumber() << json::MissingField{"/port"});

	return {
		ip::make_address(json::string(json::required(json, "/address"))),
		static_cast<unsigned short>(port.GetUint())
	};
}

} // end of local namespace

Configuration::Configuration(int argc, const char *const *argv, const char *env)
{
	m_desc.add_options()
		("help",      "produce help message")
		("cfg",       po::value<std::string>()->default_value(
			env ? std::string{env} : std::string{apx::constants::config_filename}
		)->value_name("path"), "Configuration file. Use environment variable ASSET_PROXY_CONFIG to set default path.")
	;

	if (argc > 0)
	{
		store(po::parse_command_line(argc, argv, m_desc), m_args);
		po::notify(m_args);
	}

	// no need for other options when --help is specified
	if (!help())
		load_config(
			m_args.count("cfg") > 0 ? m_args["cfg"].as<std::string>() :
			std::string{env ? env : apx::constants::config_filename}
		);
}

void Configuration::usage(std::ostream &out) const
{
	out << m_desc;
}

void Configuration::load_config(const boost::filesystem::path& path)
{
	try
	{
		using namespace rapidjson;
		std::ifstream config_file;
		config_file.open(path.string(), std::ios::in);
		if (!config_file)
		{
			BOOST_THROW_EXCEPTION(FileError()
				<< ErrorCode({errno, std::system_category()})
			);
		}

		IStreamWrapper wrapper{config_file};

		Document json;
		if (json.ParseStream(wrapper).HasParseError())
		{
			BOOST_THROW_EXCEPTION(Error()
				<< Offset{json.GetErrorOffset()}
				<< Message{GetParseError_En(json.GetParseError())}
			);
		}

		m_listen_http   = parse_endpoint(json::required(json, "/http"));
		m_thread_count  = GetValueByPointerWithDefault(json, "/thread_count", m_thread_count).GetUint64();
		m_fetch_limit   = static_cast<std::size_t>(
			GetValueByPointerWithDefault(json, "/fetch_limit_mb", m_fetch_limit/1024.0/1024.0).GetDouble() *
				1024 * 1024
		);

		if (auto prefix = json::optional(json, "/path_prefix"))
			m_path_prefix = json::string(*prefix);
		if (m_path_prefix.empty() || m_path_prefix.find('/') != m_path_prefix.npos)
			BOOST_THROW_EXCEPTION(InvalidValue() << Message{"path_prefix must be a single non-empty path segment"});

		if (auto key_prefix = json::optional(json, "/catalog_key_prefix"))
			m_catalog_key_prefix = json::string(*key_prefix);

		if (auto redis = json::optional(json, "/redis"))
			m_redis = parse_endpoint(*redis);

		if (auto storage = json::optional(json, "/storage"))
		{
			StorageSetting setting{
				json::string(json::required(*storage, "/url")),
				json::string(json::required(*storage, "/bucket"))
			};

			// public_url() appends absolute paths to the base URL
			while (!setting.url.empty() && setting.url.back() == '/')
				setting.url.pop_back();

			m_storage = std::move(setting);
		}
	}
	catch (Exception& e)
	{
		e << Path{path};
		throw;
	}
	catch (std::exception& e)
	{
		throw boost::enable_error_info(e) << Path{path};
	}
}

} // end of namespace
