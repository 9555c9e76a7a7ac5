/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#pragma once

#include "Exception.hh"

#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/exception/error_info.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/filesystem/path.hpp>

#include <iosfwd>
#include <optional>
#include <string>

namespace apx {

/// Location of the object store that holds the asset bytes.
struct StorageSetting
{
	std::string url;        //!< e.g. "https://project.supabase.co"
	std::string bucket;
};

/// \brief  Parsing command line options and configuration file
class Configuration
{
public:
	struct Error : virtual Exception {};
	struct FileError : virtual Error {};
	struct InvalidValue : virtual Error {};
	using Path      = boost::error_info<struct tag_path,    boost::filesystem::path>;
	using Message   = boost::error_info<struct tag_message, std::string>;
	using Offset    = boost::error_info<struct tag_offset,  std::size_t>;
	using ErrorCode = boost::error_info<struct tag_error_code,  std::error_code>;

public:
	Configuration() = default;
	Configuration(int argc, const char *const *argv, const char *env);

	boost::asio::ip::tcp::endpoint listen_http() const { return m_listen_http;}
	boost::asio::ip::tcp::endpoint redis() const {return m_redis;}

	std::size_t thread_count() const {return m_thread_count;}
	std::size_t fetch_limit() const {return m_fetch_limit;}
	const std::string& path_prefix() const {return m_path_prefix;}
	const std::string& catalog_key_prefix() const {return m_catalog_key_prefix;}

	/// Empty if the object store is not configured. Requests that need
	/// the object store will get 503.
	const std::optional<StorageSetting>& storage() const {return m_storage;}

	bool help() const {return m_args.count("help") > 0;}

	void usage(std::ostream& out) const;

	// for unit tests
	void path_prefix(std::string prefix) {m_path_prefix = std::move(prefix);}
	void storage(std::optional<StorageSetting> storage) {m_storage = std::move(storage);}

private:
	void load_config(const boost::filesystem::path& path);

private:
	boost::program_options::options_description m_desc{"Allowed options"};
	boost::program_options::variables_map       m_args;

	boost::asio::ip::tcp::endpoint m_listen_http;
	boost::asio::ip::tcp::endpoint m_redis{
		boost::asio::ip::make_address("127.0.0.1"),
		6379
	};

	std::size_t m_thread_count{1};
	std::size_t m_fetch_limit{64 * 1024 * 1024};

	std::string m_path_prefix{"a"};
	std::string m_catalog_key_prefix{"asset:"};

	std::optional<StorageSetting> m_storage;
};

} // end of namespace
