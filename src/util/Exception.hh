/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#pragma once

#include <boost/exception/exception.hpp>
#include <boost/exception/error_info.hpp>

#include <system_error>

namespace apx {

struct Exception : virtual boost::exception, virtual std::exception
{
	const char* what() const noexcept override ;
};

struct SystemError : virtual Exception {};
using ErrorCode = boost::error_info<struct tag_error_code, std::error_code>;

} // end of namespace
