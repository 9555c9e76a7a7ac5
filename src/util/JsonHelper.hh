/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the asset_proxy
    distribution for more details.
*/

#pragma once

#include "Exception.hh"

#include <rapidjson/document.h>

#include <string_view>
#include <string>

namespace apx {
namespace json {

struct Error : virtual Exception {};
struct NotString : virtual Error {};
struct NotNumber : virtual Error {};
using MissingField = boost::error_info<struct tag_missing_field, std::string>;

std::string_view string_view(const rapidjson::Value& value);
std::string string(const rapidjson::Value& value);
const rapidjson::Value& required(const rapidjson::Value& object, std::string_view field);
const rapidjson::Value* optional(const rapidjson::Value& object, std::string_view field);

}} // end of namespace
